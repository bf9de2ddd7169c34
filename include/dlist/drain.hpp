#ifndef DLIST_DRAIN_HPP
#define DLIST_DRAIN_HPP

#include <cstddef>
#include <iterator>
#include <optional>
#include <utility>

namespace dlist {

// Destructive, single-pass traversal of a list. Every step removes the
// head-side element and hands it out; running to completion leaves the
// list empty. Stopping early leaves the remaining elements in place.
template<typename List>
class Drain {
public:
    using value_type = typename List::value_type;

    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = typename List::value_type;
        using difference_type = std::ptrdiff_t;
        using pointer = value_type*;
        using reference = value_type&;

        Iterator() = default;
        explicit Iterator(List* list) : list_(list), current_(list->pop_front()) {}

        reference operator*() noexcept { return *current_; }
        pointer operator->() noexcept { return &*current_; }

        Iterator& operator++() {
            current_ = list_->pop_front();
            return *this;
        }

        void operator++(int) { ++*this; }

        friend bool operator==(const Iterator& it, std::default_sentinel_t) noexcept {
            return !it.current_.has_value();
        }

    private:
        List* list_{nullptr};
        std::optional<value_type> current_;
    };

    explicit Drain(List& list) noexcept : list_(&list) {}

    // next value, or nullopt once the list is exhausted
    std::optional<value_type> next() { return list_->pop_front(); }

    // Starting iteration takes the first element.
    Iterator begin() { return Iterator(list_); }
    std::default_sentinel_t end() const noexcept { return std::default_sentinel; }

    [[nodiscard]] std::size_t remaining() const noexcept { return list_->size(); }

private:
    List* list_;
};

} // namespace dlist

#endif // DLIST_DRAIN_HPP
