#ifndef DLIST_ARENA_LINKED_LIST_HPP
#define DLIST_ARENA_LINKED_LIST_HPP

#include <cstddef>
#include <optional>
#include <ostream>
#include <utility>
#include <vector>

#include "common.hpp"
#include "display.hpp"
#include "drain.hpp"
#include "logging.hpp"

namespace dlist {

// Doubly-linked list whose nodes live in one growable slot table.
// Relations are slot indices (NIL for none) instead of addresses, so a removed
// node can't be reached through a stale link: its slot is emptied and recycled.
// Pointers returned by peek/nth stay valid until the next insertion or clear().
template<typename T>
class ArenaLinkedList {
private:
    struct Slot {
        std::optional<T> data; // empty = free slot
        std::size_t prev{NIL};
        std::size_t next{NIL};
    };

public:
    using value_type = T;
    using size_type = std::size_t;

    ArenaLinkedList() { slots_.reserve(DEFAULT_ARENA_CAPACITY); }

    explicit ArenaLinkedList(size_type capacity) {
        slots_.reserve(capacity);
        free_.reserve(capacity);
    }

    ArenaLinkedList(const ArenaLinkedList&) = delete;
    ArenaLinkedList& operator=(const ArenaLinkedList&) = delete;

    ArenaLinkedList(ArenaLinkedList&& other) noexcept
        : slots_(std::move(other.slots_)),
          free_(std::move(other.free_)),
          head_(std::exchange(other.head_, NIL)),
          tail_(std::exchange(other.tail_, NIL)),
          size_(std::exchange(other.size_, 0)) {}

    ArenaLinkedList& operator=(ArenaLinkedList&& other) noexcept {
        if (this != &other) {
            slots_ = std::move(other.slots_);
            free_ = std::move(other.free_);
            head_ = std::exchange(other.head_, NIL);
            tail_ = std::exchange(other.tail_, NIL);
            size_ = std::exchange(other.size_, 0);
        }
        return *this;
    }

    void push_front(T value) {
        auto const i = claim(std::move(value));
        auto& s = slots_[i];
        s.next = head_;
        if (head_ != NIL) {
            slots_[head_].prev = i;
        } else {
            tail_ = i;
        }
        head_ = i;
        ++size_;
    }

    void push_back(T value) {
        auto const i = claim(std::move(value));
        auto& s = slots_[i];
        s.prev = tail_;
        if (tail_ != NIL) {
            slots_[tail_].next = i;
        } else {
            head_ = i;
        }
        tail_ = i;
        ++size_;
    }

    std::optional<T> pop_front() {
        if (head_ == NIL) return std::nullopt;
        return erase(head_);
    }

    std::optional<T> pop_back() {
        if (tail_ == NIL) return std::nullopt;
        return erase(tail_);
    }

    [[nodiscard]] T* peek_front() noexcept { return data_at(head_); }
    [[nodiscard]] const T* peek_front() const noexcept { return data_at(head_); }
    [[nodiscard]] T* peek_back() noexcept { return data_at(tail_); }
    [[nodiscard]] const T* peek_back() const noexcept { return data_at(tail_); }

    [[nodiscard]] T* peek_front_mut() noexcept { return peek_front(); }
    [[nodiscard]] T* peek_back_mut() noexcept { return peek_back(); }

    [[nodiscard]] T* nth(size_type index) noexcept { return data_at(slot_at(index)); }
    [[nodiscard]] const T* nth(size_type index) const noexcept { return data_at(slot_at(index)); }

    [[nodiscard]] size_type size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    // number of slots in the table, occupied or free
    [[nodiscard]] size_type slot_count() const noexcept { return slots_.size(); }

    void clear() noexcept {
        slots_.clear();
        free_.clear();
        head_ = NIL;
        tail_ = NIL;
        size_ = 0;
    }

    [[nodiscard]] Drain<ArenaLinkedList> drain() noexcept { return Drain<ArenaLinkedList>(*this); }

    template<typename F>
    void for_each(F&& f) const {
        for (auto i = head_; i != NIL; i = slots_[i].next) {
            f(*slots_[i].data);
        }
    }

    template<typename F>
    void for_each_reverse(F&& f) const {
        for (auto i = tail_; i != NIL; i = slots_[i].prev) {
            f(*slots_[i].data);
        }
    }

    [[nodiscard]] bool valid() const {
        if ((size_ == 0) != (head_ == NIL) || (head_ == NIL) != (tail_ == NIL)) {
            log_message("terminal/size mismatch: size {}", size_);
            return false;
        }
        if (size_ + free_.size() != slots_.size()) {
            log_message("{} live + {} free slots, table has {}", size_, free_.size(), slots_.size());
            return false;
        }

        size_type forward = 0;
        auto last = NIL;
        for (auto i = head_; i != NIL; last = i, i = slots_[i].next) {
            if (i >= slots_.size() || !slots_[i].data || slots_[i].prev != last) {
                log_message("broken link at position {} (slot {})", forward, i);
                return false;
            }
            if (++forward > size_) {
                log_message("forward walk exceeds size {}", size_);
                return false;
            }
        }
        if (forward != size_ || last != tail_) {
            log_message("forward walk visited {} slots, size is {}", forward, size_);
            return false;
        }

        size_type backward = 0;
        for (auto i = tail_; i != NIL && backward <= size_; i = slots_[i].prev) {
            ++backward;
        }
        if (backward != size_) {
            log_message("backward walk visited {} slots, size is {}", backward, size_);
            return false;
        }
        return true;
    }

    friend std::ostream& operator<<(std::ostream& os, const ArenaLinkedList& list) {
        return write_list(os, list);
    }

private:
    // take a free slot, or grow the table
    size_type claim(T&& value) {
        if (free_.empty()) {
            // room for every slot on the free list, so erase never allocates
            if (free_.capacity() < slots_.size() + 1) free_.reserve(2 * (slots_.size() + 1));
            slots_.push_back(Slot{std::optional<T>(std::move(value)), NIL, NIL});
            return slots_.size() - 1;
        }

        auto const i = free_.back();
        slots_[i].data.emplace(std::move(value));
        slots_[i].prev = NIL;
        slots_[i].next = NIL;
        free_.pop_back();
        return i;
    }

    // unlink slot i, clear both neighbours' links to it and recycle it
    std::optional<T> erase(size_type const i) {
        auto& s = slots_[i];
        std::optional<T> value(std::move(s.data)); // may throw; links are still intact
        auto const prev = s.prev;
        auto const next = s.next;

        if (prev != NIL) {
            slots_[prev].next = next;
        } else {
            head_ = next;
        }

        if (next != NIL) {
            slots_[next].prev = prev;
        } else {
            tail_ = prev;
        }

        s.data.reset();
        s.prev = NIL;
        s.next = NIL;
        free_.push_back(i);
        --size_;
        return value;
    }

    T* data_at(size_type const i) noexcept { return i == NIL ? nullptr : &*slots_[i].data; }
    const T* data_at(size_type const i) const noexcept { return i == NIL ? nullptr : &*slots_[i].data; }

    size_type slot_at(size_type index) const noexcept {
        if (index >= size_) return NIL;

        size_type i;
        if (index < size_ / 2) {
            i = head_;
            for (size_type k = 0; k < index; ++k) i = slots_[i].next;
        } else {
            i = tail_;
            for (size_type k = 0; k < size_ - index - 1; ++k) i = slots_[i].prev;
        }
        return i;
    }

    std::vector<Slot> slots_;
    std::vector<size_type> free_;
    size_type head_{NIL};
    size_type tail_{NIL};
    size_type size_{0};
};

} // namespace dlist

#endif // DLIST_ARENA_LINKED_LIST_HPP
