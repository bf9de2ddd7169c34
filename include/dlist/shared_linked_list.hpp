#ifndef DLIST_SHARED_LINKED_LIST_HPP
#define DLIST_SHARED_LINKED_LIST_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <utility>

#include "display.hpp"
#include "drain.hpp"
#include "logging.hpp"
#include "ref_cell.hpp"

namespace dlist {

// Doubly-linked list with reference-counted nodes.
//
// head -> tail is the owning direction: head_, tail_ and every node's next
// hold a strong reference. prev is weak and has to be upgraded before use.
// Node contents sit in a RefCell, so overlapping mutable access to one node
// raises BorrowError instead of corrupting it. Guards handed out by the peek
// and nth functions must be released before the list is modified or destroyed.
template<typename T>
class SharedLinkedList {
private:
    struct Node;
    using Link = std::shared_ptr<RefCell<Node>>;
    using WeakLink = std::weak_ptr<RefCell<Node>>;

    struct Node {
        explicit Node(T value) : data(std::move(value)) {}

        T data;
        WeakLink prev; // toward the head, non-owning
        Link next;     // toward the tail, owning
    };

public:
    using value_type = T;
    using size_type = std::size_t;

    SharedLinkedList() = default;
    ~SharedLinkedList() { release(); }

    SharedLinkedList(const SharedLinkedList&) = delete;
    SharedLinkedList& operator=(const SharedLinkedList&) = delete;

    SharedLinkedList(SharedLinkedList&& other) noexcept
        : head_(std::move(other.head_)),
          tail_(std::move(other.tail_)),
          size_(std::exchange(other.size_, 0)) {}

    SharedLinkedList& operator=(SharedLinkedList&& other) noexcept {
        if (this != &other) {
            release();
            head_ = std::move(other.head_);
            tail_ = std::move(other.tail_);
            size_ = std::exchange(other.size_, 0);
        }
        return *this;
    }

    void push_front(T value) {
        Link node = std::make_shared<RefCell<Node>>(std::move(value));
        if (!head_) {
            head_ = node;
            tail_ = std::move(node);
            ++size_;
            return;
        }

        auto old_head = head_->borrow_mut(); // throws before anything is relinked
        old_head->prev = node;
        node->get_mut().next = std::move(head_);
        head_ = std::move(node);
        ++size_;
    }

    void push_back(T value) {
        Link node = std::make_shared<RefCell<Node>>(std::move(value));
        if (!tail_) {
            head_ = node;
            tail_ = std::move(node);
            ++size_;
            return;
        }

        auto old_tail = tail_->borrow_mut();
        node->get_mut().prev = tail_;
        old_tail->next = node;
        tail_ = std::move(node);
        ++size_;
    }

    std::optional<T> pop_front() {
        if (!head_) return std::nullopt;

        Link old = head_;
        std::optional<T> value;
        {
            // take every borrow first so a conflict leaves the list untouched
            auto old_node = old->borrow_mut();
            std::optional<RefMut<Node>> new_head;
            if (old_node->next) new_head.emplace(old_node->next->borrow_mut());
            value.emplace(std::move(old_node->data)); // may throw; nothing is relinked yet

            // a single node is held by both terminals; drop the other one first
            if (size_ == 1) tail_.reset();

            head_ = std::move(old_node->next);
            if (new_head) (*new_head)->prev.reset();
            --size_;
        }
        check_unshared(std::move(old));
        return value;
    }

    std::optional<T> pop_back() {
        if (!tail_) return std::nullopt;

        Link old = tail_;
        std::optional<T> value;
        {
            auto old_node = old->borrow_mut();
            Link prev = old_node->prev.lock(); // upgrade may come back empty
            std::optional<RefMut<Node>> new_tail;
            if (prev) new_tail.emplace(prev->borrow_mut());
            value.emplace(std::move(old_node->data));

            if (size_ == 1) head_.reset();

            old_node->prev.reset();
            if (new_tail) {
                (*new_tail)->next.reset(); // releases the previous node's strong hold on old
                new_tail.reset();
                tail_ = std::move(prev);
            } else {
                if (size_ > 1) log_message("tail's prev link could not be upgraded, size {}", size_);
                tail_.reset();
            }
            --size_;
        }
        check_unshared(std::move(old));
        return value;
    }

    [[nodiscard]] std::optional<Ref<T>> peek_front() const { return data_of(head_); }
    [[nodiscard]] std::optional<Ref<T>> peek_back() const { return data_of(tail_); }
    [[nodiscard]] std::optional<RefMut<T>> peek_front_mut() { return data_mut_of(head_); }
    [[nodiscard]] std::optional<RefMut<T>> peek_back_mut() { return data_mut_of(tail_); }

    [[nodiscard]] std::optional<Ref<T>> nth(size_type index) const { return data_of(node_at(index)); }
    [[nodiscard]] std::optional<RefMut<T>> nth_mut(size_type index) { return data_mut_of(node_at(index)); }

    [[nodiscard]] size_type size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    // Throws BorrowError, leaving the list unchanged, while any node is borrowed.
    void clear() {
        size_type position = 0;
        for (RefCell<Node>* node = head_.get(); node; node = node->get_mut().next.get(), ++position) {
            if (node->is_borrowed()) {
                log_message("clear while node {} is borrowed", position);
                throw BorrowError("clear while a node is borrowed");
            }
        }
        release();
    }

    [[nodiscard]] Drain<SharedLinkedList> drain() noexcept { return Drain<SharedLinkedList>(*this); }

    template<typename F>
    void for_each(F&& f) const {
        Link node = head_;
        while (node) {
            auto guard = node->borrow();
            f(guard->data);
            Link next = guard->next;
            node = std::move(next);
        }
    }

    template<typename F>
    void for_each_reverse(F&& f) const {
        Link node = tail_;
        while (node) {
            auto guard = node->borrow();
            f(guard->data);
            Link prev = guard->prev.lock();
            node = std::move(prev);
        }
    }

    [[nodiscard]] bool valid() const {
        if ((size_ == 0) != (head_ == nullptr) || (head_ == nullptr) != (tail_ == nullptr)) {
            log_message("terminal/size mismatch: size {}", size_);
            return false;
        }
        if (size_ == 1 && head_ != tail_) {
            log_message("single node list with two different terminals");
            return false;
        }

        size_type forward = 0;
        Link last;
        for (Link node = head_; node; ) {
            auto guard = node->borrow();
            if (guard->prev.lock() != last) {
                log_message("broken prev link at position {}", forward);
                return false;
            }
            if (++forward > size_) {
                log_message("forward walk exceeds size {}", size_);
                return false;
            }
            last = node;
            Link next = guard->next;
            node = std::move(next);
        }
        if (forward != size_ || last != tail_) {
            log_message("forward walk visited {} nodes, size is {}", forward, size_);
            return false;
        }

        size_type backward = 0;
        for_each_reverse([&](const T&) { ++backward; });
        if (backward != size_) {
            log_message("backward walk visited {} nodes, size is {}", backward, size_);
            return false;
        }
        return true;
    }

    friend std::ostream& operator<<(std::ostream& os, const SharedLinkedList& list) {
        return write_list(os, list);
    }

private:
    // Unlinks iteratively; letting the strong chain destroy itself would recurse once per node.
    void release() noexcept {
        tail_.reset();
        Link node = std::move(head_);
        while (node) {
            Link next = std::move(node->get_mut().next);
            node = std::move(next);
        }
        size_ = 0;
    }

    // old is fully unlinked; it must now be the only strong reference
    static void check_unshared(Link old) {
        if (old.use_count() != 1) {
            log_message("removed node is still shared ({} owners)", old.use_count());
            throw BorrowError("removed node is still shared");
        }
    }

    static std::optional<Ref<T>> data_of(const Link& node) {
        if (!node) return std::nullopt;
        return Ref<Node>::map(node->borrow(), [](const Node& n) -> const T& { return n.data; });
    }

    static std::optional<RefMut<T>> data_mut_of(const Link& node) {
        if (!node) return std::nullopt;
        return RefMut<Node>::map(node->borrow_mut(), [](Node& n) -> T& { return n.data; });
    }

    // closer terminal first; a failed upgrade on the way back reads as absent
    Link node_at(size_type index) const {
        if (index >= size_) return nullptr;

        Link node;
        if (index < size_ / 2) {
            node = head_;
            for (size_type i = 0; i < index && node; ++i) {
                Link next = node->borrow()->next;
                node = std::move(next);
            }
        } else {
            node = tail_;
            for (size_type i = 0; i < size_ - index - 1 && node; ++i) {
                Link prev = node->borrow()->prev.lock();
                node = std::move(prev);
            }
        }
        return node;
    }

    Link head_;
    Link tail_;
    size_type size_{0};
};

} // namespace dlist

#endif // DLIST_SHARED_LINKED_LIST_HPP
