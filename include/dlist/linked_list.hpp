#ifndef DLIST_LINKED_LIST_HPP
#define DLIST_LINKED_LIST_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <utility>

#include "display.hpp"
#include "drain.hpp"
#include "logging.hpp"

namespace dlist {

// Doubly-linked list with manually owned nodes. Every node is one allocation
// made through Allocator; prev/next are raw, non-owning pointers and the list
// alone decides when a node is freed.
template<typename T, typename Allocator = std::allocator<T>>
class LinkedList {
private:
    struct Node {
        template<typename... Args>
        explicit Node(Args&&... args) : data(std::forward<Args>(args)...) {}

        T data;
        Node* prev{nullptr}; // toward the head
        Node* next{nullptr}; // toward the tail
    };

    using NodeAllocator = typename std::allocator_traits<Allocator>::template rebind_alloc<Node>;
    using NodeTraits = std::allocator_traits<NodeAllocator>;

public:
    using value_type = T;
    using size_type = std::size_t;
    using allocator_type = Allocator;

    LinkedList() = default;
    explicit LinkedList(const Allocator& alloc) : alloc_(alloc) {}

    ~LinkedList() { clear(); }

    LinkedList(const LinkedList&) = delete;
    LinkedList& operator=(const LinkedList&) = delete;

    LinkedList(LinkedList&& other) noexcept
        : head_(std::exchange(other.head_, nullptr)),
          tail_(std::exchange(other.tail_, nullptr)),
          size_(std::exchange(other.size_, 0)),
          alloc_(std::move(other.alloc_)) {}

    LinkedList& operator=(LinkedList&& other) noexcept {
        if (this != &other) {
            clear();
            head_ = std::exchange(other.head_, nullptr);
            tail_ = std::exchange(other.tail_, nullptr);
            size_ = std::exchange(other.size_, 0);
            alloc_ = std::move(other.alloc_);
        }
        return *this;
    }

    void push_front(T value) {
        Node* node = create_node(std::move(value)); // nothing is linked until this succeeds
        node->next = head_;
        if (head_) {
            head_->prev = node;
        } else {
            tail_ = node;
        }
        head_ = node;
        ++size_;
    }

    void push_back(T value) {
        Node* node = create_node(std::move(value));
        node->prev = tail_;
        if (tail_) {
            tail_->next = node;
        } else {
            head_ = node;
        }
        tail_ = node;
        ++size_;
    }

    template<typename... Args>
    T& emplace_front(Args&&... args) {
        push_front(T(std::forward<Args>(args)...));
        return head_->data;
    }

    template<typename... Args>
    T& emplace_back(Args&&... args) {
        push_back(T(std::forward<Args>(args)...));
        return tail_->data;
    }

    std::optional<T> pop_front() {
        if (!head_) return std::nullopt;

        Node* old = head_;
        std::optional<T> value(std::move(old->data)); // may throw; nothing is unlinked yet
        head_ = old->next;
        if (head_) {
            head_->prev = nullptr; // the new head no longer points at the removed node
        } else {
            tail_ = nullptr;
        }
        --size_;
        destroy_node(old);
        return value;
    }

    std::optional<T> pop_back() {
        if (!tail_) return std::nullopt;

        Node* old = tail_;
        std::optional<T> value(std::move(old->data));
        tail_ = old->prev;
        if (tail_) {
            tail_->next = nullptr;
        } else {
            head_ = nullptr;
        }
        --size_;
        destroy_node(old);
        return value;
    }

    [[nodiscard]] T* peek_front() noexcept { return head_ ? &head_->data : nullptr; }
    [[nodiscard]] const T* peek_front() const noexcept { return head_ ? &head_->data : nullptr; }
    [[nodiscard]] T* peek_back() noexcept { return tail_ ? &tail_->data : nullptr; }
    [[nodiscard]] const T* peek_back() const noexcept { return tail_ ? &tail_->data : nullptr; }

    [[nodiscard]] T* peek_front_mut() noexcept { return peek_front(); }
    [[nodiscard]] T* peek_back_mut() noexcept { return peek_back(); }

    // value at index counted from the head, or nullptr when out of range
    [[nodiscard]] T* nth(size_type index) noexcept {
        Node* node = node_at(index);
        return node ? &node->data : nullptr;
    }

    [[nodiscard]] const T* nth(size_type index) const noexcept {
        const Node* node = node_at(index);
        return node ? &node->data : nullptr;
    }

    [[nodiscard]] size_type size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    void clear() noexcept {
        Node* node = head_;
        while (node) {
            Node* next = node->next;
            destroy_node(node);
            node = next;
        }
        head_ = nullptr;
        tail_ = nullptr;
        size_ = 0;
    }

    // Consuming traversal from the head; see Drain.
    [[nodiscard]] Drain<LinkedList> drain() noexcept { return Drain<LinkedList>(*this); }

    template<typename F>
    void for_each(F&& f) const {
        for (const Node* node = head_; node; node = node->next) {
            f(node->data);
        }
    }

    template<typename F>
    void for_each_reverse(F&& f) const {
        for (const Node* node = tail_; node; node = node->prev) {
            f(node->data);
        }
    }

    // Walks both directions and checks counts, terminals and link symmetry.
    [[nodiscard]] bool valid() const {
        if ((size_ == 0) != (head_ == nullptr) || (head_ == nullptr) != (tail_ == nullptr)) {
            log_message("terminal/size mismatch: size {}", size_);
            return false;
        }
        if (head_ && (head_->prev || tail_->next)) {
            log_message("terminal has an outward link");
            return false;
        }

        size_type forward = 0;
        const Node* last = nullptr;
        for (const Node* node = head_; node; last = node, node = node->next) {
            if (node->prev != last) {
                log_message("broken prev link at position {}", forward);
                return false;
            }
            if (++forward > size_) {
                log_message("forward walk exceeds size {}", size_);
                return false;
            }
        }
        if (forward != size_ || last != tail_) {
            log_message("forward walk visited {} nodes, size is {}", forward, size_);
            return false;
        }

        size_type backward = 0;
        for (const Node* node = tail_; node && backward <= size_; node = node->prev) {
            ++backward;
        }
        if (backward != size_) {
            log_message("backward walk visited {} nodes, size is {}", backward, size_);
            return false;
        }
        return true;
    }

    [[nodiscard]] allocator_type get_allocator() const { return allocator_type(alloc_); }

    friend std::ostream& operator<<(std::ostream& os, const LinkedList& list) {
        return write_list(os, list);
    }

private:
    template<typename... Args>
    Node* create_node(Args&&... args) {
        Node* node = NodeTraits::allocate(alloc_, 1);
        try {
            NodeTraits::construct(alloc_, node, std::forward<Args>(args)...);
        } catch (...) {
            NodeTraits::deallocate(alloc_, node, 1);
            throw;
        }
        return node;
    }

    void destroy_node(Node* node) noexcept {
        NodeTraits::destroy(alloc_, node);
        NodeTraits::deallocate(alloc_, node, 1);
    }

    // walk from whichever terminal is closer to index
    Node* node_at(size_type index) const noexcept {
        if (index >= size_) return nullptr;

        Node* node;
        if (index < size_ / 2) {
            node = head_;
            for (size_type i = 0; i < index; ++i) node = node->next;
        } else {
            node = tail_;
            for (size_type i = 0; i < size_ - index - 1; ++i) node = node->prev;
        }
        return node;
    }

    Node* head_{nullptr};
    Node* tail_{nullptr};
    size_type size_{0};
    [[no_unique_address]] NodeAllocator alloc_;
};

} // namespace dlist

#endif // DLIST_LINKED_LIST_HPP
