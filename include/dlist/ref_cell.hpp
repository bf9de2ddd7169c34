#ifndef DLIST_REF_CELL_HPP
#define DLIST_REF_CELL_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include "common.hpp"
#include "logging.hpp"

namespace dlist {

// Raised when a cell is borrowed against the exclusivity rules. This is a
// contract violation by the caller, not an expected runtime condition.
class BorrowError : public std::logic_error {
public:
    explicit BorrowError(const std::string& what) : std::logic_error(what) {}
};

// Borrow state of one cell: 0 = free, n > 0 = n shared borrows, -1 = exclusive.
class BorrowFlag {
public:
    [[nodiscard]] bool try_acquire_shared() noexcept {
        if (state_ < 0) return false;
        ++state_;
        return true;
    }

    void release_shared() noexcept { --state_; }

    [[nodiscard]] bool try_acquire_exclusive() noexcept {
        if (state_ != 0) return false;
        state_ = -1;
        return true;
    }

    void release_exclusive() noexcept { state_ = 0; }

    [[nodiscard]] bool is_free() const noexcept { return state_ == 0; }
    [[nodiscard]] bool is_exclusive() const noexcept { return state_ < 0; }
    [[nodiscard]] std::ptrdiff_t shared_count() const noexcept { return state_ > 0 ? state_ : 0; }

private:
    std::ptrdiff_t state_{0};
};

template<typename T>
class RefCell;

template<typename T>
class RefMut;

// Shared borrow guard. Copying it adds another shared borrow.
template<typename T>
class Ref {
public:
    Ref(const Ref& other) noexcept : flag_(other.flag_), value_(other.value_) {
        if (flag_) static_cast<void>(flag_->try_acquire_shared()); // a live Ref means the flag is shared
    }

    Ref& operator=(const Ref& other) noexcept {
        if (this != &other) {
            Ref copy(other);
            swap(copy);
        }
        return *this;
    }

    Ref(Ref&& other) noexcept
        : flag_(std::exchange(other.flag_, nullptr)), value_(std::exchange(other.value_, nullptr)) {}

    Ref& operator=(Ref&& other) noexcept {
        if (this != &other) {
            release();
            flag_ = std::exchange(other.flag_, nullptr);
            value_ = std::exchange(other.value_, nullptr);
        }
        return *this;
    }

    ~Ref() { release(); }

    [[nodiscard]] const T& operator*() const noexcept { return *value_; }
    [[nodiscard]] const T* operator->() const noexcept { return value_; }
    [[nodiscard]] const T* get() const noexcept { return value_; }

    // Narrow the guard to a part of the borrowed value; the borrow moves along.
    template<typename F>
    [[nodiscard]] static auto map(Ref ref, F&& f) {
        using U = std::remove_cvref_t<decltype(f(*ref.value_))>;
        const U* projected = &f(*ref.value_);
        return Ref<U>(std::exchange(ref.flag_, nullptr), projected);
    }

    void swap(Ref& other) noexcept {
        std::swap(flag_, other.flag_);
        std::swap(value_, other.value_);
    }

private:
    // adopts a shared borrow already taken on flag
    Ref(BorrowFlag* flag, const T* value) noexcept : flag_(flag), value_(value) {}

    void release() noexcept {
        if (flag_) flag_->release_shared();
        flag_ = nullptr;
        value_ = nullptr;
    }

    BorrowFlag* flag_;
    const T* value_;

    template<typename> friend class Ref;
    template<typename> friend class RefCell;
};

// Exclusive borrow guard; move-only.
template<typename T>
class RefMut {
public:
    RefMut(const RefMut&) = delete;
    RefMut& operator=(const RefMut&) = delete;

    RefMut(RefMut&& other) noexcept
        : flag_(std::exchange(other.flag_, nullptr)), value_(std::exchange(other.value_, nullptr)) {}

    RefMut& operator=(RefMut&& other) noexcept {
        if (this != &other) {
            release();
            flag_ = std::exchange(other.flag_, nullptr);
            value_ = std::exchange(other.value_, nullptr);
        }
        return *this;
    }

    ~RefMut() { release(); }

    [[nodiscard]] T& operator*() const noexcept { return *value_; }
    [[nodiscard]] T* operator->() const noexcept { return value_; }
    [[nodiscard]] T* get() const noexcept { return value_; }

    template<typename F>
    [[nodiscard]] static auto map(RefMut ref, F&& f) {
        using U = std::remove_reference_t<decltype(f(*ref.value_))>;
        U* projected = &f(*ref.value_);
        return RefMut<U>(std::exchange(ref.flag_, nullptr), projected);
    }

private:
    RefMut(BorrowFlag* flag, T* value) noexcept : flag_(flag), value_(value) {}

    void release() noexcept {
        if (flag_) flag_->release_exclusive();
        flag_ = nullptr;
        value_ = nullptr;
    }

    BorrowFlag* flag_;
    T* value_;

    template<typename> friend class RefMut;
    template<typename> friend class RefCell;
};

// A value whose shared/exclusive access is tracked at runtime.
// Guards must not outlive the cell.
template<typename T>
class RefCell {
public:
    template<typename... Args>
    explicit RefCell(Args&&... args) : value_(std::forward<Args>(args)...) {}

    RefCell(const RefCell&) = delete;
    RefCell& operator=(const RefCell&) = delete;

    [[nodiscard]] Result<Ref<T>> try_borrow() const {
        if (!flag_.try_acquire_shared()) {
            return std::unexpected(std::make_error_code(std::errc::device_or_resource_busy));
        }
        return Ref<T>(&flag_, &value_);
    }

    [[nodiscard]] Result<RefMut<T>> try_borrow_mut() {
        if (!flag_.try_acquire_exclusive()) {
            return std::unexpected(std::make_error_code(std::errc::device_or_resource_busy));
        }
        return RefMut<T>(&flag_, &value_);
    }

    [[nodiscard]] Ref<T> borrow() const {
        auto result = try_borrow();
        if (!result) {
            log_message("borrow of a cell that is mutably borrowed");
            throw BorrowError("already mutably borrowed");
        }
        return std::move(*result);
    }

    [[nodiscard]] RefMut<T> borrow_mut() {
        auto result = try_borrow_mut();
        if (!result) {
            log_message("mutable borrow of a cell that is already borrowed ({} shared)", flag_.shared_count());
            throw BorrowError("already borrowed");
        }
        return std::move(*result);
    }

    // Unchecked access; the caller must hold the only handle to the cell.
    [[nodiscard]] T& get_mut() noexcept { return value_; }

    [[nodiscard]] T into_inner() && {
        if (!flag_.is_free()) {
            log_message("into_inner on a cell that is still borrowed");
            throw BorrowError("cell is still borrowed");
        }
        return std::move(value_);
    }

    [[nodiscard]] bool is_borrowed() const noexcept { return !flag_.is_free(); }

private:
    T value_;
    mutable BorrowFlag flag_;
};

} // namespace dlist

#endif // DLIST_REF_CELL_HPP
