#ifndef DLIST_COMMON_HPP
#define DLIST_COMMON_HPP

#include <concepts>
#include <cstddef>
#include <expected>
#include <optional>
#include <system_error>
#include <utility>

namespace dlist {

// "no slot" marker for index-linked nodes
inline constexpr std::size_t NIL = static_cast<std::size_t>(-1);

constexpr std::size_t DEFAULT_ARENA_CAPACITY = 16;
constexpr std::size_t DEFAULT_DEMO_COUNT = 100;
constexpr int DEFAULT_DEMO_VALUE = 10;

// recoverable failures, same shape as the server's Result<void>
template<typename T>
using Result = std::expected<T, std::error_code>;

template<typename L>
concept DoubleEndedList = requires(L& list, const L& clist, typename L::value_type value) {
    list.push_front(std::move(value));
    list.push_back(std::move(value));
    { list.pop_front() } -> std::same_as<std::optional<typename L::value_type>>;
    { list.pop_back() } -> std::same_as<std::optional<typename L::value_type>>;
    { clist.size() } -> std::convertible_to<std::size_t>;
    { clist.empty() } -> std::convertible_to<bool>;
};

} // namespace dlist

#endif // DLIST_COMMON_HPP
