#ifndef DLIST_DISPLAY_HPP
#define DLIST_DISPLAY_HPP

#include <ostream>
#include <sstream>
#include <string>

#include <fmt/ostream.h>

namespace dlist {

// [v1, v2, ..., vn] from head to tail, [] when empty
template<typename List>
std::ostream& write_list(std::ostream& os, const List& list) {
    os << '[';
    bool first = true;
    list.for_each([&](const auto& value) {
        if (!first) os << ", ";
        os << value;
        first = false;
    });
    return os << ']';
}

template<typename List>
std::string to_string(const List& list) {
    std::ostringstream oss;
    write_list(oss, list);
    return oss.str();
}

template<typename T, typename Allocator>
class LinkedList;

template<typename T>
class SharedLinkedList;

template<typename T>
class ArenaLinkedList;

} // namespace dlist

// lets lists go straight into log_message / fmt::format
namespace fmt {

template<typename T, typename Allocator>
struct formatter<dlist::LinkedList<T, Allocator>> : ostream_formatter {};

template<typename T>
struct formatter<dlist::SharedLinkedList<T>> : ostream_formatter {};

template<typename T>
struct formatter<dlist::ArenaLinkedList<T>> : ostream_formatter {};

} // namespace fmt

#endif // DLIST_DISPLAY_HPP
