#ifndef DLIST_LIST_BUILDER_HPP
#define DLIST_LIST_BUILDER_HPP

#include <cstddef>
#include <initializer_list>

#include "common.hpp"

namespace dlist {

// Builders over push_front only. Each element goes in at the head, so the
// resulting head-to-tail order is the reverse of the argument order:
// make_list<L>({0, 1, 2}) renders as [2, 1, 0].

template<DoubleEndedList List>
List make_list() {
    return List{};
}

template<DoubleEndedList List>
List make_list(std::initializer_list<typename List::value_type> values) {
    List list;
    for (const auto& value : values) {
        list.push_front(value);
    }
    return list;
}

// value repeated count times
template<DoubleEndedList List>
List make_list(const typename List::value_type& value, std::size_t count) {
    List list;
    for (std::size_t i = 0; i < count; ++i) {
        list.push_front(value);
    }
    return list;
}

} // namespace dlist

#endif // DLIST_LIST_BUILDER_HPP
