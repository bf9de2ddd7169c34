#ifndef DLIST_DLIST_HPP
#define DLIST_DLIST_HPP

#include "common.hpp"
#include "logging.hpp"
#include "display.hpp"
#include "drain.hpp"
#include "ref_cell.hpp"
#include "linked_list.hpp"
#include "shared_linked_list.hpp"
#include "arena_linked_list.hpp"
#include "list_builder.hpp"

#endif // DLIST_DLIST_HPP
