#ifndef KCOLL_HPP
#define KCOLL_HPP

#include "kcoll_fault.hpp"
#include "kcoll_support.hpp"
#include "kcoll_array_seq.hpp"
#include "kcoll_deque.hpp"
#include "kcoll_heap.hpp"
#include "kcoll_hash_map.hpp"
#include "kcoll_tree_map.hpp"
#include "kcoll_scope.hpp"

#endif // KCOLL_HPP
