/*
 * The core imports for kinetic. Include this first so the export macros, forward declarations and
 * formatting support are always available in the same order.
 */

#ifndef KINETIC_BASE_H
#define KINETIC_BASE_H

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <kinetic/kinetic_export.h>
#include <kinetic/kinetic_forward_declarations.h>
#include <kinetic/util/date_time.h>

#include <ankerl/unordered_dense.h>

namespace kinetic {
    // Vector backed containers used for the graph's hot sets and tables, iteration follows insertion order
    // until an element is erased (the last element is swapped into its slot).
    template<typename K>
    using dense_set = ankerl::unordered_dense::set<K>;

    template<typename K, typename V>
    using dense_map = ankerl::unordered_dense::map<K, V>;
} // namespace kinetic

#endif //KINETIC_BASE_H
