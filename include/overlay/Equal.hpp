/**
 * @file Equal.hpp
 * @brief Structural deep equality for Values
 */

#ifndef OVERLAY_EQUAL_HPP
#define OVERLAY_EQUAL_HPP

#include "overlay/Value.hpp"

namespace overlay {

/**
 * @brief Compare two Values structurally
 *
 * - Kinds must match (all numbers share one kind: 1 equals 1.0)
 * - Scalars compare by value
 * - Sequences: same length and element-wise equal, order matters
 * - Mappings: same key set and every shared key's values equal
 *
 * Examples:
 * ```cpp
 * deep_equal(Value{1, 2}, Value{1, 2});   // true
 * deep_equal(Value{1, 2}, Value{2, 1});   // false
 * deep_equal(Value{{"a", 1}}, Value{{"a", 1}, {"b", 2}});  // false
 * ```
 */
bool deep_equal(const Value& a, const Value& b);

} // namespace overlay

#endif // OVERLAY_EQUAL_HPP
