/**
 * @file Merge.hpp
 * @brief Structural merge of overlay documents
 *
 * Merging rules (existing document first, update second):
 * - M1: Key only in update: added
 * - M2: Key only in existing: kept unchanged
 * - M3: Both mappings: merged recursively
 * - M4: Both sequences: union without duplicates, existing items first
 * - M5: Anything else: update wins unless the values are already equal
 *
 * Neither input is modified; the result is a new tree.
 */

#ifndef OVERLAY_MERGE_HPP
#define OVERLAY_MERGE_HPP

#include "overlay/Value.hpp"
#include "overlay/Changelog.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace overlay {

/**
 * @brief Result of deduplicate_sequences()
 */
struct DedupeResult {
    /// Existing items, then the update items not already present
    Value merged = Value::array();

    /// Number of update items dropped as duplicates
    std::size_t deduped_count = 0;
};

/**
 * @brief Union two sequences, dropping update items already present
 *
 * Items compare with deep_equal(). A non-sequence argument is treated
 * as an empty sequence.
 *
 * Example:
 * ```cpp
 * Value existing = {{{"id", 1}}};
 * Value update = {{{"id", 1}}, {{"id", 2}}};
 * auto r = deduplicate_sequences(existing, update);
 * // r.merged == [{"id": 1}, {"id": 2}], r.deduped_count == 1
 * ```
 */
DedupeResult deduplicate_sequences(const Value& existing, const Value& update);

/**
 * @brief Merge two mappings (rules M1-M5), without a changelog
 *
 * @throws ValidationError if either argument is not a mapping
 *
 * Examples:
 * ```cpp
 * merge_mappings({{"a", 1}}, {{"a", 2}});                     // {"a": 2}
 * merge_mappings({{"a", {{"x", 1}}}}, {{"a", {{"y", 2}}}});  // {"a": {"x": 1, "y": 2}}
 * ```
 */
Value merge_mappings(const Value& existing, const Value& update);

/**
 * @brief Merge two mappings (rules M1-M5), recording changes
 *
 * Records Added for new container keys, Merged for recursive merges,
 * Deduplicated when sequence items were dropped and Preserved for
 * existing keys the update does not mention. Scalar additions and
 * replacements are not recorded.
 *
 * @param existing Current document root
 * @param update Overlay document root
 * @param changelog Receives the change records
 * @param warnings If given, receives a message whenever a replacement
 *                 changes the kind of a container value
 * @throws ValidationError if either argument is not a mapping
 */
Value merge_mappings(const Value& existing, const Value& update,
                     MergeChangelog& changelog,
                     std::vector<std::string>* warnings = nullptr);

} // namespace overlay

#endif // OVERLAY_MERGE_HPP
