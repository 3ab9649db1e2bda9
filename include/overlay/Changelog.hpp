/**
 * @file Changelog.hpp
 * @brief Record of what a merge changed
 *
 * Sections are dot-paths from the document root, e.g. "agent.skills".
 */

#ifndef OVERLAY_CHANGELOG_HPP
#define OVERLAY_CHANGELOG_HPP

#include "overlay/Value.hpp"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace overlay {

/**
 * @brief A container key that did not exist before the merge
 */
struct AddedRecord {
    std::string section;
    /// The added sequence, or null when a mapping was added
    Value items;
};

/**
 * @brief Update items dropped because the sequence already held them
 */
struct DeduplicatedRecord {
    std::string section;
    std::size_t count = 0;
};

/**
 * @brief An existing key the update did not touch
 */
struct PreservedRecord {
    std::string path;
};

/**
 * @brief A mapping merged recursively with the update's mapping
 */
struct MergedRecord {
    std::string section;
    /// Keys of the update mapping, ascending
    std::vector<std::string> keys;
};

using ChangeRecord = std::variant<AddedRecord, DeduplicatedRecord, PreservedRecord, MergedRecord>;

/**
 * @brief Ordered change records and errors for one merge call
 *
 * Records are kept in traversal order. The structural merger appends to
 * the changelog while it runs; MergeResult only hands out const access.
 */
class MergeChangelog {
public:
    void record_added(std::string section, Value items);

    /// No record is kept for a count of zero
    void record_deduplicated(std::string section, std::size_t count);

    void record_preserved(std::string path);
    void record_merged(std::string section, std::vector<std::string> keys);
    void record_error(std::string error);

    const std::vector<ChangeRecord>& records() const noexcept { return records_; }
    const std::vector<std::string>& errors() const noexcept { return errors_; }

    std::vector<AddedRecord> added() const;
    std::vector<DeduplicatedRecord> deduplicated() const;
    std::vector<PreservedRecord> preserved() const;
    std::vector<MergedRecord> merged() const;

    bool empty() const noexcept { return records_.empty() && errors_.empty(); }

    /**
     * @brief Summarize as a Value
     *
     * Shape:
     * ```
     * {"added":        [{"section": "...", "items": [...] | null}],
     *  "deduplicated": [{"section": "...", "count": N}],
     *  "preserved":    ["path", ...],
     *  "merged":       [{"section": "...", "keys": ["...", ...]}]}
     * ```
     */
    Value to_summary() const;

private:
    std::vector<ChangeRecord> records_;
    std::vector<std::string> errors_;

    template <typename Record>
    std::vector<Record> collect() const {
        std::vector<Record> out;
        for (const auto& record : records_) {
            if (const auto* r = std::get_if<Record>(&record)) {
                out.push_back(*r);
            }
        }
        return out;
    }
};

} // namespace overlay

#endif // OVERLAY_CHANGELOG_HPP
