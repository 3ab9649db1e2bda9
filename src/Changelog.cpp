/**
 * @file Changelog.cpp
 * @brief Implementation of MergeChangelog
 */

#include "overlay/Changelog.hpp"

#include <utility>

namespace overlay {

void MergeChangelog::record_added(std::string section, Value items) {
    records_.emplace_back(AddedRecord{std::move(section), std::move(items)});
}

void MergeChangelog::record_deduplicated(std::string section, std::size_t count) {
    if (count == 0) return;
    records_.emplace_back(DeduplicatedRecord{std::move(section), count});
}

void MergeChangelog::record_preserved(std::string path) {
    records_.emplace_back(PreservedRecord{std::move(path)});
}

void MergeChangelog::record_merged(std::string section, std::vector<std::string> keys) {
    records_.emplace_back(MergedRecord{std::move(section), std::move(keys)});
}

void MergeChangelog::record_error(std::string error) {
    errors_.push_back(std::move(error));
}

std::vector<AddedRecord> MergeChangelog::added() const {
    return collect<AddedRecord>();
}

std::vector<DeduplicatedRecord> MergeChangelog::deduplicated() const {
    return collect<DeduplicatedRecord>();
}

std::vector<PreservedRecord> MergeChangelog::preserved() const {
    return collect<PreservedRecord>();
}

std::vector<MergedRecord> MergeChangelog::merged() const {
    return collect<MergedRecord>();
}

Value MergeChangelog::to_summary() const {
    Value summary = {
        {"added", Value::array()},
        {"deduplicated", Value::array()},
        {"preserved", Value::array()},
        {"merged", Value::array()}
    };

    for (const auto& record : records_) {
        if (const auto* added = std::get_if<AddedRecord>(&record)) {
            summary["added"].push_back(Value{{"section", added->section}, {"items", added->items}});
        } else if (const auto* deduped = std::get_if<DeduplicatedRecord>(&record)) {
            summary["deduplicated"].push_back(Value{{"section", deduped->section}, {"count", deduped->count}});
        } else if (const auto* preserved = std::get_if<PreservedRecord>(&record)) {
            summary["preserved"].push_back(preserved->path);
        } else if (const auto* merged = std::get_if<MergedRecord>(&record)) {
            summary["merged"].push_back(Value{{"section", merged->section}, {"keys", merged->keys}});
        }
    }

    return summary;
}

} // namespace overlay
