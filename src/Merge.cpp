/**
 * @file Merge.cpp
 * @brief Implementation of structural merge
 */

#include "overlay/Merge.hpp"
#include "overlay/DotPath.hpp"
#include "overlay/Equal.hpp"
#include "overlay/Errors.hpp"

#include <algorithm>

namespace overlay {

namespace {

    struct MergeContext {
        MergeChangelog* changelog = nullptr;
        std::vector<std::string>* warnings = nullptr;
    };

    void require_mapping(const Value& value, const char* which) {
        if (!value.is_object()) {
            throw ValidationError(std::string("cannot merge: ") + which +
                                  " root is a " + type_name(value) + ", expected a mapping");
        }
    }

    Value merge_at(const Value& existing, const Value& update,
                   const std::string& prefix, MergeContext& ctx) {
        Value result = existing;

        for (auto it = update.begin(); it != update.end(); ++it) {
            const auto& key = it.key();
            const auto& update_value = it.value();
            const std::string path = child_path(prefix, key);

            auto found = result.find(key);
            if (found == result.end()) {
                // M1: new key
                result[key] = update_value;
                if (ctx.changelog != nullptr && is_container(update_value)) {
                    ctx.changelog->record_added(
                        path, update_value.is_array() ? update_value : Value());
                }
                continue;
            }

            Value& existing_value = *found;

            if (existing_value.is_object() && update_value.is_object()) {
                // M3: recursive merge
                existing_value = merge_at(existing_value, update_value, path, ctx);
                if (ctx.changelog != nullptr) {
                    std::vector<std::string> keys;
                    for (auto k = update_value.begin(); k != update_value.end(); ++k) {
                        keys.push_back(k.key());
                    }
                    ctx.changelog->record_merged(path, std::move(keys));
                }
            } else if (existing_value.is_array() && update_value.is_array()) {
                // M4: sequence union
                auto dedupe = deduplicate_sequences(existing_value, update_value);
                existing_value = std::move(dedupe.merged);
                if (ctx.changelog != nullptr) {
                    ctx.changelog->record_deduplicated(path, dedupe.deduped_count);
                }
            } else if (!deep_equal(existing_value, update_value)) {
                // M5: update wins
                if (ctx.warnings != nullptr &&
                    existing_value.type() != update_value.type() &&
                    (is_container(existing_value) || is_container(update_value))) {
                    ctx.warnings->push_back("'" + path + "': " + type_name(existing_value) +
                                            " replaced by " + type_name(update_value) +
                                            " from update");
                }
                existing_value = update_value;
            }
        }

        // M2: keys the update leaves alone
        if (ctx.changelog != nullptr) {
            for (auto it = existing.begin(); it != existing.end(); ++it) {
                if (!update.contains(it.key())) {
                    ctx.changelog->record_preserved(child_path(prefix, it.key()));
                }
            }
        }

        return result;
    }

} // anonymous namespace

DedupeResult deduplicate_sequences(const Value& existing, const Value& update) {
    DedupeResult out;
    if (existing.is_array()) {
        out.merged = existing;
    }
    if (!update.is_array()) {
        return out;
    }

    for (const auto& item : update) {
        const bool duplicate = std::any_of(
            out.merged.begin(), out.merged.end(),
            [&item](const Value& placed) { return deep_equal(placed, item); });
        if (duplicate) {
            ++out.deduped_count;
        } else {
            out.merged.push_back(item);
        }
    }

    return out;
}

Value merge_mappings(const Value& existing, const Value& update) {
    require_mapping(existing, "existing");
    require_mapping(update, "update");
    MergeContext ctx;
    return merge_at(existing, update, "", ctx);
}

Value merge_mappings(const Value& existing, const Value& update,
                     MergeChangelog& changelog,
                     std::vector<std::string>* warnings) {
    require_mapping(existing, "existing");
    require_mapping(update, "update");
    MergeContext ctx{&changelog, warnings};
    return merge_at(existing, update, "", ctx);
}

} // namespace overlay
