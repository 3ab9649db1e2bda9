/**
 * @file MergeResult.cpp
 * @brief Implementation of merge_documents and MergeResult
 */

#include "overlay/MergeResult.hpp"
#include "overlay/Errors.hpp"
#include "overlay/Merge.hpp"
#include "overlay/Parse.hpp"
#include "overlay/Serialize.hpp"
#include "overlay/Util.hpp"

#include <utility>

namespace overlay {

void MergeResult::fail(std::string error) {
    errors_.push_back(std::move(error));
    success_ = false;
}

std::string MergeResult::to_text() {
    try {
        return serialize_document(data_);
    } catch (const SerializationError& e) {
        fail(std::string("Serialization error: ") + e.what());
        return "";
    }
}

std::vector<std::string> MergeResult::validate() const {
    std::vector<std::string> errors;

    if (!data_.is_object()) {
        errors.push_back("Merged data is not a mapping");
    }

    try {
        (void)serialize_document(data_);
    } catch (const SerializationError& e) {
        errors.push_back(std::string("Invalid output: ") + e.what());
    }

    return errors;
}

MergeResult merge_documents(const std::string& existing, const std::string& update) {
    MergeResult result;

    // Reject binary input before parsing
    const std::pair<const char*, const std::string*> inputs[] = {
        {"existing", &existing},
        {"update", &update}
    };
    for (const auto& [name, text] : inputs) {
        std::string reason;
        if (!is_text(*text, &reason)) {
            result.fail(InputTypeError(name, reason).what());
            return result;
        }
    }

    const ParseOutcome existing_parsed = parse_document(existing);
    if (!existing_parsed.ok()) {
        result.fail("Existing document parse error: " + existing_parsed.diagnostic->to_string());
        return result;
    }

    const ParseOutcome update_parsed = parse_document(update);
    if (!update_parsed.ok()) {
        result.fail("Update document parse error: " + update_parsed.diagnostic->to_string());
        return result;
    }

    const Value existing_root = existing_parsed.value.is_null() ? Value::object() : existing_parsed.value;
    const Value update_root = update_parsed.value.is_null() ? Value::object() : update_parsed.value;

    try {
        result.data_ = merge_mappings(existing_root, update_root, result.changelog_, &result.warnings_);
    } catch (const ValidationError& e) {
        result.changelog_.record_error(e.what());
        result.fail(std::string("Merge error: ") + e.what());
        return result;
    }

    for (auto& error : result.validate()) {
        result.changelog_.record_error(error);
        result.fail(std::move(error));
    }

    return result;
}

} // namespace overlay
