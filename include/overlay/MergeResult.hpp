/**
 * @file MergeResult.hpp
 * @brief Merge entry point and its result object
 *
 * merge_documents() is the single call an installer or updater makes:
 * it parses both texts, merges them structurally and hands back a
 * MergeResult. Every failure is reported on the result; nothing throws.
 *
 * Example:
 * ```cpp
 * auto result = merge_documents(existing_text, overlay_text);
 * if (result.success()) {
 *     write_text_file(path, result.to_text() + "\n");
 * } else {
 *     for (const auto& e : result.errors()) std::cerr << e << "\n";
 * }
 * ```
 */

#ifndef OVERLAY_MERGERESULT_HPP
#define OVERLAY_MERGERESULT_HPP

#include "overlay/Value.hpp"
#include "overlay/Changelog.hpp"

#include <string>
#include <vector>

namespace overlay {

class MergeResult;

/**
 * @brief Merge an overlay document onto an existing one
 *
 * Steps:
 * 1. Reject input that is not text (InputTypeError)
 * 2. Parse both documents; a parse failure stops here
 * 3. Merge the two roots with merge_mappings(), recording a changelog
 * 4. Validate the merged data
 *
 * @param existing Current document text ("" when the file is new)
 * @param update Overlay document text
 * @return Populated MergeResult; check success() before using data()
 */
MergeResult merge_documents(const std::string& existing, const std::string& update);

/**
 * @brief Outcome of merge_documents()
 *
 * Starts successful with an empty mapping, is filled in once by
 * merge_documents(), and is read-only after that. to_text() may still
 * append an error and clear success(), but never changes data().
 */
class MergeResult {
public:
    MergeResult() = default;

    bool success() const noexcept { return success_; }
    const Value& data() const noexcept { return data_; }
    const std::vector<std::string>& errors() const noexcept { return errors_; }
    const std::vector<std::string>& warnings() const noexcept { return warnings_; }
    const MergeChangelog& changelog() const noexcept { return changelog_; }

    /**
     * @brief Serialize the merged data
     *
     * A SerializationError is caught: the message is appended to
     * errors(), success() becomes false and "" is returned.
     */
    std::string to_text();

    /**
     * @brief Structural checks on the merged data
     *
     * @return Error messages; empty when the data is a mapping that
     *         serializes cleanly. Calling it leaves the result unchanged.
     */
    std::vector<std::string> validate() const;

private:
    friend MergeResult merge_documents(const std::string& existing, const std::string& update);

    bool success_ = true;
    Value data_ = Value::object();
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;
    MergeChangelog changelog_;

    void fail(std::string error);
};

} // namespace overlay

#endif // OVERLAY_MERGERESULT_HPP
