/**
 * @file Validate.hpp
 * @brief Syntactic validation of overlay documents
 */

#ifndef OVERLAY_VALIDATE_HPP
#define OVERLAY_VALIDATE_HPP

#include <string>
#include <vector>

namespace overlay {

/**
 * @brief Result of validate_document()
 */
struct ValidationReport {
    bool valid = true;
    std::vector<std::string> errors;
};

/**
 * @brief Check that text parses into a structurally sound value tree
 *
 * Empty text, and data that is not text at all, are reported valid:
 * there is nothing for the parser to reject. Merge-specific rules are
 * not checked here.
 *
 * Example:
 * ```cpp
 * validate_document("name: test\nversion: 1.0").valid;   // true
 * validate_document("name test").errors;
 * // ["line 1: expected 'key: value', got: name test"]
 * ```
 */
ValidationReport validate_document(const std::string& text);

} // namespace overlay

#endif // OVERLAY_VALIDATE_HPP
