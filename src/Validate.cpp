/**
 * @file Validate.cpp
 * @brief Implementation of document validation
 */

#include "overlay/Validate.hpp"
#include "overlay/Parse.hpp"
#include "overlay/Util.hpp"

namespace overlay {

ValidationReport validate_document(const std::string& text) {
    ValidationReport report;
    if (text.empty() || !is_text(text)) {
        return report;
    }

    const ParseOutcome outcome = parse_document(text);
    if (!outcome.ok()) {
        report.valid = false;
        report.errors.push_back(outcome.diagnostic->to_string());
    }
    return report;
}

} // namespace overlay
