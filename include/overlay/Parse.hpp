/**
 * @file Parse.hpp
 * @brief Text-to-Value parsing for overlay documents
 *
 * Parses the indentation-based document subset used by overlay files:
 * `key: value` mappings, `- item` sequences, nesting by indentation and
 * `#` comment lines. Indentation is the number of leading whitespace
 * characters; a tab counts as one column like a space. Comments are
 * dropped; they are not part of the Value.
 *
 * Scalar parsing order (first match wins):
 * - S1: Null ("null", "~", or empty)
 * - S2: Boolean ("true", "false")
 * - S3: Empty containers ("[]", "{}")
 * - S4: Quoted String ('...' or "...", quotes stripped)
 * - S5: Two-part version ("1.0" - digits.digits stays a string)
 * - S6: Decimal Number (no dot, optional sign and exponent)
 * - S7: Raw String (fallback)
 */

#ifndef OVERLAY_PARSE_HPP
#define OVERLAY_PARSE_HPP

#include "overlay/Value.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace overlay {

/**
 * @brief Why a document could not be parsed
 */
struct Diagnostic {
    /// 1-based line number, 0 when the problem is not tied to a line
    std::size_t line = 0;

    /// Description of the problem
    std::string message;

    /**
     * @brief Format as "line N: message"
     */
    std::string to_string() const;
};

/**
 * @brief Result of parse_document()
 *
 * Holds either the parsed value together with the raw input, or a
 * diagnostic. On failure `value` is null and `raw` is empty.
 */
struct ParseOutcome {
    Value value;
    std::string raw;
    std::optional<Diagnostic> diagnostic;

    bool ok() const noexcept {
        return !diagnostic.has_value();
    }
};

/**
 * @brief Parse a single scalar token
 *
 * Never throws. A token that opens a quote without closing it with the
 * same character is a raw string, quote included.
 *
 * @param token Text after a `key:` or a `- ` marker
 * @return Parsed Value
 *
 * Examples:
 * ```cpp
 * parse_scalar("~")         // → null
 * parse_scalar("true")      // → true
 * parse_scalar("[]")        // → [] (empty sequence)
 * parse_scalar("'a: b'")    // → "a: b"
 * parse_scalar("1.0")       // → "1.0" (version-like, kept as string)
 * parse_scalar("1.2.3")     // → "1.2.3" (contains a dot, so not a number)
 * parse_scalar("'tis")      // → "'tis" (unmatched quote, raw string)
 * parse_scalar("42")        // → 42
 * parse_scalar("-1e3")      // → -1000.0
 * parse_scalar("hello")     // → "hello"
 * ```
 */
Value parse_scalar(const std::string& token);

/**
 * @brief Parse document text into a Value
 *
 * Never throws. Empty or comment-only text yields an empty mapping.
 * A document made only of `- item` lines yields a sequence, anything
 * else a mapping.
 *
 * @param text Document text
 * @return ParseOutcome with the value, or a diagnostic on failure
 *
 * Example:
 * ```cpp
 * auto outcome = parse_document("agent:\n  name: test\nitems:\n  - a\n");
 * // outcome.value == {"agent": {"name": "test"}, "items": ["a"]}
 * ```
 */
ParseOutcome parse_document(const std::string& text);

} // namespace overlay

#endif // OVERLAY_PARSE_HPP
