/**
 * @file Serialize.hpp
 * @brief Value-to-text serialization for overlay documents
 *
 * Output rules:
 * - Mapping keys are written in ascending order, whatever order the
 *   source document used
 * - Each nesting level indents by two spaces
 * - Lines are joined with '\n'; there is no trailing newline
 * - Strings are bare unless they contain ':', '#' or '"', or would read
 *   back as another kind of value; then they are double-quoted
 * - Floating numbers never contain a dot: whole values are written as
 *   integers, others as digits with an exponent (1.5 → 15e-1)
 * - A sequence item that is a one-key mapping is written as a lone `-`
 *   with the mapping indented below it
 */

#ifndef OVERLAY_SERIALIZE_HPP
#define OVERLAY_SERIALIZE_HPP

#include "overlay/Value.hpp"

#include <string>

namespace overlay {

/**
 * @brief Serialize a scalar as it appears after `key: ` or `- `
 *
 * @throws SerializationError for non-finite numbers, strings with line
 *         breaks, and containers
 *
 * Examples:
 * ```cpp
 * serialize_scalar(nullptr);        // null
 * serialize_scalar(42);             // 42
 * serialize_scalar("plain");        // plain
 * serialize_scalar("a: b");         // "a: b"
 * serialize_scalar("say \"hi\"");   // "say \"hi\""
 * serialize_scalar("true");         // "true" (quoted, the bare form is a bool)
 * ```
 */
std::string serialize_scalar(const Value& value);

/**
 * @brief Serialize a Value to document text
 *
 * @param value Value to serialize (normally a mapping)
 * @param indent_level Nesting level of the first line (two spaces each)
 * @return Document text; an empty mapping yields ""
 * @throws SerializationError if some part of the value has no text form
 *
 * Example:
 * ```cpp
 * Value doc = {{"items", {"a", "b"}}, {"agent", {{"name", "pm"}}}};
 * serialize_document(doc);
 * // agent:
 * //   name: pm
 * // items:
 * //   - a
 * //   - b
 * ```
 */
std::string serialize_document(const Value& value, int indent_level = 0);

} // namespace overlay

#endif // OVERLAY_SERIALIZE_HPP
