/**
 * @file DotPath.hpp
 * @brief Dot-notation paths into documents
 *
 * Paths like "agent.name" or "memories.0.id" name a node in a document.
 * The merge changelog reports sections with them and the CLI `get`
 * command resolves them.
 */

#ifndef OVERLAY_DOTPATH_HPP
#define OVERLAY_DOTPATH_HPP

#include "overlay/Value.hpp"
#include "overlay/Errors.hpp"

#include <string>
#include <vector>

namespace overlay {

/**
 * @brief Split a dot-path into segments
 *
 * Examples:
 * - "agent.name" → ["agent", "name"]
 * - "memories.0.id" → ["memories", "0", "id"]
 * - "" → []
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Join path segments with dots
 *
 * Examples:
 * - ["a", "b", "c"] → "a.b.c"
 * - [] → ""
 */
std::string join_dot_path(const std::vector<std::string>& segments);

/**
 * @brief Extend a dot-path by one key
 *
 * child_path("", "agent") → "agent", child_path("agent", "name") → "agent.name"
 */
std::string child_path(const std::string& parent, const std::string& key);

/**
 * @brief Get value from a document using a dot-path
 *
 * Numeric segments index into sequences.
 *
 * @param data Document root
 * @param path Dot-separated path; empty returns the root
 * @return Pointer to the value at path
 * @throws KeyError if any segment is not found
 * @throws TypeError if traversal hits a scalar before the final segment
 *
 * Example:
 * ```cpp
 * Value doc = {{"agent", {{"name", "pm"}}}, {"items", {"a", "b"}}};
 * get_by_dot(doc, "agent.name");   // → "pm"
 * get_by_dot(doc, "items.1");      // → "b"
 * get_by_dot(doc, "agent.role");   // throws KeyError
 * get_by_dot(doc, "agent.name.x"); // throws TypeError
 * ```
 */
const Value* get_by_dot(const Value& data, const std::string& path);

/**
 * @brief Check if a dot-path exists in a document
 *
 * @return true if path fully resolves, false if any segment is missing
 * @throws TypeError if traversal hits a scalar before the final segment
 */
bool contains_dot(const Value& data, const std::string& path);

} // namespace overlay

#endif // OVERLAY_DOTPATH_HPP
