/**
 * @file Loader.hpp
 * @brief File loading utilities
 *
 * Loads documents from:
 * - Overlay document files (.yaml, .yml) using parse_document()
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 */

#ifndef OVERLAY_LOADER_HPP
#define OVERLAY_LOADER_HPP

#include "overlay/Value.hpp"

#include <string>

namespace overlay {

/**
 * @brief Read a whole file into a string (bytes unchanged)
 * @throws FileNotFoundError if the file cannot be opened
 */
std::string read_text_file(const std::string& path);

/**
 * @brief Write text to a file, replacing its contents
 * @throws std::runtime_error if the file cannot be opened for writing
 */
void write_text_file(const std::string& path, const std::string& text);

/**
 * @brief Check if a regular file exists at path
 */
bool file_exists(const std::string& path);

/**
 * @brief Get file extension (lowercase)
 *
 * @return Extension including the dot (e.g., ".yaml"), or empty if none
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Load a document file, detecting its format by extension
 *
 * - .json → nlohmann::json
 * - .toml → toml++ (dates and times become strings)
 * - anything else → overlay document syntax
 *
 * @param path Path to the document
 * @return Parsed Value
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if the file has syntax errors
 */
Value load_document_file(const std::string& path);

} // namespace overlay

#endif // OVERLAY_LOADER_HPP
