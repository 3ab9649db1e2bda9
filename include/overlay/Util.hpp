#ifndef OVERLAY_UTIL_HPP
#define OVERLAY_UTIL_HPP

#include <string>

namespace overlay {

// Check that raw bytes are text: valid UTF-8 with no NUL bytes.
// On failure, *reason (if given) says what was found and where.
bool is_text(const std::string& data, std::string* reason = nullptr);

// Helpers
std::string to_lower(std::string s);
std::string trim(const std::string& s);

} // namespace overlay

#endif // OVERLAY_UTIL_HPP
