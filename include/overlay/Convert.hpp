#ifndef OVERLAY_CONVERT_HPP
#define OVERLAY_CONVERT_HPP

#include "overlay/Value.hpp"
#include <string>

namespace overlay {

// Pretty-printed JSON text.
std::string to_json_string(const Value& value, int indent = 2);

// TOML text. TOML needs a table at the root, so a non-mapping root is
// wrapped under "value". TOML has no null: nulls are written as "".
std::string to_toml_string(const Value& value);

} // namespace overlay

#endif // OVERLAY_CONVERT_HPP
