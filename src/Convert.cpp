#include "overlay/Convert.hpp"
#include <toml++/toml.hpp>
#include <cstdint>
#include <limits>
#include <sstream>
#include <utility>

namespace overlay {

namespace {

    toml::table to_table(const Value& mapping);
    toml::array to_array(const Value& sequence);

    // Hands the TOML form of v to put(). Tables and arrays insert the
    // same way, so one function serves both.
    template <typename Put>
    void put_toml(const Value& v, Put&& put) {
        switch (v.type()) {
            case Value::value_t::object:
                put(to_table(v));
                break;
            case Value::value_t::array:
                put(to_array(v));
                break;
            case Value::value_t::string:
                put(v.get<std::string>());
                break;
            case Value::value_t::boolean:
                put(v.get<bool>());
                break;
            case Value::value_t::number_unsigned: {
                // TOML integers are signed 64-bit
                const auto u = v.get<std::uint64_t>();
                if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                    put(static_cast<double>(u));
                } else {
                    put(static_cast<std::int64_t>(u));
                }
                break;
            }
            case Value::value_t::number_integer:
                put(v.get<std::int64_t>());
                break;
            case Value::value_t::number_float:
                put(v.get<double>());
                break;
            default:
                // TOML has no null
                put(std::string{});
                break;
        }
    }

    toml::table to_table(const Value& mapping) {
        toml::table tbl;
        for (auto it = mapping.begin(); it != mapping.end(); ++it) {
            const std::string& key = it.key();
            put_toml(it.value(), [&](auto&& node) { tbl.insert(key, std::forward<decltype(node)>(node)); });
        }
        return tbl;
    }

    toml::array to_array(const Value& sequence) {
        toml::array arr;
        for (const auto& item : sequence) {
            put_toml(item, [&](auto&& node) { arr.push_back(std::forward<decltype(node)>(node)); });
        }
        return arr;
    }

} // namespace

std::string to_json_string(const Value& value, int indent) {
    return value.dump(indent);
}

std::string to_toml_string(const Value& value) {
    toml::table root;
    if (value.is_object()) {
        root = to_table(value);
    } else {
        put_toml(value, [&](auto&& node) { root.insert("value", std::forward<decltype(node)>(node)); });
    }
    std::ostringstream oss;
    oss << root;
    return oss.str();
}

} // namespace overlay
