/**
 * @file Loader.cpp
 * @brief File loading implementation
 */

#include "overlay/Loader.hpp"
#include "overlay/Errors.hpp"
#include "overlay/Parse.hpp"
#include "overlay/Util.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace fs = std::filesystem;

namespace overlay {

namespace {

/**
 * @brief Convert a parsed TOML node to a Value
 *
 * Dates and times have no Value kind; they are kept as their TOML text.
 */
Value from_toml(const toml::node& node) {
    return node.visit([](auto&& n) -> Value {
        using node_t = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<node_t, toml::table>) {
            Value mapping = Value::object();
            for (const auto& [key, child] : n) {
                mapping[std::string(key.str())] = from_toml(child);
            }
            return mapping;
        } else if constexpr (std::is_same_v<node_t, toml::array>) {
            Value sequence = Value::array();
            for (const auto& child : n) {
                sequence.push_back(from_toml(child));
            }
            return sequence;
        } else if constexpr (std::is_same_v<node_t, toml::value<toml::date>> ||
                             std::is_same_v<node_t, toml::value<toml::time>> ||
                             std::is_same_v<node_t, toml::value<toml::date_time>>) {
            std::ostringstream text;
            text << *n;
            return text.str();
        } else {
            return Value(*n);
        }
    });
}

} // anonymous namespace

std::string read_text_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

void write_text_file(const std::string& path, const std::string& text) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Failed to open for write: " + path);
    }
    file << text;
    if (!file) {
        throw std::runtime_error("Failed to write: " + path);
    }
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string get_file_extension(const std::string& path) {
    const std::string ext = fs::path(path).extension().string();
    return to_lower(ext);
}

Value load_document_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);

    if (ext == ".json") {
        try {
            return nlohmann::json::parse(read_text_file(path));
        } catch (const nlohmann::json::parse_error& e) {
            throw ParseError(path, 0, e.what());
        }
    }

    if (ext == ".toml") {
        try {
            toml::table tbl = toml::parse_file(path);
            return from_toml(tbl);
        } catch (const toml::parse_error& e) {
            throw ParseError(path, e.source().begin.line, std::string(e.description()));
        }
    }

    const ParseOutcome outcome = parse_document(read_text_file(path));
    if (!outcome.ok()) {
        throw ParseError(path, outcome.diagnostic->line, outcome.diagnostic->message);
    }
    return outcome.value;
}

} // namespace overlay
