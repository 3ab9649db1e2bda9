/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path utilities
 */

#include "overlay/DotPath.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace overlay {

std::vector<std::string> split_dot_path(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

std::string join_dot_path(const std::vector<std::string>& segments) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) oss << '.';
        oss << segments[i];
    }
    return oss.str();
}

std::string child_path(const std::string& parent, const std::string& key) {
    if (parent.empty()) return key;
    return parent + "." + key;
}

namespace {

    /**
     * @brief Check if segment is a sequence index (no leading zeros)
     */
    bool is_array_index(const std::string& segment) {
        if (segment.empty() || segment.size() > 18) return false;
        if (segment[0] == '0' && segment.size() > 1) return false;
        return std::all_of(segment.begin(), segment.end(),
                           [](unsigned char c) { return std::isdigit(c) != 0; });
    }

    /**
     * @brief Step one segment down, or nullptr if the segment is missing
     * @throws TypeError if current is a scalar
     */
    const Value* step(const Value& current, const std::string& seg, const std::string& path) {
        if (current.is_object()) {
            auto it = current.find(seg);
            return it == current.end() ? nullptr : &*it;
        }
        if (current.is_array()) {
            if (!is_array_index(seg)) return nullptr;
            const auto idx = static_cast<std::size_t>(std::stoull(seg));
            return idx < current.size() ? &current[idx] : nullptr;
        }
        throw TypeError(path, "mapping or sequence", type_name(current));
    }

} // anonymous namespace

const Value* get_by_dot(const Value& data, const std::string& path) {
    const Value* current = &data;
    for (const auto& seg : split_dot_path(path)) {
        current = step(*current, seg, path);
        if (current == nullptr) {
            throw KeyError(path, seg);
        }
    }
    return current;
}

bool contains_dot(const Value& data, const std::string& path) {
    const Value* current = &data;
    for (const auto& seg : split_dot_path(path)) {
        current = step(*current, seg, path);
        if (current == nullptr) {
            return false;
        }
    }
    return true;
}

} // namespace overlay
