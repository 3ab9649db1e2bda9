/**
 * @file Equal.cpp
 * @brief Implementation of deep equality
 */

#include "overlay/Equal.hpp"

namespace overlay {

bool deep_equal(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) {
        // nlohmann compares integer and floating storage numerically
        return a == b;
    }

    if (a.type() != b.type()) {
        return false;
    }

    if (a.is_array()) {
        if (a.size() != b.size()) return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (!deep_equal(a[i], b[i])) return false;
        }
        return true;
    }

    if (a.is_object()) {
        if (a.size() != b.size()) return false;
        for (auto it = a.begin(); it != a.end(); ++it) {
            auto other = b.find(it.key());
            if (other == b.end()) return false;
            if (!deep_equal(it.value(), *other)) return false;
        }
        return true;
    }

    return a == b;
}

} // namespace overlay
