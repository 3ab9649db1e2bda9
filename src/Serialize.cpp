/**
 * @file Serialize.cpp
 * @brief Implementation of document serialization
 */

#include "overlay/Serialize.hpp"
#include "overlay/Errors.hpp"
#include "overlay/Parse.hpp"

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace overlay {

namespace {

    std::string pad(int level) {
        return std::string(static_cast<std::size_t>(level < 0 ? 0 : level) * 2, ' ');
    }

    bool has_line_break(const std::string& s) {
        return s.find_first_of("\r\n") != std::string::npos;
    }

    std::string quoted(const std::string& s) {
        std::string out = "\"";
        for (char c : s) {
            if (c == '"') out += '\\';
            out += c;
        }
        out += '"';
        return out;
    }

    /**
     * @brief Whether a bare string would read back differently
     */
    bool needs_quotes(const std::string& s) {
        if (s.find_first_of(":#\"") != std::string::npos) return true;
        if (s.empty() || s.front() == '\'') return true;
        const Value back = parse_scalar(s);
        return !back.is_string() || back.get<std::string>() != s;
    }

    std::string serialize_key(const std::string& key) {
        if (has_line_break(key)) {
            throw SerializationError("mapping key contains a line break: " + quoted(key));
        }
        const bool quote =
            key.empty() ||
            key.find_first_of(":#\"") != std::string::npos ||
            key.front() == '\'' || key.front() == ' ' || key.back() == ' ' ||
            key == "-" || key.compare(0, 2, "- ") == 0;
        return quote ? quoted(key) : key;
    }

    /**
     * @brief Floating value as integer digits with an exponent ("15e-1")
     *
     * Starts from nlohmann's shortest round-trip text ("1.5", "1.2e+19")
     * and folds the fraction digits into the exponent. The result has no
     * dot, so it reads back as a number.
     */
    std::string exponent_form(const Value& value) {
        const std::string text = value.dump();
        std::size_t pos = 0;
        const bool negative = !text.empty() && text[0] == '-';
        if (negative) ++pos;

        std::string digits;
        long exponent = 0;
        bool fraction = false;
        for (; pos < text.size(); ++pos) {
            const char c = text[pos];
            if (c == '.') {
                fraction = true;
            } else if (c == 'e' || c == 'E') {
                exponent += std::stol(text.substr(pos + 1));
                break;
            } else {
                digits += c;
                if (fraction) --exponent;
            }
        }

        while (digits.size() > 1 && digits.back() == '0') {
            digits.pop_back();
            ++exponent;
        }
        const std::size_t first = digits.find_first_not_of('0');
        digits = first == std::string::npos ? "0" : digits.substr(first);

        std::string out = negative ? "-" + digits : digits;
        if (exponent != 0) out += "e" + std::to_string(exponent);
        return out;
    }

    std::string serialize_number(const Value& value) {
        if (!value.is_number_float()) {
            return value.dump();
        }
        const double d = value.get<double>();
        if (!std::isfinite(d)) {
            throw SerializationError("number is not finite");
        }
        // Whole numbers are written without a fraction so they read back
        // as numbers rather than as dotted strings
        if (d == std::trunc(d) && std::fabs(d) < 1e18) {
            return std::to_string(static_cast<std::int64_t>(d));
        }
        return exponent_form(value);
    }

    /**
     * @brief Text for a value written on the same line as its key or dash
     */
    std::string inline_value(const Value& value) {
        if (value.is_array() && value.empty()) return "[]";
        if (value.is_object() && value.empty()) return "{}";
        return serialize_scalar(value);
    }

    bool fits_inline(const Value& value) {
        return !is_container(value) || value.empty();
    }

    void emit(const Value& value, int level, std::vector<std::string>& lines);

    void emit_mapping(const Value& mapping, int level, std::vector<std::string>& lines) {
        // nlohmann objects iterate keys in ascending order
        for (auto it = mapping.begin(); it != mapping.end(); ++it) {
            const std::string key = serialize_key(it.key());
            const Value& value = it.value();
            if (fits_inline(value)) {
                lines.push_back(pad(level) + key + ": " + inline_value(value));
            } else {
                lines.push_back(pad(level) + key + ":");
                emit(value, level + 1, lines);
            }
        }
    }

    void emit_sequence(const Value& sequence, int level, std::vector<std::string>& lines) {
        for (const auto& item : sequence) {
            if (fits_inline(item)) {
                lines.push_back(pad(level) + "- " + inline_value(item));
            } else if (item.is_array()) {
                lines.push_back(pad(level) + "-");
                emit_sequence(item, level + 1, lines);
            } else if (item.size() == 1 && fits_inline(item.begin().value())) {
                // "- key: value" alone reads back as a string, so the
                // mapping goes on its own lines under a lone dash
                lines.push_back(pad(level) + "-");
                emit_mapping(item, level + 1, lines);
            } else {
                // First key shares the dash line, the rest align under it
                std::vector<std::string> nested;
                emit_mapping(item, level + 1, nested);
                nested.front() = pad(level) + "- " + nested.front().substr(pad(level + 1).size());
                lines.insert(lines.end(), nested.begin(), nested.end());
            }
        }
    }

    void emit(const Value& value, int level, std::vector<std::string>& lines) {
        if (value.is_object()) {
            emit_mapping(value, level, lines);
        } else if (value.is_array()) {
            emit_sequence(value, level, lines);
        } else {
            lines.push_back(pad(level) + serialize_scalar(value));
        }
    }

} // anonymous namespace

std::string serialize_scalar(const Value& value) {
    if (value.is_null()) return "null";
    if (value.is_boolean()) return value.get<bool>() ? "true" : "false";
    if (value.is_number()) return serialize_number(value);
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        if (has_line_break(s)) {
            throw SerializationError("string contains a line break: " + quoted(s));
        }
        return needs_quotes(s) ? quoted(s) : s;
    }
    throw SerializationError("cannot write " + type_name(value) + " as a scalar");
}

std::string serialize_document(const Value& value, int indent_level) {
    std::vector<std::string> lines;
    emit(value, indent_level, lines);

    std::string text;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) text += '\n';
        text += lines[i];
    }
    return text;
}

} // namespace overlay
