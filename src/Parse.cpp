/**
 * @file Parse.cpp
 * @brief Implementation of document parsing
 */

#include "overlay/Parse.hpp"
#include "overlay/Errors.hpp"
#include "overlay/Util.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

namespace overlay {

namespace {

    /**
     * @brief One content line (blank and comment lines are never stored)
     */
    struct Line {
        std::size_t number = 0;   // 1-based
        std::size_t indent = 0;   // leading spaces
        std::string text;         // content without indentation
    };

    bool is_quote(char c) {
        return c == '"' || c == '\'';
    }

    /**
     * @brief `- item` or a lone `-`
     */
    bool is_dash(const std::string& text) {
        return text == "-" || text.compare(0, 2, "- ") == 0;
    }

    /**
     * @brief Position of the colon that ends a mapping key, or npos
     *
     * The first colon wins, except that a quoted key ("a:b": 1) is
     * skipped over first.
     */
    std::size_t find_key_colon(const std::string& text) {
        if (text.empty()) return std::string::npos;
        std::size_t from = 0;
        if (is_quote(text.front())) {
            const char q = text.front();
            std::size_t close = 1;
            for (; close < text.size(); ++close) {
                if (text[close] == '\\' && q == '"') {
                    ++close;
                    continue;
                }
                if (text[close] == q) break;
            }
            // An unclosed quote is ordinary text
            if (close < text.size()) from = close + 1;
        }
        return text.find(':', from);
    }

    bool is_key_line(const std::string& text) {
        return !is_dash(text) && find_key_colon(text) != std::string::npos;
    }

    std::string unescape_double_quoted(const std::string& content) {
        std::string result;
        result.reserve(content.size());
        for (std::size_t i = 0; i < content.size(); ++i) {
            if (content[i] == '\\' && i + 1 < content.size() && content[i + 1] == '"') {
                result += '"';
                ++i;
            } else {
                result += content[i];
            }
        }
        return result;
    }

    bool is_digit(char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }

    /**
     * @brief Length of the digit run starting at pos
     */
    std::size_t digit_run(const std::string& s, std::size_t pos) {
        std::size_t end = pos;
        while (end < s.size() && is_digit(s[end])) ++end;
        return end - pos;
    }

    /**
     * @brief digits.digits, e.g. "1.0" or "10.24"
     */
    bool is_two_part_version(const std::string& s) {
        const std::size_t major = digit_run(s, 0);
        if (major == 0 || major >= s.size() || s[major] != '.') return false;
        const std::size_t minor = digit_run(s, major + 1);
        return minor > 0 && major + 1 + minor == s.size();
    }

    /**
     * @brief [+-]digits with an optional [eE][+-]digits exponent
     *
     * @param has_exponent Set when the exponent part is present
     */
    bool is_decimal_number(const std::string& s, bool& has_exponent) {
        std::size_t pos = 0;
        if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) ++pos;
        const std::size_t mantissa = digit_run(s, pos);
        if (mantissa == 0) return false;
        pos += mantissa;

        has_exponent = pos < s.size();
        if (!has_exponent) return true;
        if (s[pos] != 'e' && s[pos] != 'E') return false;
        ++pos;
        if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) ++pos;
        const std::size_t exponent = digit_run(s, pos);
        return exponent > 0 && pos + exponent == s.size();
    }

    Value scalar(const std::string& token) {
        const std::string s = trim(token);

        // S1: Null
        if (s.empty() || s == "null" || s == "~") {
            return nullptr;
        }

        // S2: Boolean
        if (s == "true") return true;
        if (s == "false") return false;

        // S3: Empty containers
        if (s == "[]") return Value::array();
        if (s == "{}") return Value::object();

        // S4: Quoted String; an unmatched quote falls through to S7
        if (is_quote(s.front()) && s.size() >= 2 && s.back() == s.front()) {
            std::string content = s.substr(1, s.size() - 2);
            if (s.front() == '"') {
                return unescape_double_quoted(content);
            }
            return content;
        }

        // S5: digits.digits is a version, not a number. Longer dotted
        // tokens are not matched here; they end up as strings in S7.
        if (is_two_part_version(s)) {
            return s;
        }

        // S6: Decimal Number
        bool has_exponent = false;
        if (is_decimal_number(s, has_exponent)) {
            if (!has_exponent) {
                try {
                    return static_cast<std::int64_t>(std::stoll(s));
                } catch (const std::out_of_range&) {
                    // Too wide for int64: fall back to floating storage
                }
            }
            try {
                double val = std::stod(s);
                if (std::isfinite(val)) {
                    return val;
                }
            } catch (const std::out_of_range&) {
                // Not representable: keep the token as text
            }
        }

        // S7: Raw String
        return s;
    }

    std::vector<Line> split_lines(const std::string& text) {
        std::vector<Line> lines;
        std::size_t number = 0;
        std::size_t start = 0;

        while (start <= text.size()) {
            std::size_t end = text.find('\n', start);
            if (end == std::string::npos) end = text.size();
            std::string raw = text.substr(start, end - start);
            start = end + 1;
            ++number;

            if (!raw.empty() && raw.back() == '\r') raw.pop_back();

            std::string content = trim(raw);
            if (content.empty() || content.front() == '#') continue;

            // Every leading whitespace character is one column, tabs included
            std::size_t indent = 0;
            while (indent < raw.size() && std::isspace(static_cast<unsigned char>(raw[indent]))) {
                ++indent;
            }

            lines.push_back(Line{number, indent, std::move(content)});
        }
        return lines;
    }

    /**
     * @brief Recursive descent over indentation-delimited blocks
     */
    class DocumentParser {
    public:
        explicit DocumentParser(std::vector<Line> lines)
            : lines_(std::move(lines))
        {}

        Value parse() {
            if (lines_.empty()) {
                return Value::object();
            }
            Value root = parse_block(lines_.front().indent);
            if (!at_end()) {
                throw ParseError(current().number, "unexpected indentation");
            }
            return root;
        }

    private:
        std::vector<Line> lines_;
        std::size_t pos_ = 0;

        bool at_end() const {
            return pos_ >= lines_.size();
        }

        const Line& current() const {
            return lines_[pos_];
        }

        Value parse_block(std::size_t indent) {
            if (is_dash(current().text)) {
                return parse_sequence(indent, false);
            }
            return parse_mapping(indent);
        }

        std::pair<std::string, std::string> split_entry(const Line& line) const {
            const std::size_t colon = find_key_colon(line.text);
            if (colon == std::string::npos) {
                throw ParseError(line.number, "expected 'key: value', got: " + line.text);
            }
            std::string key = trim(line.text.substr(0, colon));
            if (key.size() >= 2 && is_quote(key.front()) && key.back() == key.front()) {
                key = scalar(key).get<std::string>();
            }
            if (key.empty()) {
                throw ParseError(line.number, "empty mapping key");
            }
            return {key, trim(line.text.substr(colon + 1))};
        }

        /**
         * @brief Value of a `key:` entry with nothing after the colon
         *
         * A more-indented block, or a sequence written at the key's own
         * indentation, becomes the value; otherwise the value is null.
         */
        Value parse_nested(std::size_t owner_indent) {
            if (at_end()) return nullptr;
            const Line& next = current();
            if (next.indent > owner_indent) {
                return parse_block(next.indent);
            }
            if (next.indent == owner_indent && is_dash(next.text)) {
                return parse_sequence(owner_indent, true);
            }
            return nullptr;
        }

        Value parse_mapping(std::size_t indent) {
            Value result = Value::object();
            while (!at_end()) {
                const Line& line = current();
                if (line.indent < indent) break;
                if (line.indent > indent) {
                    throw ParseError(line.number, "unexpected indentation");
                }
                if (is_dash(line.text)) {
                    throw ParseError(line.number, "sequence item inside a mapping block");
                }

                auto [key, rest] = split_entry(line);
                ++pos_;

                if (!rest.empty()) {
                    result[key] = scalar(rest);
                } else {
                    result[key] = parse_nested(indent);
                }
            }
            return result;
        }

        /**
         * @param compact Sequence sits at its owning key's indentation,
         *                so a key line at the same indentation ends it
         */
        Value parse_sequence(std::size_t indent, bool compact) {
            Value items = Value::array();
            while (!at_end()) {
                const Line& line = current();
                if (line.indent < indent) break;
                if (line.indent > indent) {
                    throw ParseError(line.number, "unexpected indentation");
                }
                if (!is_dash(line.text)) {
                    if (compact) break;
                    throw ParseError(line.number, "mapping entry inside a sequence block");
                }
                items.push_back(parse_item());
            }
            return items;
        }

        Value parse_item() {
            const Line dash = current();
            ++pos_;

            const std::size_t offset = dash.text.find_first_not_of(' ', 1);
            const std::string rest = offset == std::string::npos ? "" : dash.text.substr(offset);
            const std::size_t content_column = dash.indent + (offset == std::string::npos ? 2 : offset);

            const Line* next = at_end() ? nullptr : &current();
            const bool deeper = next != nullptr && next->indent > dash.indent;

            if (rest.empty()) {
                if (deeper) return parse_block(next->indent);
                return nullptr;
            }

            const bool next_is_key = deeper && is_key_line(next->text);

            if (find_key_colon(rest) == std::string::npos) {
                if (next_is_key) {
                    throw ParseError(next->number, "mapping entries under a scalar sequence item");
                }
                return scalar(rest);
            }

            auto [key, value_text] = split_entry(Line{dash.number, content_column, rest});
            const bool owns_block = value_text.empty() && deeper &&
                (next->indent > content_column ||
                 (next->indent == content_column && is_dash(next->text)));

            if (!next_is_key && !owns_block) {
                // `- id: 1` with nothing under it stays a plain string
                return scalar(rest);
            }

            Value item = Value::object();
            if (owns_block) {
                item[key] = next->indent > content_column
                    ? parse_block(next->indent)
                    : parse_sequence(content_column, true);
            } else {
                item[key] = scalar(value_text);
            }

            if (!at_end() && current().indent > dash.indent && !is_dash(current().text)) {
                Value siblings = parse_mapping(current().indent);
                for (auto it = siblings.begin(); it != siblings.end(); ++it) {
                    item[it.key()] = std::move(it.value());
                }
            }
            return item;
        }
    };

} // anonymous namespace

std::string Diagnostic::to_string() const {
    if (line == 0) return message;
    return "line " + std::to_string(line) + ": " + message;
}

Value parse_scalar(const std::string& token) {
    return scalar(token);
}

ParseOutcome parse_document(const std::string& text) {
    ParseOutcome outcome;
    try {
        outcome.value = DocumentParser(split_lines(text)).parse();
        outcome.raw = text;
    } catch (const ParseError& e) {
        outcome.value = Value();
        outcome.raw.clear();
        outcome.diagnostic = Diagnostic{e.line(), e.details()};
    }
    return outcome;
}

} // namespace overlay
