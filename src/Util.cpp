#include "overlay/Util.hpp"
#include <algorithm>
#include <cctype>

namespace overlay {

bool is_text(const std::string& data, std::string* reason) {
    auto fail = [&](const std::string& what, size_t offset) {
        if (reason) *reason = what + " at byte offset " + std::to_string(offset);
        return false;
    };

    size_t i = 0;
    while (i < data.size()) {
        const auto c = static_cast<unsigned char>(data[i]);
        if (c == 0) return fail("NUL byte", i);
        if (c < 0x80) { ++i; continue; }

        size_t len = 0;
        unsigned int cp = 0;
        if ((c & 0xE0) == 0xC0)      { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return fail("invalid UTF-8 lead byte", i);

        if (i + len > data.size()) return fail("truncated UTF-8 sequence", i);
        for (size_t k = 1; k < len; ++k) {
            const auto cc = static_cast<unsigned char>(data[i + k]);
            if ((cc & 0xC0) != 0x80) return fail("invalid UTF-8 continuation byte", i + k);
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates and values past U+10FFFF
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return fail("invalid UTF-8 sequence", i);
        }
        i += len;
    }
    return true;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    size_t i = 0, j = s.size();
    while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    while (j > i && std::isspace(static_cast<unsigned char>(s[j-1]))) --j;
    return s.substr(i, j - i);
}

} // namespace overlay
