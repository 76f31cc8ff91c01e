#include "JsonEscape.h"

#include <cstddef>

namespace notox {

namespace {

const char kHex[] = "0123456789abcdef";

// Two-character escape for a byte below 0x20 or a quote/backslash, 'u' for
// the \u00XX form, 0 when the byte is written as is.
char short_escape(unsigned char b) {
    switch (b) {
        case '"':  return '"';
        case '\\': return '\\';
        case '\b': return 'b';
        case '\f': return 'f';
        case '\n': return 'n';
        case '\r': return 'r';
        case '\t': return 't';
        default:   return b < 0x20 ? 'u' : 0;
    }
}

// Length of the well-formed sequence starting at s[i], 0 if malformed.
std::size_t sequence_at(std::string_view s, std::size_t i) {
    const auto b = static_cast<unsigned char>(s[i]);
    std::size_t len;
    unsigned char lo = 0x80, hi = 0xBF;  // bounds for the second byte
    if (b < 0x80) return 1;
    if (b >= 0xC2 && b <= 0xDF) {
        len = 2;
    } else if (b >= 0xE0 && b <= 0xEF) {
        len = 3;
        if (b == 0xE0) lo = 0xA0;       // overlong
        if (b == 0xED) hi = 0x9F;       // surrogates
    } else if (b >= 0xF0 && b <= 0xF4) {
        len = 4;
        if (b == 0xF0) lo = 0x90;       // overlong
        if (b == 0xF4) hi = 0x8F;       // above U+10FFFF
    } else {
        return 0;
    }
    if (i + len > s.size()) return 0;
    for (std::size_t k = 1; k < len; ++k) {
        const auto c = static_cast<unsigned char>(s[i + k]);
        if (c < lo || c > hi) return 0;
        lo = 0x80; hi = 0xBF;
    }
    return len;
}

} // namespace

bool append_json_string(std::string& out, std::string_view s) {
    const std::size_t mark = out.size();
    out.reserve(mark + s.size() + 2);
    out += '"';
    for (std::size_t i = 0; i < s.size();) {
        const std::size_t len = sequence_at(s, i);
        if (len == 0) {
            out.resize(mark);
            return false;
        }
        if (len > 1) {
            out.append(s, i, len);
            i += len;
            continue;
        }
        const auto b = static_cast<unsigned char>(s[i++]);
        const char esc = short_escape(b);
        if (esc == 0) {
            out += static_cast<char>(b);
        } else if (esc == 'u') {
            out += "\\u00";
            out += kHex[b >> 4];
            out += kHex[b & 0xF];
        } else {
            out += '\\';
            out += esc;
        }
    }
    out += '"';
    return true;
}

} // namespace notox
