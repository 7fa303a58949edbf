#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <cstdio>
#include <charconv>
#include <cmath>


namespace lcr {
namespace json {

// Appends `s` as a quoted JSON string, escaping quotes, backslashes and
// control characters. Non-ASCII bytes are copied through (UTF-8 in, UTF-8 out).
inline void append_string(std::string& out, std::string_view s) {
    static constexpr char HEX[] = "0123456789abcdef";
    out.reserve(out.size() + s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out.push_back(HEX[(c >> 4) & 0x0F]);
                    out.push_back(HEX[c & 0x0F]);
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back('"');
}

// Fast integer → string formatter
inline void append(std::string& out, std::uint64_t value) {
    char buf[32];
    char* p = buf + sizeof(buf);
    do {
        *(--p) = static_cast<char>('0' + (value % 10));
        value /= 10;
    } while (value > 0);
    out.append(p, buf + sizeof(buf) - p);
}

inline void append(std::string& out, std::int64_t value) {
    if (value < 0) {
        out.push_back('-');
        append(out, static_cast<std::uint64_t>(0) - static_cast<std::uint64_t>(value));
        return;
    }
    append(out, static_cast<std::uint64_t>(value));
}

// Shortest round-trip representation. JSON has no NaN / Infinity: those
// are written as null.
inline void append(std::string& out, double value) {
    if (!std::isfinite(value)) {
        out += "null";
        return;
    }
    char buf[32];
    const auto res = std::to_chars(buf, buf + sizeof(buf), value);
    out.append(buf, res.ptr);
}

inline void append(std::string& out, bool value) {
    out += value ? "true" : "false";
}

// "key":
inline void append_key(std::string& out, std::string_view key) {
    append_string(out, key);
    out.push_back(':');
}

} // namespace json
} // namespace lcr
