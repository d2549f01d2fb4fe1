#pragma once

#include <string>
#include <string_view>
#include <charconv>
#include <cstdint>
#include <cmath>


namespace lcr {
namespace json {

// Append `s` as a quoted JSON string, escaping quotes, backslashes and
// control characters.
inline void append_string(std::string& out, std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out.push_back(hex[(c >> 4) & 0x0F]);
                    out.push_back(hex[c & 0x0F]);
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

// Shortest round-trip representation. JSON has no NaN / Infinity, so those become 0.
inline void append(std::string& out, double value) {
    if (!std::isfinite(value)) {
        out.push_back('0');
        return;
    }
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) {
        out.push_back('0');
        return;
    }
    out.append(buf, ptr);
}

inline void append_bool(std::string& out, bool value) {
    out += value ? "true" : "false";
}

// Append `"key":` (key is assumed to be a plain identifier)
inline void append_key(std::string& out, std::string_view key) {
    out.push_back('"');
    out.append(key);
    out += "\":";
}

} // namespace json
} // namespace lcr
