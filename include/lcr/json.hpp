#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <cstddef>
#include <charconv>


namespace lcr {
namespace json {

// ----------------------------------------------------------------------------
// String escaping
// ----------------------------------------------------------------------------
//
// Quotes, backslashes and the short control escapes (\b \f \n \r \t) are
// escaped by name, other bytes below 0x20 as \u00XX. Everything else,
// including UTF-8 multi-byte sequences, passes through untouched.
//

// Number of bytes needed to write 'c' inside a JSON string
[[nodiscard]]
constexpr std::size_t escaped_width(char c) noexcept {
    switch (c) {
        case '"':
        case '\\':
        case '\b':
        case '\f':
        case '\n':
        case '\r':
        case '\t':
            return 2;
        default:
            return (static_cast<unsigned char>(c) < 0x20) ? 6 : 1;
    }
}

// Encoded size of 's' as a quoted JSON string
[[nodiscard]]
inline std::size_t quoted_size(std::string_view s) noexcept {
    std::size_t n = 2;
    for (char c : s) {
        n += escaped_width(c);
    }
    return n;
}

inline void append_escaped(std::string& out, std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default: {
                auto u = static_cast<unsigned char>(c);
                if (u < 0x20) {
                    out += "\\u00";
                    out += hex[u >> 4];
                    out += hex[u & 0x0F];
                }
                else {
                    out += c;
                }
            }
        }
    }
}

inline void append_quoted(std::string& out, std::string_view s) {
    out += '"';
    append_escaped(out, s);
    out += '"';
}

// ----------------------------------------------------------------------------
// Numbers
// ----------------------------------------------------------------------------

// Fast integer → string formatter
inline void append(std::string& out, std::uint64_t value)
{
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = '0' + (value % 10);
        value /= 10;
    } while (value > 0);

    out.append(p, buf + sizeof(buf) - p);
}

inline void append(std::string& out, std::int64_t value)
{
    if (value < 0) {
        out += '-';
        // Two's complement negation through unsigned avoids INT64_MIN overflow
        append(out, ~static_cast<std::uint64_t>(value) + 1);
        return;
    }
    append(out, static_cast<std::uint64_t>(value));
}

[[nodiscard]]
constexpr std::size_t digits(std::uint64_t value) noexcept {
    std::size_t n = 1;
    while (value >= 10) {
        value /= 10;
        ++n;
    }
    return n;
}

[[nodiscard]]
constexpr std::size_t digits(std::int64_t value) noexcept {
    if (value < 0) {
        return 1 + digits(~static_cast<std::uint64_t>(value) + 1);
    }
    return digits(static_cast<std::uint64_t>(value));
}

// Shortest round-trip representation of a finite double.
// The text always carries a '.' or an exponent so that it reads back as a
// floating point value (1.0 stays "1.0", never "1").
// Returns the number of bytes written into 'buf' (at most 32).
inline std::size_t format_double(char (&buf)[32], double value) noexcept {
    auto res = std::to_chars(buf, buf + sizeof(buf) - 2, value);
    std::size_t n = static_cast<std::size_t>(res.ptr - buf);
    for (std::size_t i = 0; i < n; ++i) {
        if (buf[i] == '.' || buf[i] == 'e' || buf[i] == 'E') {
            return n;
        }
    }
    buf[n++] = '.';
    buf[n++] = '0';
    return n;
}

inline void append(std::string& out, double value) {
    char buf[32];
    out.append(buf, format_double(buf, value));
}

[[nodiscard]]
inline std::size_t double_size(double value) noexcept {
    char buf[32];
    return format_double(buf, value);
}

} // namespace json
} // namespace lcr
