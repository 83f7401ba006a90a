#pragma once

#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace filedrop::util {

static constexpr std::string_view kHexDigits = "0123456789ABCDEF";

namespace detail {

inline int hex_value(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

// RFC 3986 pchar minus '%'.
inline bool is_path_char(unsigned char ch) {
    if (std::isalnum(ch)) {
        return true;
    }
    switch (ch) {
        case '-': case '.': case '_': case '~':
        case '!': case '$': case '&': case '\'': case '(': case ')':
        case '*': case '+': case ',': case ';': case '=': case ':': case '@':
            return true;
        default:
            return false;
    }
}

}  // namespace detail

// Decodes %XX escapes in a URL path. '+' is left alone. Returns nullopt on a
// truncated or non-hex escape.
inline std::optional<std::string> percent_decode(std::string_view input) {
    std::string output;
    output.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        const char ch = input[i];
        if (ch != '%') {
            output.push_back(ch);
            continue;
        }
        if (i + 2 >= input.size()) {
            return std::nullopt;
        }
        const int high = detail::hex_value(input[i + 1]);
        const int low = detail::hex_value(input[i + 2]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        output.push_back(static_cast<char>((high << 4) | low));
        i += 2;
    }
    return output;
}

// Encodes a single path segment; '/' is escaped as well.
inline std::string percent_encode_segment(std::string_view input) {
    std::string output;
    output.reserve(input.size());
    for (unsigned char ch : input) {
        if (detail::is_path_char(ch)) {
            output.push_back(static_cast<char>(ch));
            continue;
        }
        output.push_back('%');
        output.push_back(kHexDigits[ch >> 4]);
        output.push_back(kHexDigits[ch & 0x0F]);
    }
    return output;
}

}  // namespace filedrop::util
