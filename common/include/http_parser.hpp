#pragma once

#include "http_message.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace filedrop::http {

namespace detail {

inline std::string_view trim_ows(std::string_view value) {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
    }
    return value;
}

inline bool is_token_char(unsigned char ch) {
    if (std::isalnum(ch)) {
        return true;
    }
    switch (ch) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

inline bool is_token(std::string_view value) {
    return !value.empty() &&
           std::all_of(value.begin(), value.end(), [](char ch) { return is_token_char(static_cast<unsigned char>(ch)); });
}

inline std::string to_lower(std::string_view value) {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return lowered;
}

inline std::uint64_t parse_content_length(std::string_view value) {
    if (value.empty() || value.size() > 19) {
        throw HttpError(Status::kBadRequest, "Invalid Content-Length");
    }
    std::uint64_t length = 0;
    for (char ch : value) {
        if (ch < '0' || ch > '9') {
            throw HttpError(Status::kBadRequest, "Invalid Content-Length");
        }
        length = length * 10 + static_cast<std::uint64_t>(ch - '0');
    }
    return length;
}

// True when the comma separated header value lists `token` (case-insensitive).
inline bool has_token(std::string_view value, std::string_view token) {
    std::size_t start = 0;
    while (start <= value.size()) {
        const auto comma = value.find(',', start);
        const auto end = comma == std::string_view::npos ? value.size() : comma;
        if (to_lower(trim_ows(value.substr(start, end - start))) == token) {
            return true;
        }
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return false;
}

}  // namespace detail

// Offset one past the blank line that ends the head, or npos.
inline std::size_t find_head_end(std::string_view buffer) {
    const auto pos = buffer.find("\r\n\r\n");
    return pos == std::string_view::npos ? std::string_view::npos : pos + 4;
}

// Parses a request line and header block terminated by CRLF CRLF.
inline Request parse_request_head(std::string_view head) {
    Request request;

    auto line_end = head.find("\r\n");
    if (line_end == std::string_view::npos) {
        throw HttpError(Status::kBadRequest, "Malformed request line");
    }
    const auto request_line = head.substr(0, line_end);
    const auto first_space = request_line.find(' ');
    const auto last_space = request_line.rfind(' ');
    if (first_space == std::string_view::npos || first_space == last_space) {
        throw HttpError(Status::kBadRequest, "Malformed request line");
    }
    const auto method = request_line.substr(0, first_space);
    const auto target = request_line.substr(first_space + 1, last_space - first_space - 1);
    const auto version = request_line.substr(last_space + 1);

    if (!detail::is_token(method)) {
        throw HttpError(Status::kBadRequest, "Malformed request method");
    }
    if (target.empty() || target.front() != '/' || target.find(' ') != std::string_view::npos) {
        throw HttpError(Status::kBadRequest, "Malformed request target");
    }
    if (version.size() != 8 || version.substr(0, 7) != "HTTP/1.") {
        if (version.substr(0, 5) == "HTTP/") {
            throw HttpError(Status::kVersionNotSupported, "Unsupported HTTP version");
        }
        throw HttpError(Status::kBadRequest, "Malformed HTTP version");
    }
    if (version[7] != '0' && version[7] != '1') {
        throw HttpError(Status::kVersionNotSupported, "Unsupported HTTP version");
    }

    request.method = std::string(method);
    request.target = std::string(target);
    request.minor_version = version[7] - '0';
    request.path = std::string(target.substr(0, target.find('?')));

    std::size_t pos = line_end + 2;
    while (pos < head.size()) {
        line_end = head.find("\r\n", pos);
        if (line_end == std::string_view::npos) {
            line_end = head.size();
        }
        const auto line = head.substr(pos, line_end - pos);
        pos = line_end + 2;
        if (line.empty()) {
            break;
        }
        if (line.front() == ' ' || line.front() == '\t') {
            throw HttpError(Status::kBadRequest, "Obsolete header folding");
        }
        const auto colon = line.find(':');
        if (colon == std::string_view::npos || !detail::is_token(line.substr(0, colon))) {
            throw HttpError(Status::kBadRequest, "Malformed header line");
        }
        auto name = detail::to_lower(line.substr(0, colon));
        const auto value = detail::trim_ows(line.substr(colon + 1));

        auto [it, inserted] = request.headers.emplace(name, std::string(value));
        if (!inserted) {
            if (name == "content-length") {
                if (it->second != value) {
                    throw HttpError(Status::kBadRequest, "Conflicting Content-Length");
                }
                continue;
            }
            it->second.append(", ");
            it->second.append(value);
        }
    }

    if (request.headers.count("transfer-encoding") != 0) {
        throw HttpError(Status::kNotImplemented, "Transfer-Encoding request bodies are not supported");
    }
    if (const auto length = request.headers.find("content-length"); length != request.headers.end()) {
        request.content_length = detail::parse_content_length(length->second);
    }

    const auto connection = header_value(request, "connection");
    if (request.minor_version == 0) {
        request.keep_alive = detail::has_token(connection, "keep-alive");
    } else {
        request.keep_alive = !detail::has_token(connection, "close");
    }
    return request;
}

inline bool expects_continue(const Request& request) {
    return request.minor_version >= 1 && detail::to_lower(header_value(request, "expect")) == "100-continue";
}

}  // namespace filedrop::http
