#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace filedrop::http {

enum class Status : int {
    kContinue = 100,
    kOk = 200,
    kPartialContent = 206,
    kBadRequest = 400,
    kNotFound = 404,
    kMethodNotAllowed = 405,
    kRangeNotSatisfiable = 416,
    kHeaderFieldsTooLarge = 431,
    kInternalServerError = 500,
    kNotImplemented = 501,
    kVersionNotSupported = 505,
};

inline std::string_view reason_phrase(Status status) {
    switch (status) {
        case Status::kContinue:
            return "Continue";
        case Status::kOk:
            return "OK";
        case Status::kPartialContent:
            return "Partial Content";
        case Status::kBadRequest:
            return "Bad Request";
        case Status::kNotFound:
            return "Not Found";
        case Status::kMethodNotAllowed:
            return "Method Not Allowed";
        case Status::kRangeNotSatisfiable:
            return "Range Not Satisfiable";
        case Status::kHeaderFieldsTooLarge:
            return "Request Header Fields Too Large";
        case Status::kInternalServerError:
            return "Internal Server Error";
        case Status::kNotImplemented:
            return "Not Implemented";
        case Status::kVersionNotSupported:
            return "HTTP Version Not Supported";
    }
    return "Unknown";
}

inline int status_code(Status status) {
    return static_cast<int>(status);
}

// Protocol violation detected before a request could be routed.
class HttpError : public std::runtime_error {
public:
    HttpError(Status status, const std::string& message) : std::runtime_error(message), status_(status) {}

    Status status() const { return status_; }

private:
    Status status_;
};

// Header names are stored lower-cased.
using HeaderMap = std::unordered_map<std::string, std::string>;

struct Request {
    std::string method;
    std::string target;
    std::string path;
    int minor_version = 1;
    HeaderMap headers;
    std::uint64_t content_length = 0;
    bool keep_alive = true;
};

inline std::string_view header_value(const Request& request, const std::string& key,
                                     std::string_view fallback = {}) {
    auto it = request.headers.find(key);
    if (it == request.headers.end()) {
        return fallback;
    }
    return it->second;
}

// Random-access source for a response body that is streamed after the head.
class BodyReader {
public:
    virtual ~BodyReader() = default;

    // Copies up to `length` bytes at `offset` into `out`, returns the count.
    virtual std::size_t read(std::uint64_t offset, char* out, std::size_t length) = 0;
};

struct Response {
    Status status = Status::kOk;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    std::shared_ptr<BodyReader> stream;
    std::uint64_t stream_offset = 0;
    std::uint64_t stream_length = 0;

    bool close = false;

    Response& set_header(std::string name, std::string value) {
        for (auto& entry : headers) {
            if (entry.first == name) {
                entry.second = std::move(value);
                return *this;
            }
        }
        headers.emplace_back(std::move(name), std::move(value));
        return *this;
    }

    std::uint64_t content_length() const { return body.size() + stream_length; }
};

inline Response make_text(Status status, std::string text) {
    Response response;
    response.status = status;
    response.set_header("Content-Type", "text/plain; charset=utf-8");
    response.set_header("X-Content-Type-Options", "nosniff");
    text.push_back('\n');
    response.body = std::move(text);
    return response;
}

inline Response make_json(Status status, std::string json) {
    Response response;
    response.status = status;
    response.set_header("Content-Type", "application/json");
    json.push_back('\n');
    response.body = std::move(json);
    return response;
}

inline Response make_method_not_allowed(std::string allow) {
    auto response = make_text(Status::kMethodNotAllowed, "Method not allowed");
    response.set_header("Allow", std::move(allow));
    return response;
}

inline Response make_not_found() {
    return make_text(Status::kNotFound, "404 page not found");
}

// Status line plus headers, including the framing headers the server owns.
inline std::string encode_head(const Response& response, bool keep_alive) {
    std::string head;
    head.reserve(256);
    head.append("HTTP/1.1 ");
    head.append(std::to_string(status_code(response.status)));
    head.push_back(' ');
    head.append(reason_phrase(response.status));
    head.append("\r\n");
    for (const auto& entry : response.headers) {
        head.append(entry.first);
        head.append(": ");
        head.append(entry.second);
        head.append("\r\n");
    }
    head.append("Content-Length: ");
    head.append(std::to_string(response.content_length()));
    head.append("\r\n");
    head.append(keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n");
    head.append("\r\n");
    return head;
}

inline std::string encode_continue() {
    return "HTTP/1.1 " + std::to_string(status_code(Status::kContinue)) + " " +
           std::string(reason_phrase(Status::kContinue)) + "\r\n\r\n";
}

}  // namespace filedrop::http
