#pragma once

#include "http_message.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace filedrop::server {

class MultipartError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ContentDisposition {
    std::string type;
    std::string name;
    std::optional<std::string> filename;
};

struct PartHeaders {
    http::HeaderMap headers;
    ContentDisposition disposition;
};

// Boundary parameter of a multipart/form-data content type, or nullopt when
// the type is something else or the boundary is missing/invalid.
std::optional<std::string> extract_boundary(std::string_view content_type);

// Parses `form-data; name="field"; filename="a.txt"`. A RFC 5987 `filename*`
// parameter takes precedence over `filename`.
ContentDisposition parse_content_disposition(std::string_view value);

// Incremental multipart/form-data parser. Input may be split anywhere; part
// bodies are delivered as they become unambiguous, so memory use is bounded by
// the largest fed chunk plus the delimiter length and its transport padding.
class MultipartReader {
public:
    struct Callbacks {
        std::function<void(const PartHeaders&)> on_part_begin;
        std::function<void(std::string_view)> on_part_data;
        std::function<void()> on_part_end;
    };

    static constexpr std::size_t kMaxPartHeaderBytes = 16 * 1024;

    MultipartReader(std::string boundary, Callbacks callbacks);

    // Throws MultipartError on malformed input. Once failed, further input is ignored.
    void feed(std::string_view data);

    // True after the closing delimiter has been seen.
    bool complete() const { return state_ == State::kDone; }
    bool failed() const { return state_ == State::kFailed; }

private:
    enum class State {
        kPreamble,
        kHeaders,
        kBody,
        kDone,
        kFailed,
    };

    // What follows a delimiter match decides whether it really ends a part.
    enum class Match {
        kIncomplete,
        kNextPart,
        kClose,
        kData,
    };

    static constexpr std::size_t kMaxPaddingBytes = 256;

    bool step();
    Match classify(std::size_t pos, std::size_t& end) const;
    bool enter(Match match, std::size_t end);
    bool scan_preamble();
    bool scan_headers();
    bool scan_body();
    [[noreturn]] void fail(const std::string& reason);

    std::string delimiter_;
    Callbacks callbacks_;
    std::string pending_;
    State state_ = State::kPreamble;
};

}  // namespace filedrop::server
