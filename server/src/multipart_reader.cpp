#include "multipart_reader.hpp"

#include "http_parser.hpp"
#include "url_codec.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include <vector>

namespace filedrop::server {

namespace {

struct Parameter {
    std::string name;
    std::string value;
};

// RFC 2045 tspecials. A backslash inside a quoted value only escapes one of
// these, so Windows paths such as "C:\\dir\\a.txt" survive intact.
bool is_tspecial(char ch) {
    return std::string_view("()<>@,;:\\\"/[]?=").find(ch) != std::string_view::npos;
}

// Splits `type; a=b; c="d;e"` into the leading token and its parameters.
std::pair<std::string, std::vector<Parameter>> split_parameters(std::string_view value) {
    std::vector<Parameter> params;
    auto semicolon = value.find(';');
    std::string head = http::detail::to_lower(http::detail::trim_ows(value.substr(0, semicolon)));

    std::size_t pos = semicolon == std::string_view::npos ? value.size() : semicolon + 1;
    while (pos < value.size()) {
        while (pos < value.size() && (value[pos] == ' ' || value[pos] == '\t' || value[pos] == ';')) {
            ++pos;
        }
        const auto name_start = pos;
        while (pos < value.size() && value[pos] != '=' && value[pos] != ';') {
            ++pos;
        }
        Parameter param;
        param.name = http::detail::to_lower(http::detail::trim_ows(value.substr(name_start, pos - name_start)));
        if (pos < value.size() && value[pos] == '=') {
            ++pos;
            while (pos < value.size() && (value[pos] == ' ' || value[pos] == '\t')) {
                ++pos;
            }
            if (pos < value.size() && value[pos] == '"') {
                ++pos;
                while (pos < value.size() && value[pos] != '"') {
                    if (value[pos] == '\\' && pos + 1 < value.size() && is_tspecial(value[pos + 1])) {
                        ++pos;
                    }
                    param.value.push_back(value[pos]);
                    ++pos;
                }
                ++pos;  // closing quote
                while (pos < value.size() && value[pos] != ';') {
                    ++pos;
                }
            } else {
                const auto value_start = pos;
                while (pos < value.size() && value[pos] != ';') {
                    ++pos;
                }
                param.value = std::string(http::detail::trim_ows(value.substr(value_start, pos - value_start)));
            }
        }
        if (!param.name.empty()) {
            params.push_back(std::move(param));
        }
    }
    return {std::move(head), std::move(params)};
}

// charset'language'percent-encoded, e.g. UTF-8''na%C3%AFve.txt
std::optional<std::string> decode_extended_value(std::string_view value) {
    const auto first = value.find('\'');
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    const auto second = value.find('\'', first + 1);
    if (second == std::string_view::npos) {
        return std::nullopt;
    }
    const auto charset = http::detail::to_lower(value.substr(0, first));
    if (charset != "utf-8" && charset != "us-ascii") {
        return std::nullopt;
    }
    return util::percent_decode(value.substr(second + 1));
}

bool valid_boundary(std::string_view boundary) {
    if (boundary.empty() || boundary.size() > 70 || boundary.back() == ' ') {
        return false;
    }
    return std::all_of(boundary.begin(), boundary.end(), [](char ch) {
        const auto c = static_cast<unsigned char>(ch);
        return c >= 0x20 && c < 0x7f;
    });
}

}  // namespace

std::optional<std::string> extract_boundary(std::string_view content_type) {
    auto [type, params] = split_parameters(content_type);
    if (type != "multipart/form-data") {
        return std::nullopt;
    }
    for (const auto& param : params) {
        if (param.name == "boundary" && valid_boundary(param.value)) {
            return param.value;
        }
    }
    return std::nullopt;
}

ContentDisposition parse_content_disposition(std::string_view value) {
    auto [type, params] = split_parameters(value);
    ContentDisposition disposition;
    disposition.type = std::move(type);
    std::optional<std::string> extended;
    for (const auto& param : params) {
        if (param.name == "name") {
            disposition.name = param.value;
        } else if (param.name == "filename") {
            disposition.filename = param.value;
        } else if (param.name == "filename*") {
            extended = decode_extended_value(param.value);
        }
    }
    if (extended) {
        disposition.filename = std::move(extended);
    }
    return disposition;
}

MultipartReader::MultipartReader(std::string boundary, Callbacks callbacks)
    : delimiter_("\r\n--" + boundary), callbacks_(std::move(callbacks)), pending_("\r\n") {
    if (!valid_boundary(boundary)) {
        throw std::invalid_argument("Invalid multipart boundary");
    }
}

void MultipartReader::fail(const std::string& reason) {
    state_ = State::kFailed;
    pending_.clear();
    throw MultipartError(reason);
}

void MultipartReader::feed(std::string_view data) {
    if (state_ == State::kFailed || state_ == State::kDone) {
        return;
    }
    pending_.append(data.data(), data.size());
    while (step()) {
    }
}

bool MultipartReader::step() {
    switch (state_) {
        case State::kPreamble:
            return scan_preamble();
        case State::kHeaders:
            return scan_headers();
        case State::kBody:
            return scan_body();
        case State::kDone:
            pending_.clear();
            return false;
        case State::kFailed:
            return false;
    }
    return false;
}

// A match at `pos` is a delimiter only when followed by "--", or by optional
// transport padding and CRLF. On success `end` is the offset just past it.
MultipartReader::Match MultipartReader::classify(std::size_t pos, std::size_t& end) const {
    std::size_t cursor = pos + delimiter_.size();
    if (pending_.size() < cursor + 2) {
        return Match::kIncomplete;
    }
    if (pending_.compare(cursor, 2, "--") == 0) {
        end = cursor + 2;
        return Match::kClose;
    }
    const auto padding_start = cursor;
    while (cursor < pending_.size() && (pending_[cursor] == ' ' || pending_[cursor] == '\t')) {
        ++cursor;
    }
    if (cursor - padding_start > kMaxPaddingBytes) {
        return Match::kData;
    }
    if (pending_.size() < cursor + 2) {
        return Match::kIncomplete;
    }
    if (pending_.compare(cursor, 2, "\r\n") == 0) {
        end = cursor + 2;
        return Match::kNextPart;
    }
    return Match::kData;
}

bool MultipartReader::enter(Match match, std::size_t end) {
    if (match == Match::kClose) {
        state_ = State::kDone;
        pending_.clear();
        return false;
    }
    pending_.erase(0, end);
    state_ = State::kHeaders;
    return true;
}

bool MultipartReader::scan_preamble() {
    std::size_t from = 0;
    while (true) {
        const auto pos = pending_.find(delimiter_, from);
        if (pos == std::string::npos) {
            const auto keep = delimiter_.size() - 1;
            if (pending_.size() > keep) {
                pending_.erase(0, pending_.size() - keep);
            }
            return false;
        }
        std::size_t end = 0;
        const auto match = classify(pos, end);
        if (match == Match::kData) {
            from = pos + 1;
            continue;
        }
        if (match == Match::kIncomplete) {
            pending_.erase(0, pos);
            return false;
        }
        return enter(match, end);
    }
}

bool MultipartReader::scan_headers() {
    std::size_t block_end = 0;
    if (pending_.compare(0, 2, "\r\n") == 0) {
        block_end = 0;
    } else {
        const auto pos = pending_.find("\r\n\r\n");
        if (pos == std::string::npos) {
            if (pending_.size() > kMaxPartHeaderBytes) {
                fail("Multipart part headers too large");
            }
            return false;
        }
        block_end = pos + 2;
    }
    if (block_end > kMaxPartHeaderBytes) {
        fail("Multipart part headers too large");
    }

    PartHeaders part;
    std::size_t pos = 0;
    while (pos < block_end) {
        const auto line_end = pending_.find("\r\n", pos);
        const std::string_view line(pending_.data() + pos, line_end - pos);
        pos = line_end + 2;
        const auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            fail("Malformed multipart part header");
        }
        part.headers[http::detail::to_lower(http::detail::trim_ows(line.substr(0, colon)))] =
            std::string(http::detail::trim_ows(line.substr(colon + 1)));
    }
    pending_.erase(0, block_end + 2);

    if (const auto it = part.headers.find("content-disposition"); it != part.headers.end()) {
        part.disposition = parse_content_disposition(it->second);
    }
    state_ = State::kBody;
    if (callbacks_.on_part_begin) {
        callbacks_.on_part_begin(part);
    }
    return true;
}

bool MultipartReader::scan_body() {
    std::size_t from = 0;
    while (true) {
        const auto pos = pending_.find(delimiter_, from);
        if (pos == std::string::npos) {
            const auto keep = delimiter_.size() - 1;
            if (pending_.size() > keep) {
                const auto safe = pending_.size() - keep;
                if (callbacks_.on_part_data) {
                    callbacks_.on_part_data(std::string_view(pending_.data(), safe));
                }
                pending_.erase(0, safe);
            }
            return false;
        }
        std::size_t end = 0;
        const auto match = classify(pos, end);
        if (match == Match::kData) {
            from = pos + 1;
            continue;
        }
        if (pos > 0 && callbacks_.on_part_data) {
            callbacks_.on_part_data(std::string_view(pending_.data(), pos));
        }
        if (match == Match::kIncomplete) {
            pending_.erase(0, pos);
            return false;
        }
        if (callbacks_.on_part_end) {
            callbacks_.on_part_end();
        }
        return enter(match, end);
    }
}

}  // namespace filedrop::server
