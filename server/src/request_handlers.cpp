#include "request_handlers.hpp"

#include "filename.hpp"
#include "http_parser.hpp"
#include "json_writer.hpp"
#include "multipart_reader.hpp"
#include "time_format.hpp"
#include "url_codec.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

namespace filedrop::server {

namespace {

constexpr std::string_view kPageHtml = R"html(<!DOCTYPE html>
<html lang="en">
<head>
    <meta charset="UTF-8">
    <meta name="viewport" content="width=device-width, initial-scale=1.0">
    <title>File Upload Server</title>
    <link rel="stylesheet" href="/static/style.css">
</head>
<body>
    <main class="container">
        <h1>File Upload Server</h1>

        <section class="upload-section">
            <h2>Upload File</h2>
            <form id="uploadForm" enctype="multipart/form-data">
                <div class="file-input-container">
                    <input type="file" id="fileInput" name="file" required>
                    <label for="fileInput" class="file-input-label">Choose File</label>
                    <span id="fileName" class="file-name"></span>
                </div>

                <div class="progress-container" id="progressContainer" hidden>
                    <div class="progress-bar"><div class="progress-fill" id="progressFill"></div></div>
                    <span class="progress-text" id="progressText">0%</span>
                </div>

                <button type="submit" id="uploadBtn">Upload File</button>
            </form>
            <div id="uploadStatus" class="upload-status"></div>
        </section>

        <section class="files-section">
            <h2>Uploaded Files</h2>
            <div id="filesList" class="files-list">
                <p class="loading">Loading files...</p>
            </div>
        </section>
    </main>

    <script src="/static/upload.js"></script>
</body>
</html>
)html";

bool starts_with(std::string_view value, std::string_view prefix) {
    return value.substr(0, prefix.size()) == prefix;
}

struct ByteRange {
    std::uint64_t first = 0;
    std::uint64_t last = 0;
};

enum class RangeResult {
    kIgnored,
    kSatisfiable,
    kUnsatisfiable,
};

std::optional<std::uint64_t> parse_digits(std::string_view text) {
    if (text.empty() || text.size() > 19) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (char ch : text) {
        if (ch < '0' || ch > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<std::uint64_t>(ch - '0');
    }
    return value;
}

// Single byte range only; anything else is served as a full response.
RangeResult parse_range(std::string_view header, std::uint64_t size, ByteRange& out) {
    if (!starts_with(header, "bytes=")) {
        return RangeResult::kIgnored;
    }
    const auto spec = http::detail::trim_ows(header.substr(6));
    if (spec.find(',') != std::string_view::npos) {
        return RangeResult::kIgnored;
    }
    const auto dash = spec.find('-');
    if (dash == std::string_view::npos) {
        return RangeResult::kIgnored;
    }
    const auto first_text = spec.substr(0, dash);
    const auto last_text = spec.substr(dash + 1);

    if (first_text.empty()) {
        const auto suffix = parse_digits(last_text);
        if (!suffix) {
            return RangeResult::kIgnored;
        }
        if (*suffix == 0 || size == 0) {
            return RangeResult::kUnsatisfiable;
        }
        out.first = *suffix >= size ? 0 : size - *suffix;
        out.last = size - 1;
        return RangeResult::kSatisfiable;
    }

    const auto first = parse_digits(first_text);
    if (!first) {
        return RangeResult::kIgnored;
    }
    std::uint64_t last = size == 0 ? 0 : size - 1;
    if (!last_text.empty()) {
        const auto parsed = parse_digits(last_text);
        if (!parsed || *parsed < *first) {
            return RangeResult::kIgnored;
        }
        last = std::min(*parsed, last);
    }
    if (*first >= size) {
        return RangeResult::kUnsatisfiable;
    }
    out.first = *first;
    out.last = last;
    return RangeResult::kSatisfiable;
}

std::string quote_filename(const std::string& name) {
    std::string quoted = "\"";
    bool ascii = true;
    for (char ch : name) {
        if (ch == '"' || ch == '\\') {
            quoted.push_back('\\');
        }
        if (static_cast<unsigned char>(ch) >= 0x80) {
            ascii = false;
        }
        quoted.push_back(ch);
    }
    quoted.push_back('"');
    if (!ascii) {
        quoted.append("; filename*=UTF-8''");
        quoted.append(util::percent_encode_segment(name));
    }
    return quoted;
}

http::Response stream_file(std::unique_ptr<FileReader> reader, const std::string& content_type,
                           const http::Request& request) {
    const auto size = reader->size();
    http::Response response;
    response.set_header("Content-Type", content_type);
    response.set_header("Last-Modified", util::format_http_date(reader->modified()));
    response.set_header("Accept-Ranges", "bytes");

    ByteRange range;
    switch (parse_range(http::header_value(request, "range"), size, range)) {
        case RangeResult::kUnsatisfiable:
            response.status = http::Status::kRangeNotSatisfiable;
            response.set_header("Content-Range", "bytes */" + std::to_string(size));
            return response;
        case RangeResult::kSatisfiable:
            response.status = http::Status::kPartialContent;
            response.set_header("Content-Range", "bytes " + std::to_string(range.first) + "-" +
                                                     std::to_string(range.last) + "/" + std::to_string(size));
            response.stream_offset = range.first;
            response.stream_length = range.last - range.first + 1;
            break;
        case RangeResult::kIgnored:
            response.status = http::Status::kOk;
            response.stream_offset = 0;
            response.stream_length = size;
            break;
    }
    response.stream = std::shared_ptr<FileReader>(std::move(reader));
    return response;
}

}  // namespace

Route route_for(std::string_view path) {
    if (path == "/") {
        return Route::kPage;
    }
    if (path == "/upload") {
        return Route::kUpload;
    }
    if (path == "/files") {
        return Route::kListFiles;
    }
    if (starts_with(path, kDownloadPrefix)) {
        return Route::kDownload;
    }
    if (starts_with(path, kStaticPrefix)) {
        return Route::kStatic;
    }
    return Route::kNotFound;
}

bool is_upload_request(const http::Request& request) {
    return request.method == "POST" && route_for(request.path) == Route::kUpload;
}

RequestHandlers::RequestHandlers(const FileStore& uploads, const StaticFiles& assets, Logger& logger)
    : uploads_(uploads), assets_(assets), logger_(logger) {}

http::Response RequestHandlers::handle(const http::Request& request) const {
    switch (route_for(request.path)) {
        case Route::kPage:
            return page(request);
        case Route::kUpload:
            if (request.method != "POST") {
                return http::make_method_not_allowed("POST");
            }
            throw std::logic_error("POST /upload must be streamed through begin_upload()");
        case Route::kListFiles:
            return list_files(request);
        case Route::kDownload:
            return download(request);
        case Route::kStatic:
            return static_asset(request);
        case Route::kNotFound:
            break;
    }
    return http::make_not_found();
}

RequestHandlers::UploadStart RequestHandlers::begin_upload(const http::Request& request) const {
    if (request.method != "POST") {
        return http::make_method_not_allowed("POST");
    }
    const auto boundary = extract_boundary(http::header_value(request, "content-type"));
    if (!boundary) {
        logger_.warn("Parse multipart form error: missing or invalid multipart/form-data content type");
        return http::make_text(http::Status::kBadRequest, "Failed to parse multipart form");
    }
    return std::make_shared<UploadSession>(uploads_, logger_, *boundary);
}

http::Response RequestHandlers::page(const http::Request& request) const {
    if (request.path != "/") {
        return http::make_not_found();
    }
    if (request.method != "GET") {
        return http::make_method_not_allowed("GET");
    }
    http::Response response;
    response.set_header("Content-Type", "text/html; charset=utf-8");
    response.body = std::string(kPageHtml);
    return response;
}

http::Response RequestHandlers::list_files(const http::Request& request) const {
    if (request.method != "GET") {
        return http::make_method_not_allowed("GET");
    }
    std::vector<FileRecord> records;
    try {
        records = uploads_.list([this](const std::string& name, const std::string& reason) {
            logger_.warn("Get file info error for " + name + ": " + reason);
        });
    } catch (const std::exception& ex) {
        logger_.error(std::string("Read directory error: ") + ex.what());
        return http::make_text(http::Status::kInternalServerError, "Failed to read upload directory");
    }

    util::JsonWriter json;
    json.begin_array();
    for (const auto& record : records) {
        json.begin_object()
            .key("name").value(record.name)
            .key("size").value(record.size)
            .key("modTime").value(util::format_rfc3339(record.modified))
            .key("downloadUrl").value(std::string(kDownloadPrefix) + util::percent_encode_segment(record.name))
            .end_object();
    }
    json.end_array();
    return http::make_json(http::Status::kOk, json.str());
}

http::Response RequestHandlers::download(const http::Request& request) const {
    if (request.method != "GET") {
        return http::make_method_not_allowed("GET");
    }
    const auto decoded = util::percent_decode(std::string_view(request.path).substr(kDownloadPrefix.size()));
    const auto name = decoded ? sanitize_filename(*decoded) : std::nullopt;
    if (!name) {
        return http::make_text(http::Status::kBadRequest, "Invalid filename");
    }

    std::unique_ptr<FileReader> reader;
    try {
        reader = uploads_.open(*name);
    } catch (const std::exception& ex) {
        logger_.error("Open file error for " + *name + ": " + ex.what());
        return http::make_text(http::Status::kInternalServerError, "Failed to read file");
    }
    if (!reader) {
        return http::make_not_found();
    }

    auto response = stream_file(std::move(reader), "application/octet-stream", request);
    response.set_header("Content-Disposition", "attachment; filename=" + quote_filename(*name));
    return response;
}

http::Response RequestHandlers::static_asset(const http::Request& request) const {
    if (request.method != "GET") {
        return http::make_method_not_allowed("GET");
    }
    const auto relative = util::percent_decode(std::string_view(request.path).substr(kStaticPrefix.size()));
    if (!relative) {
        return http::make_text(http::Status::kBadRequest, "Invalid path");
    }

    std::unique_ptr<FileReader> reader;
    try {
        reader = assets_.open(*relative);
    } catch (const std::invalid_argument&) {
        return http::make_text(http::Status::kBadRequest, "Invalid path");
    } catch (const std::exception& ex) {
        logger_.error("Static file error for " + *relative + ": " + ex.what());
        return http::make_text(http::Status::kInternalServerError, "Failed to read file");
    }
    if (!reader) {
        return http::make_not_found();
    }
    return stream_file(std::move(reader), StaticFiles::content_type_for(*relative), request);
}

}  // namespace filedrop::server
