#pragma once

#include "file_store.hpp"
#include "http_message.hpp"
#include "logger.hpp"
#include "static_files.hpp"
#include "upload_session.hpp"

#include <memory>
#include <string_view>
#include <variant>

namespace filedrop::server {

enum class Route {
    kPage,
    kUpload,
    kListFiles,
    kDownload,
    kStatic,
    kNotFound,
};

inline constexpr std::string_view kDownloadPrefix = "/download/";
inline constexpr std::string_view kStaticPrefix = "/static/";

Route route_for(std::string_view path);

// True for the one request whose body is streamed into an UploadSession.
bool is_upload_request(const http::Request& request);

// The HTTP endpoints. Every method is stateless apart from the store it reads
// or writes, so they may run concurrently on worker threads.
class RequestHandlers {
public:
    using UploadStart = std::variant<std::shared_ptr<UploadSession>, http::Response>;

    RequestHandlers(const FileStore& uploads, const StaticFiles& assets, Logger& logger);

    // Any request except a POST /upload body, which goes through begin_upload().
    http::Response handle(const http::Request& request) const;

    // POST /upload: a session to feed the body into, or an immediate error.
    UploadStart begin_upload(const http::Request& request) const;

    http::Response page(const http::Request& request) const;
    http::Response list_files(const http::Request& request) const;
    http::Response download(const http::Request& request) const;
    http::Response static_asset(const http::Request& request) const;

private:
    const FileStore& uploads_;
    const StaticFiles& assets_;
    Logger& logger_;
};

}  // namespace filedrop::server
