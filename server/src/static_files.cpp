#include "static_files.hpp"

#include "http_parser.hpp"

#include <stdexcept>
#include <unordered_map>

namespace filedrop::server {

StaticFiles::StaticFiles(std::filesystem::path root) : root_(std::move(root)) {
    std::filesystem::create_directories(root_);
}

std::unique_ptr<FileReader> StaticFiles::open(std::string_view relative) const {
    std::filesystem::path target = root_;
    bool any = false;
    std::size_t start = 0;
    while (start <= relative.size()) {
        auto end = relative.find('/', start);
        if (end == std::string_view::npos) {
            end = relative.size();
        }
        const auto part = relative.substr(start, end - start);
        start = end + 1;
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == ".." || part.find('\0') != std::string_view::npos || part.find('\\') != std::string_view::npos) {
            throw std::invalid_argument("Invalid static path");
        }
        target /= std::string(part);
        any = true;
    }
    if (!any) {
        return nullptr;
    }
    return FileReader::open(target);
}

std::string StaticFiles::content_type_for(std::string_view name) {
    static const std::unordered_map<std::string, std::string> kTypes = {
        {".html", "text/html; charset=utf-8"},
        {".htm", "text/html; charset=utf-8"},
        {".css", "text/css; charset=utf-8"},
        {".js", "text/javascript; charset=utf-8"},
        {".json", "application/json"},
        {".svg", "image/svg+xml"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".ico", "image/x-icon"},
        {".txt", "text/plain; charset=utf-8"},
        {".woff2", "font/woff2"},
    };
    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos || name.find('/', dot) != std::string_view::npos) {
        return "application/octet-stream";
    }
    const auto it = kTypes.find(http::detail::to_lower(name.substr(dot)));
    return it == kTypes.end() ? "application/octet-stream" : it->second;
}

}  // namespace filedrop::server
