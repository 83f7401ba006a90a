#pragma once

#include "file_store.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace filedrop::server {

// Read-only view of the front-end asset directory.
class StaticFiles {
public:
    explicit StaticFiles(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    // `relative` is a decoded URL path below the root. Throws
    // std::invalid_argument when it tries to leave the root; returns nullptr
    // when there is no regular file there.
    std::unique_ptr<FileReader> open(std::string_view relative) const;

    static std::string content_type_for(std::string_view name);

private:
    std::filesystem::path root_;
};

}  // namespace filedrop::server
