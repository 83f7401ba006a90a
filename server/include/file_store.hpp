#pragma once

#include "http_message.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace filedrop::server {

struct FileRecord {
    std::string name;
    std::uint64_t size = 0;
    std::chrono::system_clock::time_point modified;
};

// Read-only handle on a regular file. The descriptor stays valid even if the
// name is replaced or unlinked while the handle is open.
class FileReader : public http::BodyReader {
public:
    // Returns nullptr when `path` does not name a regular file.
    static std::unique_ptr<FileReader> open(const std::filesystem::path& path);

    ~FileReader() override;
    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;

    std::size_t read(std::uint64_t offset, char* out, std::size_t length) override;

    std::uint64_t size() const { return size_; }
    std::chrono::system_clock::time_point modified() const { return modified_; }

private:
    FileReader(int fd, std::uint64_t size, std::chrono::system_clock::time_point modified);

    int fd_ = -1;
    std::uint64_t size_ = 0;
    std::chrono::system_clock::time_point modified_;
};

// An upload being written to the staging directory. Destroying it without
// commit() removes the staging file.
class StagedUpload {
public:
    StagedUpload(int fd, std::filesystem::path temp_path, std::filesystem::path final_path);
    ~StagedUpload();
    StagedUpload(const StagedUpload&) = delete;
    StagedUpload& operator=(const StagedUpload&) = delete;

    bool write(std::string_view data);
    // Flushes and atomically renames the staging file over the final name.
    void commit();
    // Best effort. Returns false if the staging file could not be removed.
    bool discard();

    std::uint64_t bytes_written() const { return written_; }
    const std::filesystem::path& temp_path() const { return temp_path_; }

private:
    void close_fd();

    int fd_ = -1;
    std::filesystem::path temp_path_;
    std::filesystem::path final_path_;
    std::uint64_t written_ = 0;
    bool committed_ = false;
    bool discarded_ = false;
};

// Flat directory of uploaded files. Every name passed in must already be
// sanitized; the store re-checks containment and throws std::invalid_argument
// otherwise. I/O failures surface as std::runtime_error or
// std::filesystem::filesystem_error.
class FileStore {
public:
    static constexpr std::string_view kStagingDir = ".partial";

    explicit FileStore(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path resolve(const std::string& name) const;

    // Names the store keeps for itself and never accepts as an upload target.
    static bool is_reserved(std::string_view name) { return name == kStagingDir; }

    using SkipHandler = std::function<void(const std::string& name, const std::string& reason)>;

    // Regular files directly under the root, in directory order. Entries that
    // cannot be stat'ed are reported through `on_skip` and left out.
    std::vector<FileRecord> list(const SkipHandler& on_skip = {}) const;
    std::unique_ptr<FileReader> open(const std::string& name) const;
    std::unique_ptr<StagedUpload> begin_upload(const std::string& name) const;

    // Removes staging files left behind by an earlier process.
    std::size_t purge_staging() const;

private:
    std::filesystem::path staging_dir() const;
    std::string random_token() const;

    std::filesystem::path root_;
};

}  // namespace filedrop::server
