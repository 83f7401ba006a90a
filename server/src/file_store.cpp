#include "file_store.hpp"

#include "filename.hpp"

#include <fcntl.h>
#include <openssl/rand.h>
#include <sys/stat.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>

namespace filedrop::server {

namespace {

std::string errno_message(const std::string& what, const std::filesystem::path& path) {
    return what + " " + path.string() + ": " + std::strerror(errno);
}

std::chrono::system_clock::time_point to_time_point(const struct timespec& ts) {
    const auto since_epoch = std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
}

std::chrono::system_clock::time_point to_system_time(std::filesystem::file_time_type ftime) {
    const auto sys_time = decltype(ftime)::clock::to_sys(ftime);
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(sys_time);
}

}  // namespace

// FileReader

FileReader::FileReader(int fd, std::uint64_t size, std::chrono::system_clock::time_point modified)
    : fd_(fd), size_(size), modified_(modified) {}

FileReader::~FileReader() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

std::unique_ptr<FileReader> FileReader::open(const std::filesystem::path& path) {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            return nullptr;
        }
        throw std::runtime_error(errno_message("Unable to open", path));
    }
    struct stat info {};
    if (::fstat(fd, &info) != 0) {
        const auto message = errno_message("Unable to stat", path);
        ::close(fd);
        throw std::runtime_error(message);
    }
    if (!S_ISREG(info.st_mode)) {
        ::close(fd);
        return nullptr;
    }
    return std::unique_ptr<FileReader>(
        new FileReader(fd, static_cast<std::uint64_t>(info.st_size), to_time_point(info.st_mtim)));
}

std::size_t FileReader::read(std::uint64_t offset, char* out, std::size_t length) {
    while (true) {
        const ssize_t got = ::pread(fd_, out, length, static_cast<off_t>(offset));
        if (got >= 0) {
            return static_cast<std::size_t>(got);
        }
        if (errno != EINTR) {
            throw std::runtime_error(std::string("pread failed: ") + std::strerror(errno));
        }
    }
}

// StagedUpload

StagedUpload::StagedUpload(int fd, std::filesystem::path temp_path, std::filesystem::path final_path)
    : fd_(fd), temp_path_(std::move(temp_path)), final_path_(std::move(final_path)) {}

StagedUpload::~StagedUpload() {
    if (!committed_ && !discarded_) {
        discard();
    }
}

void StagedUpload::close_fd() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool StagedUpload::write(std::string_view data) {
    if (fd_ < 0) {
        return false;
    }
    std::size_t done = 0;
    while (done < data.size()) {
        const ssize_t wrote = ::write(fd_, data.data() + done, data.size() - done);
        if (wrote < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        done += static_cast<std::size_t>(wrote);
    }
    written_ += data.size();
    return true;
}

void StagedUpload::commit() {
    if (fd_ < 0) {
        throw std::runtime_error("Staged upload is no longer open: " + temp_path_.string());
    }
    if (::fsync(fd_) != 0) {
        throw std::runtime_error(errno_message("fsync failed for", temp_path_));
    }
    const int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        throw std::runtime_error(errno_message("close failed for", temp_path_));
    }
    std::filesystem::rename(temp_path_, final_path_);
    committed_ = true;
}

bool StagedUpload::discard() {
    close_fd();
    discarded_ = true;
    std::error_code ec;
    std::filesystem::remove(temp_path_, ec);
    return !ec;
}

// FileStore

FileStore::FileStore(std::filesystem::path root) : root_(std::move(root)) {
    std::filesystem::create_directories(root_);
    std::filesystem::create_directories(staging_dir());
}

std::filesystem::path FileStore::staging_dir() const {
    return root_ / std::string(kStagingDir);
}

std::filesystem::path FileStore::resolve(const std::string& name) const {
    if (!is_safe_filename(name)) {
        throw std::invalid_argument("Unsafe file name: " + name);
    }
    auto target = root_ / name;
    if (target.filename().string() != name) {
        throw std::invalid_argument("Path traversal detected: " + name);
    }
    return target;
}

std::vector<FileRecord> FileStore::list(const SkipHandler& on_skip) const {
    std::vector<FileRecord> records;
    for (const auto& entry : std::filesystem::directory_iterator(root_)) {
        const auto name = entry.path().filename().string();
        std::error_code ec;
        const bool regular = entry.is_regular_file(ec);
        if (ec) {
            if (on_skip) {
                on_skip(name, ec.message());
            }
            continue;
        }
        if (!regular) {
            continue;
        }
        FileRecord record;
        record.name = name;
        record.size = entry.file_size(ec);
        if (!ec) {
            const auto ftime = entry.last_write_time(ec);
            if (!ec) {
                record.modified = to_system_time(ftime);
            }
        }
        if (ec) {
            if (on_skip) {
                on_skip(name, ec.message());
            }
            continue;
        }
        records.push_back(std::move(record));
    }
    return records;
}

std::unique_ptr<FileReader> FileStore::open(const std::string& name) const {
    return FileReader::open(resolve(name));
}

std::unique_ptr<StagedUpload> FileStore::begin_upload(const std::string& name) const {
    if (is_reserved(name)) {
        throw std::invalid_argument("Reserved file name: " + name);
    }
    auto final_path = resolve(name);
    auto temp_path = staging_dir() / (random_token() + ".part");
    const int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw std::runtime_error(errno_message("Unable to create staging file", temp_path));
    }
    return std::make_unique<StagedUpload>(fd, std::move(temp_path), std::move(final_path));
}

std::size_t FileStore::purge_staging() const {
    std::size_t removed = 0;
    for (const auto& entry : std::filesystem::directory_iterator(staging_dir())) {
        std::error_code ec;
        if (entry.is_regular_file(ec) && std::filesystem::remove(entry.path(), ec)) {
            ++removed;
        }
    }
    return removed;
}

std::string FileStore::random_token() const {
    std::array<unsigned char, 8> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    static constexpr char kHex[] = "0123456789abcdef";
    std::string token;
    token.reserve(bytes.size() * 2);
    for (unsigned char byte : bytes) {
        token.push_back(kHex[byte >> 4]);
        token.push_back(kHex[byte & 0x0F]);
    }
    return token;
}

}  // namespace filedrop::server
