#pragma once

#include "file_store.hpp"
#include "http_message.hpp"
#include "logger.hpp"
#include "multipart_reader.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace filedrop::server {

// Receives the body of one POST /upload request. The first part named "file"
// that carries a filename is streamed into a staging file; every other part is
// read and dropped. The first error wins and the rest of the body is drained.
class UploadSession {
public:
    static constexpr std::string_view kFieldName = "file";

    UploadSession(const FileStore& store, Logger& logger, std::string boundary);

    UploadSession(const UploadSession&) = delete;
    UploadSession& operator=(const UploadSession&) = delete;

    void consume(std::string_view data);

    // Call once after the whole body has been consumed.
    http::Response finish();

    std::uint64_t bytes_received() const { return received_; }

private:
    void on_part_begin(const PartHeaders& part);
    void on_part_data(std::string_view data);
    void on_part_end();

    void reject(http::Response response);
    void drop_staged();

    const FileStore& store_;
    Logger& logger_;
    MultipartReader reader_;

    std::unique_ptr<StagedUpload> staged_;
    std::string filename_;
    bool in_file_part_ = false;
    bool file_complete_ = false;
    std::uint64_t received_ = 0;
    std::optional<http::Response> error_;
};

}  // namespace filedrop::server
