#include "upload_session.hpp"

#include "filename.hpp"
#include "json_writer.hpp"

#include <exception>
#include <utility>

namespace filedrop::server {

UploadSession::UploadSession(const FileStore& store, Logger& logger, std::string boundary)
    : store_(store),
      logger_(logger),
      reader_(std::move(boundary),
              MultipartReader::Callbacks{
                  [this](const PartHeaders& part) { on_part_begin(part); },
                  [this](std::string_view data) { on_part_data(data); },
                  [this]() { on_part_end(); },
              }) {}

void UploadSession::reject(http::Response response) {
    if (!error_) {
        error_ = std::move(response);
    }
    in_file_part_ = false;
    drop_staged();
}

void UploadSession::drop_staged() {
    if (!staged_) {
        return;
    }
    if (!staged_->discard()) {
        logger_.warn("Unable to remove staging file " + staged_->temp_path().string());
    }
    staged_.reset();
}

void UploadSession::consume(std::string_view data) {
    received_ += data.size();
    if (reader_.failed() || reader_.complete()) {
        return;
    }
    try {
        reader_.feed(data);
    } catch (const MultipartError& ex) {
        logger_.warn(std::string("Parse multipart form error: ") + ex.what());
        reject(http::make_text(http::Status::kBadRequest, "Failed to parse multipart form"));
    }
}

void UploadSession::on_part_begin(const PartHeaders& part) {
    in_file_part_ = false;
    if (error_ || staged_ || file_complete_) {
        return;
    }
    const auto& disposition = part.disposition;
    if (disposition.name != kFieldName || !disposition.filename || disposition.filename->empty()) {
        return;
    }

    const auto name = sanitize_filename(*disposition.filename);
    if (!name || FileStore::is_reserved(*name)) {
        logger_.warn("Rejected upload filename \"" + util::escape_json(*disposition.filename) + "\"");
        reject(http::make_text(http::Status::kBadRequest, "Invalid filename"));
        return;
    }
    try {
        staged_ = store_.begin_upload(*name);
    } catch (const std::exception& ex) {
        logger_.error(std::string("Create file error: ") + ex.what());
        reject(http::make_text(http::Status::kInternalServerError, "Failed to create destination file"));
        return;
    }
    filename_ = *name;
    in_file_part_ = true;
}

void UploadSession::on_part_data(std::string_view data) {
    if (!in_file_part_ || !staged_) {
        return;
    }
    if (!staged_->write(data)) {
        logger_.error("Copy file error: write to " + staged_->temp_path().string() + " failed");
        reject(http::make_text(http::Status::kInternalServerError, "Failed to save file"));
    }
}

void UploadSession::on_part_end() {
    if (in_file_part_) {
        in_file_part_ = false;
        file_complete_ = true;
    }
}

http::Response UploadSession::finish() {
    if (error_) {
        drop_staged();
        return *error_;
    }
    if (!reader_.complete()) {
        logger_.warn("Parse multipart form error: body ended before the closing boundary");
        drop_staged();
        return http::make_text(http::Status::kBadRequest, "Failed to parse multipart form");
    }
    if (!file_complete_ || !staged_) {
        drop_staged();
        return http::make_text(http::Status::kBadRequest, "Failed to get file from form");
    }

    const auto size = staged_->bytes_written();
    try {
        staged_->commit();
    } catch (const std::exception& ex) {
        logger_.error(std::string("Copy file error: ") + ex.what());
        drop_staged();
        return http::make_text(http::Status::kInternalServerError, "Failed to save file");
    }
    staged_.reset();
    logger_.info("File uploaded successfully: " + filename_ + " (" + std::to_string(size) + " bytes)");

    util::JsonWriter json;
    json.begin_object()
        .key("success").value(true)
        .key("filename").value(filename_)
        .key("size").value(size)
        .key("message").value("File uploaded successfully")
        .end_object();
    return http::make_json(http::Status::kOk, json.str());
}

}  // namespace filedrop::server
