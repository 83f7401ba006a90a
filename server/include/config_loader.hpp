#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace filedrop::server {

struct ServerConfig {
    std::string listen_address = "0.0.0.0";
    uint16_t listen_port = 8080;
    std::string upload_dir = "./uploaded";
    std::string static_dir = "./static";
    std::string log_file = "./data/server.log";
    std::size_t max_clients = 512;
    std::size_t worker_threads = 4;
    std::size_t io_chunk_bytes = 64 * 1024;
    std::size_t max_header_bytes = 64 * 1024;
};

ServerConfig load_config(const std::string& path);

}  // namespace filedrop::server
