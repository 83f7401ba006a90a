#include "config_loader.hpp"

#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace filedrop::server {

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::size_t parse_size(const std::string& key, const std::string& value) {
    if (value.empty() || value[0] < '0' || value[0] > '9') {
        throw std::runtime_error("Invalid value for " + key + ": '" + value + "'");
    }
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoull(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid value for " + key + ": '" + value + "'");
    }
}

}  // namespace

ServerConfig load_config(const std::string& path) {
    ServerConfig config;
    std::ifstream stream(path);
    if (!stream.is_open()) {
        std::cerr << "[WARN] Unable to open config file " << path
                  << ", falling back to defaults" << std::endl;
        return config;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const auto equals_pos = line.find('=');
        if (equals_pos == std::string::npos) {
            continue;
        }
        const std::string key = trim(line.substr(0, equals_pos));
        const std::string value = trim(line.substr(equals_pos + 1));

        if (key == "listen_address") {
            config.listen_address = value;
        } else if (key == "listen_port") {
            const auto port = parse_size(key, value);
            if (port > std::numeric_limits<uint16_t>::max()) {
                throw std::runtime_error("Invalid value for listen_port: '" + value + "'");
            }
            config.listen_port = static_cast<uint16_t>(port);
        } else if (key == "upload_dir") {
            config.upload_dir = value;
        } else if (key == "static_dir") {
            config.static_dir = value;
        } else if (key == "log_file") {
            config.log_file = value;
        } else if (key == "max_clients") {
            config.max_clients = parse_size(key, value);
        } else if (key == "worker_threads") {
            config.worker_threads = parse_size(key, value);
        } else if (key == "io_chunk_bytes") {
            config.io_chunk_bytes = parse_size(key, value);
        } else if (key == "max_header_bytes") {
            config.max_header_bytes = parse_size(key, value);
        } else {
            std::cerr << "[WARN] Ignoring unknown config key '" << key << "' in " << path << std::endl;
        }
    }

    if (config.worker_threads == 0 || config.io_chunk_bytes == 0 || config.max_header_bytes == 0) {
        throw std::runtime_error("worker_threads, io_chunk_bytes and max_header_bytes must be > 0");
    }
    return config;
}

}  // namespace filedrop::server
