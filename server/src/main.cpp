#include "config_loader.hpp"
#include "file_store.hpp"
#include "http_server.hpp"
#include "logger.hpp"
#include "request_handlers.hpp"
#include "static_files.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {
std::atomic<bool> g_should_run{true};

void handle_signal(int) {
    g_should_run = false;
}
}  // namespace

int main(int argc, char* argv[]) {
    const std::string config_path = argc > 1 ? argv[1] : "server/config/server.conf";

    try {
        auto config = filedrop::server::load_config(config_path);
        filedrop::server::Logger logger(config.log_file);

        filedrop::server::FileStore uploads(config.upload_dir);
        if (const auto purged = uploads.purge_staging(); purged > 0) {
            logger.warn("Removed " + std::to_string(purged) + " unfinished upload(s) from a previous run");
        }
        filedrop::server::StaticFiles assets(config.static_dir);
        filedrop::server::RequestHandlers handlers(uploads, assets, logger);

        std::signal(SIGPIPE, SIG_IGN);
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        filedrop::server::HttpServer server(config, handlers, logger);
        server.start();

        std::cout << "File drop server started on " << config.listen_address << ":" << server.port() << std::endl;
        std::cout << "Upload directory: " << uploads.root().string() << std::endl;
        std::cout << "Static directory: " << config.static_dir << std::endl;
        std::cout << "Press Ctrl+C to stop." << std::endl;
        while (g_should_run.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
        }

        std::cout << "Stopping server..." << std::endl;
        server.stop();
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
