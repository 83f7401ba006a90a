#pragma once

#include "config_loader.hpp"
#include "http_message.hpp"
#include "logger.hpp"
#include "request_handlers.hpp"
#include "task_executor.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace filedrop::server {

// Single-threaded epoll reactor speaking HTTP/1.1. Request heads and bodies
// are read on the reactor thread; upload bodies are written to the store as
// they arrive. Complete requests run on the worker pool and their responses
// are handed back through an eventfd-signalled queue.
class HttpServer {
public:
    HttpServer(ServerConfig config, const RequestHandlers& handlers, Logger& logger);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void start();
    void stop();

    // Port actually bound; differs from the configured one when that was 0.
    uint16_t port() const { return bound_port_; }

private:
    struct Connection;
    struct PendingResponse {
        int fd;
        std::uint64_t connection_id;
        http::Response response;
    };

    void reactor_loop();
    void handle_accept();
    void handle_fd_event(int fd, uint32_t events);
    void handle_peer_eof(Connection& conn);

    void service(Connection& conn);
    void process_inbound(Connection& conn);
    void dispatch(Connection& conn);
    void reject_protocol_error(Connection& conn, const http::HttpError& error);
    void submit_request(Connection& conn);
    void submit_upload_finish(Connection& conn);
    void queue_response(Connection& conn, http::Response response);
    bool flush_outbound(Connection& conn);
    void update_interest(Connection& conn);

    void drain_async_queue();
    void schedule_response(int fd, std::uint64_t connection_id, http::Response response);
    void close_connection(int fd);

    ServerConfig config_;
    const RequestHandlers& handlers_;
    Logger& logger_;

    int server_fd_ = -1;
    int epoll_fd_ = -1;
    int notify_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::size_t read_limit_ = 0;
    std::atomic<bool> running_{false};
    std::thread reactor_thread_;
    TaskExecutor task_executor_;

    std::uint64_t next_connection_id_ = 1;
    std::unordered_map<int, std::unique_ptr<Connection>> connections_;
    std::deque<std::pair<int, uint32_t>> ready_queue_;
    std::mutex async_mutex_;
    std::vector<PendingResponse> async_responses_;
};

}  // namespace filedrop::server
