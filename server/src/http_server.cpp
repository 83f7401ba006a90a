#include "http_server.hpp"

#include "http_parser.hpp"
#include "socket_utils.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <variant>

namespace filedrop::server {

namespace {

constexpr int kMaxEvents = 128;
constexpr std::size_t kRecvChunk = 64 * 1024;
// Reads per readiness event. Interest is level-triggered, so a socket that
// still has data is reported again by the next epoll_wait.
constexpr int kMaxReadsPerEvent = 4;

std::string describe(const http::Request* request) {
    if (request == nullptr) {
        return "-";
    }
    return request->method + " " + request->target;
}

}  // namespace

struct HttpServer::Connection {
    int fd = -1;
    std::uint64_t id = 0;
    std::string peer;
    uint32_t events = 0;

    std::string inbound;

    // Request currently being served. Reset once its body has been read and
    // its response written.
    std::optional<http::Request> request;
    std::uint64_t body_remaining = 0;
    std::shared_ptr<UploadSession> upload;
    bool awaiting_response = false;
    bool keep_alive = true;
    // No further input is accepted (protocol error or peer EOF).
    bool halted = false;

    std::string outbound;
    std::size_t outbound_offset = 0;
    std::shared_ptr<http::BodyReader> stream;
    std::uint64_t stream_offset = 0;
    std::uint64_t stream_remaining = 0;
    bool writing = false;

    bool should_close = false;
};

HttpServer::HttpServer(ServerConfig config, const RequestHandlers& handlers, Logger& logger)
    : config_(std::move(config)), handlers_(handlers), logger_(logger) {
    read_limit_ = config_.max_header_bytes + config_.io_chunk_bytes;
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (running_) {
        return;
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        throw std::runtime_error("Failed to create socket");
    }
    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.listen_port);
    if (::inet_pton(AF_INET, config_.listen_address.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid listen address: " + config_.listen_address);
    }
    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw std::runtime_error("Failed to bind server socket: " + std::string(std::strerror(errno)));
    }
    if (::listen(server_fd_, static_cast<int>(config_.max_clients)) < 0) {
        throw std::runtime_error("Failed to listen on server socket");
    }
    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    }
    if (net::set_non_blocking(server_fd_) < 0) {
        throw std::runtime_error("Failed to make server socket non-blocking");
    }

    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        throw std::runtime_error("Failed to create epoll");
    }
    notify_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (notify_fd_ < 0) {
        throw std::runtime_error("Failed to create eventfd");
    }

    epoll_event server_event{};
    server_event.data.fd = server_fd_;
    server_event.events = EPOLLIN;
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, server_fd_, &server_event);

    epoll_event notify_event{};
    notify_event.data.fd = notify_fd_;
    notify_event.events = EPOLLIN;
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, notify_fd_, &notify_event);

    task_executor_.start(config_.worker_threads,
                         [this](std::string_view what) { logger_.error("Worker task failed: " + std::string(what)); });

    running_ = true;
    reactor_thread_ = std::thread(&HttpServer::reactor_loop, this);
    logger_.info("Listening on http://" + config_.listen_address + ":" + std::to_string(bound_port_));
}

void HttpServer::stop() {
    if (running_.exchange(false)) {
        uint64_t value = 1;
        [[maybe_unused]] auto ignored = ::write(notify_fd_, &value, sizeof(value));
    }
    if (reactor_thread_.joinable()) {
        reactor_thread_.join();
    }
    task_executor_.shutdown();

    for (const auto& entry : connections_) {
        ::close(entry.first);
    }
    connections_.clear();
    ready_queue_.clear();
    {
        std::lock_guard<std::mutex> lock(async_mutex_);
        async_responses_.clear();
    }

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
    if (epoll_fd_ >= 0) {
        ::close(epoll_fd_);
        epoll_fd_ = -1;
    }
    if (notify_fd_ >= 0) {
        ::close(notify_fd_);
        notify_fd_ = -1;
    }
}

void HttpServer::reactor_loop() {
    std::array<epoll_event, kMaxEvents> events{};

    while (running_) {
        int ready = ::epoll_wait(epoll_fd_, events.data(), static_cast<int>(events.size()), 500);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            logger_.error("epoll_wait failed: " + std::string(std::strerror(errno)));
            break;
        }
        for (int i = 0; i < ready; ++i) {
            const auto& event = events[i];
            if (event.data.fd == server_fd_) {
                handle_accept();
                continue;
            }
            if (event.data.fd == notify_fd_) {
                uint64_t tmp;
                [[maybe_unused]] auto ignored = ::read(notify_fd_, &tmp, sizeof(tmp));
                drain_async_queue();
                continue;
            }
            ready_queue_.emplace_back(event.data.fd, event.events);
        }

        while (!ready_queue_.empty()) {
            auto [fd, mask] = ready_queue_.front();
            ready_queue_.pop_front();
            handle_fd_event(fd, mask);
        }
    }
}

void HttpServer::handle_accept() {
    while (true) {
        sockaddr_in client_addr{};
        socklen_t len = sizeof(client_addr);
        int client_fd = ::accept4(server_fd_, reinterpret_cast<sockaddr*>(&client_addr), &len,
                                  SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            logger_.warn("accept failed: " + std::string(std::strerror(errno)));
            break;
        }

        std::ostringstream peer;
        peer << inet_ntoa(client_addr.sin_addr) << ":" << ntohs(client_addr.sin_port);

        if (connections_.size() >= config_.max_clients) {
            logger_.warn("Rejecting connection from " + peer.str() + ": max_clients reached");
            ::close(client_fd);
            continue;
        }
        net::set_socket_keepalive(client_fd);
        net::set_no_delay(client_fd);

        epoll_event event{};
        event.data.fd = client_fd;
        event.events = EPOLLIN | EPOLLRDHUP;
        if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &event) < 0) {
            ::close(client_fd);
            continue;
        }

        auto conn = std::make_unique<Connection>();
        conn->fd = client_fd;
        conn->id = next_connection_id_++;
        conn->peer = peer.str();
        conn->events = event.events;
        connections_.emplace(client_fd, std::move(conn));
        logger_.info("Accepted connection from " + peer.str());
    }
}

void HttpServer::handle_fd_event(int fd, uint32_t events) {
    auto it = connections_.find(fd);
    if (it == connections_.end()) {
        return;
    }
    auto& conn = *it->second;

    if (events & (EPOLLHUP | EPOLLERR)) {
        close_connection(fd);
        return;
    }

    if ((events & (EPOLLIN | EPOLLRDHUP)) && !conn.halted) {
        std::array<char, kRecvChunk> buf;
        int reads = 0;
        while (!conn.should_close && !conn.halted && reads < kMaxReadsPerEvent) {
            const bool body_pending = conn.request && conn.body_remaining > 0;
            if (!body_pending && conn.inbound.size() >= read_limit_) {
                break;
            }
            const ssize_t received = ::recv(fd, buf.data(), buf.size(), 0);
            if (received < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    break;
                }
                conn.should_close = true;
                break;
            }
            if (received == 0) {
                handle_peer_eof(conn);
                break;
            }
            ++reads;
            conn.inbound.append(buf.data(), static_cast<std::size_t>(received));
            service(conn);
        }
    }

    if (!conn.should_close && (events & EPOLLOUT)) {
        service(conn);
    }

    if (conn.should_close) {
        close_connection(fd);
        return;
    }
    update_interest(conn);
}

void HttpServer::handle_peer_eof(Connection& conn) {
    conn.halted = true;
    conn.keep_alive = false;
    if (conn.request && conn.body_remaining > 0) {
        // Body cut short; an unfinished upload discards its staging file.
        if (conn.upload) {
            logger_.warn("Upload from " + conn.peer + " aborted after " +
                         std::to_string(conn.upload->bytes_received()) + " bytes");
        }
        conn.should_close = true;
        return;
    }
    if (!conn.awaiting_response && !conn.writing) {
        conn.should_close = true;
    }
}

void HttpServer::service(Connection& conn) {
    while (!conn.should_close) {
        process_inbound(conn);
        if (conn.should_close || !flush_outbound(conn)) {
            break;
        }
    }
}

void HttpServer::process_inbound(Connection& conn) {
    while (!conn.should_close) {
        if (conn.request) {
            if (conn.body_remaining > 0) {
                if (conn.inbound.empty()) {
                    return;
                }
                const auto take = static_cast<std::size_t>(
                    std::min<std::uint64_t>(conn.body_remaining, conn.inbound.size()));
                if (conn.upload) {
                    conn.upload->consume(std::string_view(conn.inbound.data(), take));
                }
                conn.inbound.erase(0, take);
                conn.body_remaining -= take;
                if (conn.body_remaining == 0 && conn.upload) {
                    submit_upload_finish(conn);
                }
                continue;
            }
            if (conn.awaiting_response || conn.writing) {
                return;
            }
            conn.request.reset();
            if (!conn.keep_alive) {
                conn.should_close = true;
                return;
            }
            continue;
        }

        if (conn.halted) {
            return;
        }
        const auto head_end = http::find_head_end(conn.inbound);
        if (head_end == std::string::npos) {
            if (conn.inbound.size() > config_.max_header_bytes) {
                reject_protocol_error(conn, http::HttpError(http::Status::kHeaderFieldsTooLarge,
                                                            "Request header block too large"));
            }
            return;
        }
        if (head_end > config_.max_header_bytes) {
            reject_protocol_error(conn, http::HttpError(http::Status::kHeaderFieldsTooLarge,
                                                        "Request header block too large"));
            return;
        }

        http::Request request;
        try {
            request = http::parse_request_head(std::string_view(conn.inbound.data(), head_end));
        } catch (const http::HttpError& error) {
            reject_protocol_error(conn, error);
            return;
        }
        conn.inbound.erase(0, head_end);
        conn.body_remaining = request.content_length;
        conn.keep_alive = request.keep_alive;
        conn.request = std::move(request);
        dispatch(conn);
    }
}

void HttpServer::dispatch(Connection& conn) {
    const auto& request = *conn.request;
    const bool wants_continue = http::expects_continue(request) && conn.body_remaining > 0;

    if (is_upload_request(request)) {
        auto start = handlers_.begin_upload(request);
        if (auto* rejected = std::get_if<http::Response>(&start)) {
            if (wants_continue) {
                // The client is waiting for permission to send the body; it will not come.
                conn.body_remaining = 0;
                conn.keep_alive = false;
            }
            queue_response(conn, std::move(*rejected));
            return;
        }
        conn.upload = std::get<std::shared_ptr<UploadSession>>(std::move(start));
        if (wants_continue) {
            conn.outbound.append(http::encode_continue());
        }
        if (conn.body_remaining == 0) {
            submit_upload_finish(conn);
        }
        return;
    }

    if (wants_continue) {
        conn.body_remaining = 0;
        conn.keep_alive = false;
    }
    submit_request(conn);
}

void HttpServer::reject_protocol_error(Connection& conn, const http::HttpError& error) {
    logger_.warn("Bad request from " + conn.peer + ": " + error.what());
    conn.halted = true;
    conn.keep_alive = false;
    conn.inbound.clear();
    conn.body_remaining = 0;
    auto response = http::make_text(error.status(), error.what());
    response.close = true;
    queue_response(conn, std::move(response));
}

void HttpServer::submit_request(Connection& conn) {
    conn.awaiting_response = true;
    const int fd = conn.fd;
    const auto id = conn.id;
    auto request = *conn.request;
    try {
        task_executor_.submit([this, fd, id, request = std::move(request)]() {
            http::Response response;
            try {
                response = handlers_.handle(request);
            } catch (const std::exception& ex) {
                logger_.error("Handler error for " + describe(&request) + ": " + ex.what());
                response = http::make_text(http::Status::kInternalServerError, "Internal server error");
            }
            schedule_response(fd, id, std::move(response));
        });
    } catch (const std::exception& ex) {
        logger_.error(std::string("Unable to schedule request: ") + ex.what());
        conn.should_close = true;
    }
}

void HttpServer::submit_upload_finish(Connection& conn) {
    conn.awaiting_response = true;
    const int fd = conn.fd;
    const auto id = conn.id;
    auto session = std::move(conn.upload);
    try {
        task_executor_.submit([this, fd, id, session]() {
            http::Response response;
            try {
                response = session->finish();
            } catch (const std::exception& ex) {
                logger_.error(std::string("Upload finalisation failed: ") + ex.what());
                response = http::make_text(http::Status::kInternalServerError, "Failed to save file");
            }
            schedule_response(fd, id, std::move(response));
        });
    } catch (const std::exception& ex) {
        logger_.error(std::string("Unable to schedule upload: ") + ex.what());
        conn.should_close = true;
    }
}

void HttpServer::queue_response(Connection& conn, http::Response response) {
    conn.awaiting_response = false;
    if (response.close || conn.halted) {
        conn.keep_alive = false;
    }
    logger_.info(describe(conn.request ? &*conn.request : nullptr) + " -> " +
                 std::to_string(http::status_code(response.status)) + " (" + conn.peer + ")");

    conn.outbound.append(http::encode_head(response, conn.keep_alive));
    conn.outbound.append(response.body);
    conn.stream = std::move(response.stream);
    conn.stream_offset = response.stream_offset;
    conn.stream_remaining = conn.stream ? response.stream_length : 0;
    conn.writing = true;
}

// Writes as much pending output as the socket accepts. Returns true when a
// complete response was finished by this call.
bool HttpServer::flush_outbound(Connection& conn) {
    while (true) {
        if (conn.outbound_offset == conn.outbound.size()) {
            conn.outbound.clear();
            conn.outbound_offset = 0;
            if (conn.stream_remaining == 0) {
                break;
            }
            const auto chunk = static_cast<std::size_t>(
                std::min<std::uint64_t>(conn.stream_remaining, config_.io_chunk_bytes));
            conn.outbound.resize(chunk);
            std::size_t got = 0;
            try {
                got = conn.stream->read(conn.stream_offset, conn.outbound.data(), chunk);
            } catch (const std::exception& ex) {
                logger_.error("Response body read failed for " + conn.peer + ": " + ex.what());
                conn.should_close = true;
                return false;
            }
            if (got == 0) {
                logger_.warn("Response body for " + conn.peer + " ended early");
                conn.should_close = true;
                return false;
            }
            conn.outbound.resize(got);
            conn.stream_offset += got;
            conn.stream_remaining -= got;
        }

        const ssize_t sent = ::send(conn.fd, conn.outbound.data() + conn.outbound_offset,
                                    conn.outbound.size() - conn.outbound_offset, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return false;
            }
            conn.should_close = true;
            return false;
        }
        conn.outbound_offset += static_cast<std::size_t>(sent);
    }

    if (!conn.writing) {
        return false;
    }
    conn.writing = false;
    conn.stream.reset();
    if (!conn.keep_alive && !(conn.request && conn.body_remaining > 0)) {
        conn.should_close = true;
        return false;
    }
    return true;
}

void HttpServer::update_interest(Connection& conn) {
    uint32_t wanted = 0;
    if (!conn.halted) {
        const bool body_pending = conn.request && conn.body_remaining > 0;
        if (body_pending || conn.inbound.size() < read_limit_) {
            wanted |= EPOLLIN | EPOLLRDHUP;
        }
    }
    if (conn.outbound_offset < conn.outbound.size() || conn.stream_remaining > 0) {
        wanted |= EPOLLOUT;
    }
    if (wanted == conn.events) {
        return;
    }
    epoll_event ev{};
    ev.data.fd = conn.fd;
    ev.events = wanted;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, conn.fd, &ev) == 0) {
        conn.events = wanted;
    }
}

void HttpServer::schedule_response(int fd, std::uint64_t connection_id, http::Response response) {
    std::lock_guard<std::mutex> lock(async_mutex_);
    async_responses_.push_back(PendingResponse{fd, connection_id, std::move(response)});
    uint64_t value = 1;
    [[maybe_unused]] auto ignored = ::write(notify_fd_, &value, sizeof(value));
}

void HttpServer::drain_async_queue() {
    std::vector<PendingResponse> pending;
    {
        std::lock_guard<std::mutex> lock(async_mutex_);
        pending.swap(async_responses_);
    }
    for (auto& resp : pending) {
        auto it = connections_.find(resp.fd);
        if (it == connections_.end() || it->second->id != resp.connection_id) {
            continue;
        }
        auto& conn = *it->second;
        queue_response(conn, std::move(resp.response));
        service(conn);
        if (conn.should_close) {
            close_connection(resp.fd);
            continue;
        }
        update_interest(conn);
    }
}

void HttpServer::close_connection(int fd) {
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    ::close(fd);
    connections_.erase(fd);
}

}  // namespace filedrop::server
