#include "config_loader.hpp"
#include "file_store.hpp"
#include "http_server.hpp"
#include "logger.hpp"
#include "request_handlers.hpp"
#include "static_files.hpp"
#include "test_support.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

using namespace filedrop::server;
using filedrop::test::expect;
using filedrop::test::read_file;
using filedrop::test::recv_to_end;
using filedrop::test::send_all;
using filedrop::test::TempDir;
using filedrop::test::write_file;

namespace {

const std::string kBoundary = "socketTestBoundary";

int connect_to(uint16_t port) {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return -1;
    }
    timeval timeout{};
    timeout.tv_sec = 5;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

// Sends `request` and returns everything the server writes until it closes.
std::string exchange(uint16_t port, const std::string& request) {
    const int fd = connect_to(port);
    if (fd < 0) {
        return "";
    }
    std::string response;
    if (send_all(fd, request.data(), request.size())) {
        recv_to_end(fd, response);
    }
    ::close(fd);
    return response;
}

// Reads until `marker` has arrived.
bool recv_until(int fd, std::string& out, const std::string& marker) {
    char buf[4096];
    while (out.find(marker) == std::string::npos) {
        const ssize_t got = ::recv(fd, buf, sizeof(buf), 0);
        if (got <= 0) {
            return false;
        }
        out.append(buf, static_cast<std::size_t>(got));
    }
    return true;
}

std::string upload_request(const std::string& filename, const std::string& content, const std::string& extra = "") {
    const std::string body = "--" + kBoundary + "\r\n"
                             "Content-Disposition: form-data; name=\"file\"; filename=\"" + filename + "\"\r\n"
                             "\r\n" + content + "\r\n"
                             "--" + kBoundary + "--\r\n";
    return "POST /upload HTTP/1.1\r\n"
           "Host: localhost\r\n"
           "Content-Type: multipart/form-data; boundary=" + kBoundary + "\r\n"
           "Content-Length: " + std::to_string(body.size()) + "\r\n" +
           extra + "\r\n" + body;
}

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

std::string body_after_head(const std::string& response) {
    const auto pos = response.find("\r\n\r\n");
    return pos == std::string::npos ? "" : response.substr(pos + 4);
}

std::size_t count_of(const std::string& haystack, const std::string& needle) {
    std::size_t count = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

}  // namespace

int main() {
    TempDir tmp("filedrop_server");
    Logger logger("");
    FileStore store(tmp.path / "uploaded");
    StaticFiles assets(tmp.path / "static");
    write_file(assets.root() / "style.css", "body { margin: 0; }");
    RequestHandlers handlers(store, assets, logger);

    ServerConfig config;
    config.listen_address = "127.0.0.1";
    config.listen_port = 0;
    config.worker_threads = 2;
    config.io_chunk_bytes = 1024;
    config.max_header_bytes = 4096;

    HttpServer server(config, handlers, logger);
    server.start();
    const auto port = server.port();
    if (!expect(port != 0, "server bound an ephemeral port")) return 1;

    // Page and static asset.
    auto response = ::exchange(port, "GET / HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n");
    if (!expect(starts_with(response, "HTTP/1.1 200 OK\r\n"), "page status")) return 2;
    if (!expect(response.find("Connection: close\r\n") != std::string::npos, "close honoured")) return 3;
    if (!expect(response.find("id=\"filesList\"") != std::string::npos, "page body")) return 4;
    response = ::exchange(port, "GET /static/style.css HTTP/1.1\r\nConnection: close\r\n\r\n");
    if (!expect(body_after_head(response) == "body { margin: 0; }", "static asset body")) return 5;

    // Upload then list then download.
    std::string content;
    for (int i = 0; i < 500; ++i) {
        content += "line " + std::to_string(i) + " of the report\r\n";
    }
    response = ::exchange(port, upload_request("report.txt", content, "Connection: close\r\n"));
    if (!expect(starts_with(response, "HTTP/1.1 200 OK\r\n"), "upload status")) return 10;
    if (!expect(response.find("\"filename\":\"report.txt\"") != std::string::npos, "upload reply names file")) return 11;
    if (!expect(read_file(store.root() / "report.txt") == content, "upload stored on disk")) return 12;

    response = ::exchange(port, "GET /files HTTP/1.1\r\nConnection: close\r\n\r\n");
    if (!expect(response.find("\"downloadUrl\":\"/download/report.txt\"") != std::string::npos, "listing over socket")) return 13;

    response = ::exchange(port, "GET /download/report.txt HTTP/1.1\r\nConnection: close\r\n\r\n");
    if (!expect(body_after_head(response) == content, "download streams whole file")) return 14;
    if (!expect(response.find("Content-Length: " + std::to_string(content.size()) + "\r\n") != std::string::npos,
                "download length")) return 15;
    if (!expect(response.find("Content-Disposition: attachment; filename=\"report.txt\"") != std::string::npos,
                "download disposition")) return 16;

    response = ::exchange(port, "GET /download/report.txt HTTP/1.1\r\nRange: bytes=0-3\r\nConnection: close\r\n\r\n");
    if (!expect(starts_with(response, "HTTP/1.1 206 Partial Content\r\n") && body_after_head(response) == "line",
                "range over socket")) return 17;

    // Keep-alive with pipelined requests.
    response = ::exchange(port,
                        "GET /files HTTP/1.1\r\nHost: a\r\n\r\n"
                        "DELETE /files HTTP/1.1\r\nHost: a\r\n\r\n"
                        "GET /missing HTTP/1.1\r\nHost: a\r\nConnection: close\r\n\r\n");
    if (!expect(count_of(response, "HTTP/1.1 ") == 3, "three pipelined responses")) return 20;
    const auto first = response.find("HTTP/1.1 200 OK");
    const auto second = response.find("HTTP/1.1 405 Method Not Allowed");
    const auto third = response.find("HTTP/1.1 404 Not Found");
    if (!expect(first < second && second < third && third != std::string::npos, "responses in request order")) return 21;
    if (!expect(response.find("Allow: GET\r\n") != std::string::npos, "405 lists allowed method")) return 22;

    // Upload after a keep-alive request on the same connection.
    response = ::exchange(port, "GET /files HTTP/1.1\r\n\r\n" + upload_request("second.txt", "two", "Connection: close\r\n"));
    if (!expect(count_of(response, "HTTP/1.1 200 OK") == 2 && read_file(store.root() / "second.txt") == "two",
                "upload on a reused connection")) return 23;

    // Expect: 100-continue.
    {
        const auto request = upload_request("continued.txt", "after continue", "Expect: 100-continue\r\nConnection: close\r\n");
        const auto head_end = request.find("\r\n\r\n") + 4;
        const int fd = connect_to(port);
        if (!expect(fd >= 0, "connect for 100-continue")) return 30;
        std::string got;
        send_all(fd, request.data(), head_end);
        const bool interim = recv_until(fd, got, "\r\n\r\n");
        if (!expect(interim && starts_with(got, "HTTP/1.1 100 Continue\r\n"), "interim 100 response")) return 31;
        send_all(fd, request.data() + head_end, request.size() - head_end);
        recv_to_end(fd, got);
        ::close(fd);
        if (!expect(got.find("HTTP/1.1 200 OK") != std::string::npos, "final response after continue")) return 32;
        if (!expect(read_file(store.root() / "continued.txt") == "after continue", "continued upload stored")) return 33;
    }

    // A rejected upload with Expect never waits for the body.
    response = ::exchange(port,
                        "POST /upload HTTP/1.1\r\nContent-Type: text/plain\r\nContent-Length: 1000\r\n"
                        "Expect: 100-continue\r\n\r\n");
    if (!expect(starts_with(response, "HTTP/1.1 400 Bad Request\r\n"), "early rejection")) return 34;
    if (!expect(response.find("100 Continue") == std::string::npos, "no interim response on rejection")) return 35;

    // Protocol errors close the connection.
    response = ::exchange(port, "GARBAGE\r\n\r\n");
    if (!expect(starts_with(response, "HTTP/1.1 400 Bad Request\r\n"), "malformed request")) return 40;
    response = ::exchange(port, "POST /upload HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n0\r\n\r\n");
    if (!expect(starts_with(response, "HTTP/1.1 501 Not Implemented\r\n"), "chunked body refused")) return 41;
    response = ::exchange(port, "GET / HTTP/1.1\r\nX-Fill: " + std::string(6000, 'a') + "\r\n\r\n");
    if (!expect(starts_with(response, "HTTP/1.1 431 "), "oversized head refused")) return 42;
    response = ::exchange(port, "GET / HTTP/3.0\r\n\r\n");
    if (!expect(starts_with(response, "HTTP/1.1 505 "), "unsupported version")) return 43;

    // An upload cut off mid-body leaves nothing behind.
    {
        const auto request = upload_request("aborted.bin", std::string(10000, 'z'));
        const int fd = connect_to(port);
        send_all(fd, request.data(), request.size() / 2);
        ::close(fd);
        response = ::exchange(port, "GET /files HTTP/1.1\r\nConnection: close\r\n\r\n");
        if (!expect(response.find("aborted.bin") == std::string::npos &&
                        !std::filesystem::exists(store.root() / "aborted.bin"),
                    "aborted upload not published")) return 50;
    }

    // A large upload in flight does not hold up other clients.
    {
        const int uploader = connect_to(port);
        if (!expect(uploader >= 0, "connect uploader")) return 60;
        timeval send_timeout{};
        send_timeout.tv_sec = 5;
        ::setsockopt(uploader, SOL_SOCKET, SO_SNDTIMEO, &send_timeout, sizeof(send_timeout));
        const std::string head = "POST /upload HTTP/1.1\r\nHost: localhost\r\n"
                                 "Content-Type: multipart/form-data; boundary=" + kBoundary + "\r\n"
                                 "Content-Length: 8000000000\r\n\r\n"
                                 "--" + kBoundary + "\r\n"
                                 "Content-Disposition: form-data; name=\"file\"; filename=\"huge.bin\"\r\n\r\n";
        constexpr std::uint64_t kUploadBudget = 4ULL << 30;
        std::atomic<bool> stop_upload{false};
        std::atomic<std::uint64_t> sent_bytes{0};
        std::thread streamer([&] {
            if (!send_all(uploader, head.data(), head.size())) {
                return;
            }
            const std::string block(1 << 20, 'u');
            while (!stop_upload && sent_bytes < kUploadBudget) {
                if (!send_all(uploader, block.data(), block.size())) {
                    break;
                }
                sent_bytes += block.size();
            }
        });

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (sent_bytes < (16u << 20) && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        bool listed = true;
        std::chrono::milliseconds slowest{0};
        for (int i = 0; i < 3; ++i) {
            const auto started = std::chrono::steady_clock::now();
            response = ::exchange(port, "GET /files HTTP/1.1\r\nConnection: close\r\n\r\n");
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
            slowest = std::max(slowest, elapsed);
            listed = listed && starts_with(response, "HTTP/1.1 200 OK\r\n") && response.find("huge.bin") == std::string::npos;
        }
        const bool streaming = sent_bytes >= (16u << 20) && sent_bytes < kUploadBudget;

        stop_upload = true;
        ::shutdown(uploader, SHUT_RDWR);
        streamer.join();
        ::close(uploader);

        if (!expect(streaming, "upload still streaming while listing")) return 61;
        if (!expect(listed, "listing served during upload")) return 62;
        if (!expect(slowest < std::chrono::milliseconds(2000),
                    "listing latency " + std::to_string(slowest.count()) + " ms during upload")) return 63;
    }

    server.stop();
    std::cout << "All server tests passed" << std::endl;
    return 0;
}
