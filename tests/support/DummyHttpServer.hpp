#pragma once

#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

// Minimal HTTP/1.1 server on 127.0.0.1. Handles one connection at a time,
// records each request and answers every request with the same response,
// except requests whose number (1-based) was passed to dropRequest(): those
// connections are closed without an answer.
class DummyHttpServer {
public:
    struct Recorded {
        std::string requestLine;
        std::string head;
        std::string body;
    };

    DummyHttpServer() {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        require(listenFd_ >= 0, "socket");

        int opt = 1;
        ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0; // let the OS choose

        require(::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0, "bind");
        require(::listen(listenFd_, 8) == 0, "listen");

        socklen_t len = sizeof(addr);
        require(::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0, "getsockname");
        port_ = ntohs(addr.sin_port);

        running_.store(true);
        thread_ = std::thread([this]{ run(); });
    }

    ~DummyHttpServer() { stop(); }

    void stop() {
        bool expected = true;
        if (!running_.compare_exchange_strong(expected, false)) {
            return;
        }
        ::shutdown(listenFd_, SHUT_RDWR);
        ::close(listenFd_);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    unsigned short port() const { return port_; }

    void setResponse(int status, std::string contentType, std::string body) {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = status;
        contentType_ = std::move(contentType);
        body_ = std::move(body);
    }

    void dropRequest(std::size_t number) {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped_.insert(number);
    }

    std::vector<Recorded> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    static void require(bool ok, const char* what) {
        if (!ok) {
            std::fprintf(stderr, "DummyHttpServer: %s failed: %s\n", what, std::strerror(errno));
            std::exit(1);
        }
    }

    void run() {
        while (running_.load()) {
            int client = ::accept(listenFd_, nullptr, nullptr);
            if (client < 0) {
                if (!running_.load()) break;
                continue;
            }
            timeval tv{2, 0};
            ::setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            serve(client);
            ::close(client);
        }
    }

    void serve(int client) {
        std::string data;
        char buf[1024];
        std::size_t headEnd = std::string::npos;
        while ((headEnd = data.find("\r\n\r\n")) == std::string::npos) {
            const ssize_t n = ::recv(client, buf, sizeof(buf), 0);
            if (n <= 0) return;
            data.append(buf, static_cast<std::size_t>(n));
        }

        Recorded rec;
        rec.head = data.substr(0, headEnd);
        rec.requestLine = rec.head.substr(0, rec.head.find("\r\n"));

        const std::size_t contentLength = parseContentLength(rec.head);
        std::string body = data.substr(headEnd + 4);
        while (body.size() < contentLength) {
            const ssize_t n = ::recv(client, buf, sizeof(buf), 0);
            if (n <= 0) break;
            body.append(buf, static_cast<std::size_t>(n));
        }
        rec.body = body;

        std::string response;
        bool drop = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(rec);
            drop = dropped_.count(requests_.size()) != 0;
            response = "HTTP/1.1 " + std::to_string(status_) + " X\r\n"
                       "Content-Type: " + contentType_ + "\r\n"
                       "Content-Length: " + std::to_string(body_.size()) + "\r\n"
                       "Connection: close\r\n\r\n" + body_;
        }
        if (drop) {
            return;
        }

        std::size_t sent = 0;
        while (sent < response.size()) {
            const ssize_t n = ::send(client, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) return;
            sent += static_cast<std::size_t>(n);
        }
    }

    static std::size_t parseContentLength(const std::string& head) {
        const std::string key = "content-length:";
        std::string lower = head;
        for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        const auto pos = lower.find(key);
        if (pos == std::string::npos) return 0;
        return static_cast<std::size_t>(std::strtoul(head.c_str() + pos + key.size(), nullptr, 10));
    }

    int listenFd_ = -1;
    unsigned short port_ = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;

    mutable std::mutex mutex_;
    std::vector<Recorded> requests_;
    std::set<std::size_t> dropped_;
    int status_ = 200;
    std::string contentType_ = "text/xml; charset=utf-8";
    std::string body_;
};

// A loopback TCP port nobody listens on (bound, then released).
inline unsigned short unusedLoopbackPort() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    socklen_t len = sizeof(addr);
    unsigned short port = 0;
    if (fd >= 0 && ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
        ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        port = ntohs(addr.sin_port);
    }
    if (fd >= 0) ::close(fd);
    return port;
}
