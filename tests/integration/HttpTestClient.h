#pragma once

// Blocking loopback HTTP client for the integration tests.

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <string>

class HttpTestClient {
public:
    explicit HttpTestClient(uint16_t port) : fd_(::socket(AF_INET, SOCK_STREAM, 0)) {
        assert(fd_ >= 0);
        sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        assert(::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr) == 1);
        connected_ = ::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    }

    ~HttpTestClient() { Close(); }

    HttpTestClient(const HttpTestClient&) = delete;
    HttpTestClient& operator=(const HttpTestClient&) = delete;

    bool connected() const { return connected_; }

    void Send(const std::string& data) {
        size_t off = 0;
        while (off < data.size()) {
            ssize_t n = ::send(fd_, data.data() + off, data.size() - off, MSG_NOSIGNAL);
            assert(n > 0);
            off += static_cast<size_t>(n);
        }
    }

    // One complete response (status line, headers, Content-Length body), or "" when the
    // server closed or nothing arrived within timeoutMs.
    std::string ReadResponse(int timeoutMs = 3000) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
        while (true) {
            size_t headerEnd = pending_.find("\r\n\r\n");
            if (headerEnd != std::string::npos) {
                size_t total = headerEnd + 4 + ContentLength(pending_.substr(0, headerEnd));
                if (pending_.size() >= total) {
                    std::string response = pending_.substr(0, total);
                    pending_.erase(0, total);
                    return response;
                }
            }
            if (!Fill(deadline)) {
                return std::string();
            }
        }
    }

    // True when the server closed its side within timeoutMs.
    bool WaitClosed(int timeoutMs = 3000) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
        while (true) {
            if (!Fill(deadline)) {
                return eof_;
            }
        }
    }

    // Everything received until the server closes.
    std::string ReadUntilClosed(int timeoutMs = 3000) {
        WaitClosed(timeoutMs);
        std::string all;
        all.swap(pending_);
        return all;
    }

    void Close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    static int Status(const std::string& response) {
        if (response.compare(0, 9, "HTTP/1.1 ") != 0 || response.size() < 12) {
            return 0;
        }
        return std::atoi(response.c_str() + 9);
    }

    static std::string Body(const std::string& response) {
        size_t headerEnd = response.find("\r\n\r\n");
        return headerEnd == std::string::npos ? std::string() : response.substr(headerEnd + 4);
    }

    static bool HasHeader(const std::string& response, const std::string& line) {
        size_t headerEnd = response.find("\r\n\r\n");
        return response.find("\r\n" + line + "\r\n") < headerEnd + 2;
    }

    static std::string Get(const std::string& path, const std::string& extraHeaders = "") {
        return "GET " + path + " HTTP/1.1\r\nHost: test.local\r\n" + extraHeaders + "\r\n";
    }

private:
    static size_t ContentLength(const std::string& headers) {
        const std::string key = "\r\nContent-Length: ";
        size_t pos = headers.find(key);
        if (pos == std::string::npos) {
            return 0;
        }
        return static_cast<size_t>(std::strtoul(headers.c_str() + pos + key.size(), nullptr, 10));
    }

    // Appends what arrives before the deadline. False on EOF, error or timeout.
    bool Fill(std::chrono::steady_clock::time_point deadline) {
        if (fd_ < 0 || eof_) {
            return false;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            return false;
        }
        pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        if (::poll(&pfd, 1, static_cast<int>(left.count())) <= 0) {
            return false;
        }
        char buf[4096];
        ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n <= 0) {
            eof_ = true;
            return false;
        }
        pending_.append(buf, static_cast<size_t>(n));
        return true;
    }

    int fd_;
    bool connected_ = false;
    bool eof_ = false;
    std::string pending_;
};
