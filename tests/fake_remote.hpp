// tests/fake_remote.hpp
// In-process loopback stand-in for the Connect socket of the application.

#pragma once

#include "codec.hpp"
#include "stk/types.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace stk {
namespace testing {

// Accepted connection as seen from the remote side.
class Peer {
public:
    explicit Peer(int fd) : fd_(fd) {}

    // Next '\n'-terminated line without the terminator; nullopt on EOF or
    // after `timeout` without data.
    std::optional<std::string> read_line(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
        while (true) {
            auto nl = buffer_.find('\n');
            if (nl != std::string::npos) {
                std::string line = buffer_.substr(0, nl);
                buffer_.erase(0, nl + 1);
                std::lock_guard<std::mutex> lock(*lines_mutex_);
                lines_->push_back(line);
                return line;
            }
            struct pollfd pfd{};
            pfd.fd = fd_;
            pfd.events = POLLIN;
            if (::poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0) return std::nullopt;
            char chunk[1024];
            ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
            if (n <= 0) return std::nullopt;
            buffer_.append(chunk, static_cast<size_t>(n));
        }
    }

    void write(const std::string& bytes) {
        size_t sent = 0;
        while (sent < bytes.size()) {
            ssize_t n = ::send(fd_, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) return;
            sent += static_cast<size_t>(n);
        }
    }

    // Split a write so the client sees it in several recv() calls.
    void write_slowly(const std::string& bytes, size_t piece) {
        for (size_t i = 0; i < bytes.size(); i += piece) {
            write(bytes.substr(i, piece));
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

private:
    friend class FakeRemote;
    int fd_;
    std::string buffer_;
    std::vector<std::string>* lines_ = nullptr;
    std::mutex* lines_mutex_ = nullptr;
};

// Listens on 127.0.0.1, accepts one client and runs `script` against it.
class FakeRemote {
public:
    using Script = std::function<void(Peer&)>;

    explicit FakeRemote(Script script) : FakeRemote(0, std::move(script)) {}

    FakeRemote(uint16_t port, Script script) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int yes = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = htons(port);
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, 4) != 0) {
            ADD_FAILURE() << "fake remote could not listen on port " << port;
        }
        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this, script = std::move(script)]() {
            struct pollfd pfd{};
            pfd.fd = listen_fd_;
            pfd.events = POLLIN;
            if (::poll(&pfd, 1, 5000) <= 0) return;
            int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) return;
            Peer peer(fd);
            peer.lines_ = &lines_;
            peer.lines_mutex_ = &mutex_;
            script(peer);
            ::close(fd);
        });
    }

    ~FakeRemote() {
        join();
        if (listen_fd_ >= 0) ::close(listen_fd_);
    }

    FakeRemote(const FakeRemote&) = delete;
    FakeRemote& operator=(const FakeRemote&) = delete;

    void join() {
        if (thread_.joinable()) thread_.join();
    }

    uint16_t port() const { return port_; }

    // Command lines received so far.
    std::vector<std::string> commands() {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

private:
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::thread thread_;
    std::mutex mutex_;
    std::vector<std::string> lines_;
};

// A loopback port with nothing listening on it.
inline uint16_t unused_port() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    ::close(fd);
    return ntohs(addr.sin_port);
}

// One async-framed packet.
inline std::string async_frame(const std::string& type, const std::string& data,
                               uint32_t total = 1, uint32_t number = 1, uint32_t id = 1) {
    AsyncHeader h;
    h.async_type = type;
    h.identifier = id;
    h.total_packets = total;
    h.packet_number = number;
    h.data_length = static_cast<uint32_t>(data.size());
    return codec::encode_async_header(h) + data;
}

// One sync-framed message.
inline std::string sync_frame(const std::string& name, const std::string& data) {
    return codec::encode_sync_header(name, data.size()) + data;
}

} // namespace testing
} // namespace stk
