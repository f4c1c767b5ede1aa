// src/transport.cpp
// TCP transport with fixed-delay connect retry.

#include "transport.hpp"
#include "log.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <thread>

// POSIX sockets
#include <arpa/inet.h>
#include <errno.h>
#include <netdb.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace stk {

// The address family or local route is missing; says nothing about the remote.
static bool address_unusable(int err) {
    switch (err) {
        case EAFNOSUPPORT:
        case EPFNOSUPPORT:
        case EPROTONOSUPPORT:
        case EADDRNOTAVAIL:
        case ENETUNREACH:
            return true;
        default:
            return false;
    }
}

bool attempt_refused(const std::vector<int>& address_errors) {
    bool any_refused = false;
    for (int err : address_errors) {
        if (err == ECONNREFUSED) {
            any_refused = true;
        } else if (!address_unusable(err)) {
            return false;
        }
    }
    return any_refused;
}

TcpTransport::TcpTransport(Endpoint endpoint, LogCallback on_log,
                           ConnectAttemptCallback on_attempt)
    : endpoint_(std::move(endpoint)), on_log_(std::move(on_log)),
      on_attempt_(std::move(on_attempt)) {}

TcpTransport::~TcpTransport() {
    close_connection();
}

void TcpTransport::close_connection() {
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
        log::debug(on_log_, "closed socket to " + endpoint_.to_string());
    }
}

void TcpTransport::set_endpoint(Endpoint endpoint) {
    if (is_open()) {
        throw StkError::configuration("cannot change endpoint while connected to " +
                                      endpoint_.to_string());
    }
    endpoint_ = std::move(endpoint);
}

int TcpTransport::require_open() const {
    if (socket_fd_ < 0) throw StkError::closed();
    return socket_fd_;
}

uint32_t TcpTransport::connect(uint32_t max_attempts, std::chrono::milliseconds delay) {
    if (is_open()) return 0;

    uint32_t attempt = 0;
    while (true) {
        attempt++;
        AttemptResult result = try_connect();
        if (on_attempt_) on_attempt_(attempt, result == AttemptResult::Refused);

        if (result == AttemptResult::Connected) {
            log::info(on_log_, "connected to " + endpoint_.to_string() + " after " +
                               std::to_string(attempt) + " attempt(s)");
            return attempt;
        }

        log::debug(on_log_, "connection refused by " + endpoint_.to_string() + " (attempt " +
                            std::to_string(attempt) + " of " + std::to_string(max_attempts) + ")");
        if (attempt >= max_attempts) {
            throw StkError::connect("failed to connect via socket on " + endpoint_.to_string() +
                                    " after " + std::to_string(attempt) + " attempt(s)");
        }
        std::this_thread::sleep_for(delay);
    }
}

TcpTransport::AttemptResult TcpTransport::try_connect() {
    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    auto port_str = std::to_string(endpoint_.port);
    int err = ::getaddrinfo(endpoint_.host.c_str(), port_str.c_str(), &hints, &res);
    if (err != 0 || res == nullptr) {
        throw StkError::connect("DNS resolution failed for " + endpoint_.host + ": " +
                                ::gai_strerror(err));
    }

    std::vector<int> address_errors;
    for (struct addrinfo* rp = res; rp != nullptr; rp = rp->ai_next) {
        int fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd < 0) {
            address_errors.push_back(errno);
            continue;
        }

        int ret;
        do {
            ret = ::connect(fd, rp->ai_addr, rp->ai_addrlen);
        } while (ret != 0 && errno == EINTR);

        if (ret == 0) {
            ::freeaddrinfo(res);
            configure_socket(fd);
            socket_fd_ = fd;
            return AttemptResult::Connected;
        }

        address_errors.push_back(errno);
        ::close(fd);
    }

    ::freeaddrinfo(res);
    if (attempt_refused(address_errors)) return AttemptResult::Refused;

    int fatal = address_errors.empty() ? ECONNREFUSED : address_errors.back();
    for (int err : address_errors) {
        if (err != ECONNREFUSED && !address_unusable(err)) fatal = err;
    }
    throw StkError::connect("connect to " + endpoint_.to_string() + " failed: " +
                            std::strerror(fatal));
}

void TcpTransport::configure_socket(int fd) {
    int nodelay = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

    int keepalive = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));
}

void TcpTransport::send(const std::string& bytes) {
    int fd = require_open();
    ssize_t n;
    do {
        n = ::send(fd, bytes.data(), bytes.size(), MSG_NOSIGNAL);
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        throw StkError::io(std::string("send failed: ") + std::strerror(errno));
    }
    if (static_cast<size_t>(n) != bytes.size()) {
        log::warning(on_log_, "short write: sent " + std::to_string(n) + " of " +
                              std::to_string(bytes.size()) + " bytes");
    }
}

std::string TcpTransport::read_exact(size_t n) {
    int fd = require_open();
    std::string out(n, '\0');
    size_t got = 0;
    while (got < n) {
        ssize_t r = ::recv(fd, &out[got], n - got, 0);
        if (r > 0) {
            got += static_cast<size_t>(r);
            continue;
        }
        if (r == 0) {
            throw StkError::io("connection closed by peer after " + std::to_string(got) +
                               " of " + std::to_string(n) + " bytes");
        }
        if (errno == EINTR) continue;
        throw StkError::io(std::string("recv failed: ") + std::strerror(errno));
    }
    return out;
}

std::string TcpTransport::read_until_idle(std::chrono::milliseconds timeout) {
    int fd = require_open();
    int timeout_ms = static_cast<int>(std::min<int64_t>(
        std::max<int64_t>(timeout.count(), 0), std::numeric_limits<int>::max()));

    log::debug(on_log_, "reading until no data is left in the socket...");

    std::string buffer;
    char chunk[4096];
    while (true) {
        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, timeout_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw StkError::io(std::string("poll failed: ") + std::strerror(errno));
        }
        if (ready == 0) {
            log::debug(on_log_, "read timeout reached, returning " +
                                std::to_string(buffer.size()) + " bytes");
            return buffer;
        }

        ssize_t r = ::recv(fd, chunk, sizeof(chunk), MSG_DONTWAIT);
        if (r > 0) {
            buffer.append(chunk, static_cast<size_t>(r));
            continue;
        }
        if (r == 0) {
            log::debug(on_log_, "peer closed during read, returning " +
                                std::to_string(buffer.size()) + " bytes");
            return buffer;
        }
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
        throw StkError::io(std::string("recv failed: ") + std::strerror(errno));
    }
}

} // namespace stk
