// src/transport.hpp
// TCP transport: one blocking socket with connect retry and idle-bounded reads.

#pragma once

#include "stk/config.hpp"
#include "stk/error.hpp"
#include "stk/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace stk {

// Classify a failed connect attempt from the errno of each resolved address.
// True (retry) when at least one address refused and every other failure
// only says that address cannot be used from this host (e.g. ::1 without
// IPv6). Any other failure makes the attempt fatal.
bool attempt_refused(const std::vector<int>& address_errors);

class TcpTransport {
public:
    TcpTransport(Endpoint endpoint, LogCallback on_log = {},
                 ConnectAttemptCallback on_attempt = {});
    ~TcpTransport();

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    // Connect, retrying refused attempts after a fixed delay. Returns the
    // number of attempts made. Throws StkError (Connect).
    uint32_t connect(uint32_t max_attempts, std::chrono::milliseconds delay);

    // Block until exactly n bytes have arrived. Throws StkError (Io).
    std::string read_exact(size_t n);

    // Accumulate everything that arrives until one wait of `timeout` passes
    // with nothing new. Returns an empty buffer if nothing arrives at all.
    std::string read_until_idle(std::chrono::milliseconds timeout);

    // Single unbuffered write. A short write is logged, not retried.
    void send(const std::string& bytes);

    void close_connection();

    bool is_open() const noexcept { return socket_fd_ >= 0; }

    const Endpoint& endpoint() const noexcept { return endpoint_; }

    // Only valid while closed.
    void set_endpoint(Endpoint endpoint);

private:
    enum class AttemptResult { Connected, Refused };

    AttemptResult try_connect();
    void configure_socket(int fd);
    int require_open() const;

    Endpoint endpoint_;
    LogCallback on_log_;
    ConnectAttemptCallback on_attempt_;
    int socket_fd_ = -1;
};

} // namespace stk
