// include/stk/connection.hpp
// Connect protocol client: one socket, one request/response cycle at a time.

#pragma once

#include "config.hpp"
#include "error.hpp"
#include "types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace stk {

// A client for the STK Connect socket interface.
//
// Created via Connection::create(config). The framing discipline (sync or
// async) is fixed by config.mode() at creation. Not thread-safe: callers
// must not issue a second command before the previous exchange completes.
//
// Example:
//   auto conn = Connection::create(ConnectConfig::local());
//   conn->connect();
//   conn->send("Unload / *");
//   auto rows = conn->report_rm({"Satellite/Sat1", "Inertial Position"});
//   conn->close();
class Connection {
public:
    // Throws StkError on invalid configuration.
    static std::unique_ptr<Connection> create(ConnectConfig config);

    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&&) noexcept;
    Connection& operator=(Connection&&) noexcept;

    // --- Lifecycle ---

    // Open the socket (retrying refused attempts), then run the handshake:
    // "ConControl / AsyncOn" in async mode, "ConControl / AckOff" when
    // acknowledgements are disabled. No-op if already connected.
    // Throws StkError (Connect).
    void connect();

    // Close the socket. Safe to call repeatedly.
    void close();
    void disconnect() { close(); }

    bool is_connected() const noexcept;

    // Attempts used by the most recent connect().
    uint32_t connect_attempts_used() const noexcept;

    const Endpoint& endpoint() const noexcept;

    // Retarget the client. Throws StkError (Configuration) while connected.
    void set_endpoint(Endpoint endpoint);

    const ConnectConfig& config() const noexcept;
    MessagingMode mode() const noexcept;

    // --- Commands ---

    // Send one command and, when acknowledgements are enabled, wait for the
    // ACK. A NACK resends the command, up to `attempts` sends in total, then
    // throws StkError (Nack) carrying the command.
    void send(const std::string& command);
    void send(const std::string& command, uint32_t attempts);

    // --- Responses ---

    Message read_single_message();
    std::vector<Message> read_multi_message();

    // Everything that arrives until the socket stays idle for `timeout`.
    std::string read();
    std::string read(std::chrono::milliseconds timeout);

    // --- Reports ---

    // ReportCreate: the remote writes the report; only the ACK is read.
    void report(const ReportRequest& request);

    // Report_RM: the report is returned over the socket. An empty result
    // means either an empty report or no data within the idle timeout; the
    // protocol offers no way to tell these apart.
    std::vector<std::string> report_rm(const ReportRequest& request);
    std::vector<std::string> report_rm(const ReportRequest& request,
                                       std::chrono::milliseconds timeout);

private:
    explicit Connection(ConnectConfig config);
    struct Inner;
    std::unique_ptr<Inner> inner_;
};

} // namespace stk
