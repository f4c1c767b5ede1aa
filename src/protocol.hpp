// src/protocol.hpp
// Response framing disciplines. Exactly two implementations, chosen by
// MessagingMode when a Connection is created.

#pragma once

#include "transport.hpp"
#include "stk/config.hpp"
#include "stk/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace stk {

class Protocol {
public:
    virtual ~Protocol() = default;

    virtual MessagingMode mode() const noexcept = 0;

    // Commands sent (acknowledged) right after the socket connects.
    virtual std::vector<std::string> handshake_commands() const = 0;

    // Read one acknowledgement. Throws StkError (Nack) naming command.
    virtual void read_ack(const std::string& command) = 0;

    virtual Message read_single_message() = 0;
    virtual std::vector<Message> read_multi_message() = 0;

    // Turn a Report_RM idle-read buffer into report rows.
    virtual std::vector<std::string> decode_report(const std::string& buffer) const = 0;
};

// 3-byte ACK/NACK and 40-byte "<name> <length>" headers.
class SyncProtocol : public Protocol {
public:
    SyncProtocol(TcpTransport& transport, LogCallback on_log)
        : transport_(transport), on_log_(std::move(on_log)) {}

    MessagingMode mode() const noexcept override { return MessagingMode::Sync; }
    std::vector<std::string> handshake_commands() const override { return {}; }
    void read_ack(const std::string& command) override;
    Message read_single_message() override;
    std::vector<Message> read_multi_message() override;
    std::vector<std::string> decode_report(const std::string& buffer) const override;

private:
    TcpTransport& transport_;
    LogCallback on_log_;
};

// 42-byte AGI envelope on every response, multi-packet reassembly.
class AsyncProtocol : public Protocol {
public:
    AsyncProtocol(TcpTransport& transport, LogCallback on_log)
        : transport_(transport), on_log_(std::move(on_log)) {}

    MessagingMode mode() const noexcept override { return MessagingMode::Async; }
    std::vector<std::string> handshake_commands() const override;
    void read_ack(const std::string& command) override;
    Message read_single_message() override;
    std::vector<Message> read_multi_message() override;
    std::vector<std::string> decode_report(const std::string& buffer) const override;

private:
    TcpTransport& transport_;
    LogCallback on_log_;
};

std::unique_ptr<Protocol> make_protocol(MessagingMode mode, TcpTransport& transport,
                                        const LogCallback& on_log);

} // namespace stk
