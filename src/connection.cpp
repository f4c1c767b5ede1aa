// src/connection.cpp
// Connect protocol client implementation.

#include "stk/connection.hpp"
#include "codec.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "transport.hpp"

namespace stk {

std::unique_ptr<Protocol> make_protocol(MessagingMode mode, TcpTransport& transport,
                                        const LogCallback& on_log) {
    switch (mode) {
        case MessagingMode::Sync:
            return std::make_unique<SyncProtocol>(transport, on_log);
        case MessagingMode::Async:
            return std::make_unique<AsyncProtocol>(transport, on_log);
    }
    throw StkError::configuration("unknown messaging mode");
}

struct Connection::Inner {
    ConnectConfig config;
    TcpTransport transport;
    std::unique_ptr<Protocol> protocol;
    uint32_t attempts_used = 0;

    explicit Inner(ConnectConfig cfg)
        : config(std::move(cfg)),
          transport(config.endpoint(), config.on_log(), config.on_connect_attempt()),
          protocol(make_protocol(config.mode(), transport, config.on_log())) {}

    void write_command(const std::string& command) {
        log::debug(config.on_log(), "stk.send(\"" + command + "\")");
        transport.send(codec::build_command(command));
    }

    void send(const std::string& command, uint32_t attempts) {
        if (attempts == 0) attempts = 1;
        auto framed = codec::build_command(command);

        for (uint32_t attempt = 1;; ++attempt) {
            log::debug(config.on_log(), "stk.send(\"" + command + "\")");
            transport.send(framed);
            if (!config.ack()) return;
            try {
                protocol->read_ack(command);
                return;
            } catch (const StkError& e) {
                if (e.kind() != ErrorKind::Nack) throw;
                if (attempt >= attempts) {
                    log::error(config.on_log(), "send() failed, received NACK too many times");
                    throw;
                }
                log::warning(config.on_log(), "NACK on attempt " + std::to_string(attempt) +
                                              " of " + std::to_string(attempts) + ", resending");
            }
        }
    }
};

std::unique_ptr<Connection> Connection::create(ConnectConfig config) {
    return std::unique_ptr<Connection>(new Connection(std::move(config)));
}

Connection::Connection(ConnectConfig config)
    : inner_(std::make_unique<Inner>(std::move(config))) {}

Connection::~Connection() {
    if (inner_) inner_->transport.close_connection();
}

Connection::Connection(Connection&&) noexcept = default;
Connection& Connection::operator=(Connection&&) noexcept = default;

void Connection::connect() {
    if (inner_->transport.is_open()) {
        log::debug(inner_->config.on_log(), "connect() on an open connection is a no-op");
        return;
    }

    const auto& cfg = inner_->config;
    inner_->attempts_used = inner_->transport.connect(cfg.connect_attempts(),
                                                      cfg.connect_retry_delay());
    try {
        // The remote acknowledges everything until it has processed AckOff,
        // so handshake acks are read whatever config.ack() says.
        for (const auto& command : inner_->protocol->handshake_commands()) {
            inner_->write_command(command);
            inner_->protocol->read_ack(command);
        }
        if (!cfg.ack()) {
            // The remote stops acknowledging once it has processed AckOff,
            // so no ack is read for it.
            inner_->write_command(Wire::ACK_OFF);
        }
    } catch (...) {
        inner_->transport.close_connection();
        throw;
    }
}

void Connection::close() {
    inner_->transport.close_connection();
}

bool Connection::is_connected() const noexcept {
    return inner_->transport.is_open();
}

uint32_t Connection::connect_attempts_used() const noexcept {
    return inner_->attempts_used;
}

const Endpoint& Connection::endpoint() const noexcept {
    return inner_->transport.endpoint();
}

void Connection::set_endpoint(Endpoint endpoint) {
    inner_->transport.set_endpoint(std::move(endpoint));
}

const ConnectConfig& Connection::config() const noexcept {
    return inner_->config;
}

MessagingMode Connection::mode() const noexcept {
    return inner_->protocol->mode();
}

void Connection::send(const std::string& command) {
    inner_->send(command, inner_->config.send_attempts());
}

void Connection::send(const std::string& command, uint32_t attempts) {
    inner_->send(command, attempts);
}

Message Connection::read_single_message() {
    return inner_->protocol->read_single_message();
}

std::vector<Message> Connection::read_multi_message() {
    return inner_->protocol->read_multi_message();
}

std::string Connection::read() {
    return inner_->transport.read_until_idle(inner_->config.read_timeout());
}

std::string Connection::read(std::chrono::milliseconds timeout) {
    return inner_->transport.read_until_idle(timeout);
}

void Connection::report(const ReportRequest& request) {
    send(codec::build_report_command("ReportCreate", request));
}

std::vector<std::string> Connection::report_rm(const ReportRequest& request) {
    return report_rm(request, inner_->config.read_timeout());
}

std::vector<std::string> Connection::report_rm(const ReportRequest& request,
                                               std::chrono::milliseconds timeout) {
    send(codec::build_report_command("Report_RM", request));

    auto buffer = inner_->transport.read_until_idle(timeout);
    if (buffer.empty()) {
        log::debug(inner_->config.on_log(), "Report_RM returned no data within the idle timeout");
        return {};
    }
    return inner_->protocol->decode_report(buffer);
}

} // namespace stk
