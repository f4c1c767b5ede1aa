// include/stk/config.hpp
// Flat configuration structs with builder pattern.

#pragma once

#include "error.hpp"
#include "types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace stk {

using LogCallback = std::function<void(LogLevel, const std::string&)>;

// Invoked once per socket connect attempt; refused is true when the
// attempt was answered with ECONNREFUSED and will be retried.
using ConnectAttemptCallback = std::function<void(uint32_t attempt, bool refused)>;

class ConnectConfigBuilder;

// Configuration for a Connect socket client.
class ConnectConfig {
public:
    static ConnectConfigBuilder builder();

    // localhost:5001, synchronous framing, acknowledgements on.
    static ConnectConfig local();
    // localhost:5001 with asynchronous framing.
    static ConnectConfig local_async();

    const Endpoint& endpoint() const noexcept { return endpoint_; }
    const std::string& host() const noexcept { return endpoint_.host; }
    uint16_t port() const noexcept { return endpoint_.port; }
    bool ack() const noexcept { return ack_; }
    uint32_t connect_attempts() const noexcept { return connect_attempts_; }
    std::chrono::milliseconds connect_retry_delay() const noexcept { return connect_retry_delay_; }
    uint32_t send_attempts() const noexcept { return send_attempts_; }
    std::chrono::milliseconds read_timeout() const noexcept { return read_timeout_; }
    MessagingMode mode() const noexcept { return mode_; }
    const LogCallback& on_log() const noexcept { return on_log_; }
    const ConnectAttemptCallback& on_connect_attempt() const noexcept { return on_connect_attempt_; }

private:
    friend class ConnectConfigBuilder;

    Endpoint endpoint_;
    bool ack_ = true;
    uint32_t connect_attempts_ = 5;
    std::chrono::milliseconds connect_retry_delay_{3000};
    uint32_t send_attempts_ = 1;
    std::chrono::milliseconds read_timeout_{1000};
    MessagingMode mode_ = MessagingMode::Sync;
    LogCallback on_log_;
    ConnectAttemptCallback on_connect_attempt_;
};

// Fluent builder for ConnectConfig.
class ConnectConfigBuilder {
public:
    ConnectConfigBuilder() = default;

    ConnectConfigBuilder& host(std::string host);
    ConnectConfigBuilder& port(int port);
    ConnectConfigBuilder& endpoint(const std::string& host_port);
    ConnectConfigBuilder& ack(bool enabled);
    ConnectConfigBuilder& connect_attempts(uint32_t attempts);
    ConnectConfigBuilder& connect_retry_delay(std::chrono::milliseconds delay);
    ConnectConfigBuilder& send_attempts(uint32_t attempts);
    ConnectConfigBuilder& read_timeout(std::chrono::milliseconds timeout);
    ConnectConfigBuilder& mode(MessagingMode mode);
    ConnectConfigBuilder& async_messaging(bool enabled);
    ConnectConfigBuilder& on_log(LogCallback callback);
    ConnectConfigBuilder& on_connect_attempt(ConnectAttemptCallback callback);

    // Build the config. Throws StkError on invalid values.
    ConnectConfig build() const;

private:
    ConnectConfig config_;
    int port_ = 5001;
};

class LaunchConfigBuilder;

// Configuration for launching the application with the Supervisor.
class LaunchConfig {
public:
    static LaunchConfigBuilder builder();

    const std::filesystem::path& install_dir() const noexcept { return install_dir_; }
    const std::filesystem::path& config_dir() const noexcept { return config_dir_; }

    // Program to run; defaults to <install_dir>/bin/connectconsole.
    std::filesystem::path executable() const;

    const std::optional<std::string>& vendor_id() const noexcept { return vendor_id_; }
    const std::string& host() const noexcept { return host_; }
    uint16_t port() const noexcept { return port_; }
    uint16_t port_delta() const noexcept { return port_delta_; }
    uint32_t run_attempts() const noexcept { return run_attempts_; }
    std::chrono::milliseconds poll_interval() const noexcept { return poll_interval_; }
    std::chrono::milliseconds ready_timeout() const noexcept { return ready_timeout_; }
    std::chrono::milliseconds retry_delay() const noexcept { return retry_delay_; }
    const LogCallback& on_log() const noexcept { return on_log_; }

private:
    friend class LaunchConfigBuilder;

    std::filesystem::path install_dir_;
    std::filesystem::path config_dir_;
    std::filesystem::path executable_;
    std::optional<std::string> vendor_id_;
    std::string host_ = "localhost";
    uint16_t port_ = 5001;
    uint16_t port_delta_ = 1000;
    uint32_t run_attempts_ = 1;
    std::chrono::milliseconds poll_interval_{3000};
    std::chrono::milliseconds ready_timeout_{120000};
    std::chrono::milliseconds retry_delay_{3000};
    LogCallback on_log_;
};

// Fluent builder for LaunchConfig.
class LaunchConfigBuilder {
public:
    LaunchConfigBuilder() = default;

    LaunchConfigBuilder& install_dir(std::filesystem::path dir);
    LaunchConfigBuilder& config_dir(std::filesystem::path dir);
    LaunchConfigBuilder& executable(std::filesystem::path program);
    LaunchConfigBuilder& vendor_id(std::string id);
    LaunchConfigBuilder& host(std::string host);
    LaunchConfigBuilder& port(int port);
    LaunchConfigBuilder& port_delta(uint16_t delta);
    LaunchConfigBuilder& run_attempts(uint32_t attempts);
    LaunchConfigBuilder& poll_interval(std::chrono::milliseconds interval);
    LaunchConfigBuilder& ready_timeout(std::chrono::milliseconds timeout);
    LaunchConfigBuilder& retry_delay(std::chrono::milliseconds delay);
    LaunchConfigBuilder& on_log(LogCallback callback);

    // Build the config. Resolves install/config dirs from STK_INSTALL_DIR /
    // STK_CONFIG_DIR or the platform defaults when not set explicitly.
    // Throws StkError (Configuration) when no install dir can be found and
    // no executable override was given.
    LaunchConfig build() const;

private:
    LaunchConfig config_;
    int port_ = 5001;
};

// ~/stk when it contains bin/connectconsole.
std::optional<std::filesystem::path> default_install_dir();

// ~/STK
std::filesystem::path default_config_dir();

} // namespace stk
