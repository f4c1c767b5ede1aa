// src/config.cpp
// Configuration builders, presets and install-directory discovery.

#include "stk/config.hpp"

#include <cstdlib>
#include <system_error>

namespace stk {

const char* to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Debug:    return "DEBUG";
    }
    return "UNKNOWN";
}

static uint16_t checked_port(int port) {
    if (port <= 0 || port > 65535) {
        throw StkError::configuration("port must be 1-65535, got: " + std::to_string(port));
    }
    return static_cast<uint16_t>(port);
}

Endpoint Endpoint::parse(const std::string& text) {
    auto colon = text.rfind(':');
    if (colon == std::string::npos) {
        throw StkError::configuration("endpoint must be host:port, got: " + text);
    }
    Endpoint result;
    result.host = text.substr(0, colon);
    if (result.host.empty()) {
        throw StkError::configuration("endpoint host is empty: " + text);
    }
    int port_int = 0;
    try {
        size_t consumed = 0;
        port_int = std::stoi(text.substr(colon + 1), &consumed);
        if (consumed != text.size() - colon - 1) {
            throw StkError::configuration("endpoint port is not a valid number: " + text);
        }
    } catch (const std::logic_error&) {
        throw StkError::configuration("endpoint port is not a valid number: " + text);
    }
    result.port = checked_port(port_int);
    return result;
}

// --- ConnectConfig presets ---

ConnectConfigBuilder ConnectConfig::builder() {
    return ConnectConfigBuilder();
}

ConnectConfig ConnectConfig::local() {
    return ConnectConfig::builder().build();
}

ConnectConfig ConnectConfig::local_async() {
    return ConnectConfig::builder().mode(MessagingMode::Async).build();
}

// --- ConnectConfigBuilder ---

ConnectConfigBuilder& ConnectConfigBuilder::host(std::string host) {
    config_.endpoint_.host = std::move(host);
    return *this;
}

ConnectConfigBuilder& ConnectConfigBuilder::port(int port) {
    port_ = port;
    return *this;
}

ConnectConfigBuilder& ConnectConfigBuilder::endpoint(const std::string& host_port) {
    auto ep = Endpoint::parse(host_port);
    config_.endpoint_.host = ep.host;
    port_ = ep.port;
    return *this;
}

ConnectConfigBuilder& ConnectConfigBuilder::ack(bool enabled) {
    config_.ack_ = enabled;
    return *this;
}

ConnectConfigBuilder& ConnectConfigBuilder::connect_attempts(uint32_t attempts) {
    config_.connect_attempts_ = attempts;
    return *this;
}

ConnectConfigBuilder& ConnectConfigBuilder::connect_retry_delay(std::chrono::milliseconds delay) {
    config_.connect_retry_delay_ = delay;
    return *this;
}

ConnectConfigBuilder& ConnectConfigBuilder::send_attempts(uint32_t attempts) {
    config_.send_attempts_ = attempts;
    return *this;
}

ConnectConfigBuilder& ConnectConfigBuilder::read_timeout(std::chrono::milliseconds timeout) {
    config_.read_timeout_ = timeout;
    return *this;
}

ConnectConfigBuilder& ConnectConfigBuilder::mode(MessagingMode mode) {
    config_.mode_ = mode;
    return *this;
}

ConnectConfigBuilder& ConnectConfigBuilder::async_messaging(bool enabled) {
    config_.mode_ = enabled ? MessagingMode::Async : MessagingMode::Sync;
    return *this;
}

ConnectConfigBuilder& ConnectConfigBuilder::on_log(LogCallback callback) {
    config_.on_log_ = std::move(callback);
    return *this;
}

ConnectConfigBuilder& ConnectConfigBuilder::on_connect_attempt(ConnectAttemptCallback callback) {
    config_.on_connect_attempt_ = std::move(callback);
    return *this;
}

ConnectConfig ConnectConfigBuilder::build() const {
    ConnectConfig result = config_;
    result.endpoint_.port = checked_port(port_);
    if (result.endpoint_.host.empty()) {
        throw StkError::configuration("host must not be empty");
    }
    if (result.connect_attempts_ == 0) {
        throw StkError::configuration("connect_attempts must be at least 1");
    }
    if (result.send_attempts_ == 0) {
        throw StkError::configuration("send_attempts must be at least 1");
    }
    if (result.read_timeout_.count() < 0 || result.connect_retry_delay_.count() < 0) {
        throw StkError::configuration("timeouts and delays must not be negative");
    }
    return result;
}

// --- Install directory discovery ---

static std::filesystem::path home_dir() {
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home);
    }
    return std::filesystem::path();
}

std::optional<std::filesystem::path> default_install_dir() {
    auto home = home_dir();
    if (home.empty()) return std::nullopt;

    std::error_code ec;
    auto candidate = home / "stk";
    if (std::filesystem::is_directory(candidate, ec) &&
        std::filesystem::is_regular_file(candidate / "bin" / "connectconsole", ec)) {
        return candidate;
    }
    return std::nullopt;
}

std::filesystem::path default_config_dir() {
    return home_dir() / "STK";
}

// --- LaunchConfig ---

LaunchConfigBuilder LaunchConfig::builder() {
    return LaunchConfigBuilder();
}

std::filesystem::path LaunchConfig::executable() const {
    if (!executable_.empty()) return executable_;
    return install_dir_ / "bin" / "connectconsole";
}

// --- LaunchConfigBuilder ---

LaunchConfigBuilder& LaunchConfigBuilder::install_dir(std::filesystem::path dir) {
    config_.install_dir_ = std::move(dir);
    return *this;
}

LaunchConfigBuilder& LaunchConfigBuilder::config_dir(std::filesystem::path dir) {
    config_.config_dir_ = std::move(dir);
    return *this;
}

LaunchConfigBuilder& LaunchConfigBuilder::executable(std::filesystem::path program) {
    config_.executable_ = std::move(program);
    return *this;
}

LaunchConfigBuilder& LaunchConfigBuilder::vendor_id(std::string id) {
    config_.vendor_id_ = std::move(id);
    return *this;
}

LaunchConfigBuilder& LaunchConfigBuilder::host(std::string host) {
    config_.host_ = std::move(host);
    return *this;
}

LaunchConfigBuilder& LaunchConfigBuilder::port(int port) {
    port_ = port;
    return *this;
}

LaunchConfigBuilder& LaunchConfigBuilder::port_delta(uint16_t delta) {
    config_.port_delta_ = delta;
    return *this;
}

LaunchConfigBuilder& LaunchConfigBuilder::run_attempts(uint32_t attempts) {
    config_.run_attempts_ = attempts;
    return *this;
}

LaunchConfigBuilder& LaunchConfigBuilder::poll_interval(std::chrono::milliseconds interval) {
    config_.poll_interval_ = interval;
    return *this;
}

LaunchConfigBuilder& LaunchConfigBuilder::ready_timeout(std::chrono::milliseconds timeout) {
    config_.ready_timeout_ = timeout;
    return *this;
}

LaunchConfigBuilder& LaunchConfigBuilder::retry_delay(std::chrono::milliseconds delay) {
    config_.retry_delay_ = delay;
    return *this;
}

LaunchConfigBuilder& LaunchConfigBuilder::on_log(LogCallback callback) {
    config_.on_log_ = std::move(callback);
    return *this;
}

LaunchConfig LaunchConfigBuilder::build() const {
    LaunchConfig result = config_;
    result.port_ = checked_port(port_);
    if (result.run_attempts_ == 0) {
        throw StkError::configuration("run_attempts must be at least 1");
    }

    if (result.install_dir_.empty()) {
        if (const char* env = std::getenv("STK_INSTALL_DIR")) {
            result.install_dir_ = env;
        } else if (auto found = default_install_dir()) {
            result.install_dir_ = *found;
        } else if (result.executable_.empty()) {
            throw StkError::configuration(
                "STK_INSTALL_DIR was not provided as an argument or environment variable, "
                "and no installation was found at ~/stk");
        }
    }
    if (result.config_dir_.empty()) {
        if (const char* env = std::getenv("STK_CONFIG_DIR")) {
            result.config_dir_ = env;
        } else {
            result.config_dir_ = default_config_dir();
        }
    }
    return result;
}

} // namespace stk
