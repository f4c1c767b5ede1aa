// src/session.cpp
// Session: launch, connect and command delegation.

#include "stk/session.hpp"
#include "log.hpp"

namespace stk {

Session::Session(ConnectConfig connect_config)
    : on_log_(connect_config.on_log()),
      connection_(Connection::create(std::move(connect_config))) {}

Session::Session(ConnectConfig connect_config, LaunchConfig launch_config)
    : on_log_(connect_config.on_log()),
      connection_(Connection::create(std::move(connect_config))),
      supervisor_(std::make_unique<Supervisor>(std::move(launch_config))) {}

Session::~Session() {
    close();
}

void Session::launch() {
    if (!supervisor_) {
        throw StkError::configuration("session has no launch configuration");
    }
    Endpoint ready = supervisor_->run();
    connection_->set_endpoint(ready);
}

void Session::connect() {
    connection_->connect();
}

template <typename Fn>
auto Session::guarded(const char* what, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const StkError& e) {
        if (e.kind() == ErrorKind::Nack) {
            log::warning(on_log_, std::string("STK NACK on ") + what);
            dump_diagnostics();
        }
        throw;
    }
}

void Session::send(const std::string& command) {
    guarded("send", [&] { connection_->send(command); });
}

void Session::send(const std::string& command, uint32_t attempts) {
    guarded("send", [&] { connection_->send(command, attempts); });
}

void Session::report(const ReportRequest& request) {
    guarded("ReportCreate", [&] { connection_->report(request); });
}

std::vector<std::string> Session::report_rm(const ReportRequest& request) {
    return guarded("Report_RM", [&] { return connection_->report_rm(request); });
}

std::vector<std::string> Session::report_rm(const ReportRequest& request,
                                            std::chrono::milliseconds timeout) {
    return guarded("Report_RM", [&] { return connection_->report_rm(request, timeout); });
}

void Session::dump_diagnostics() {
    if (!supervisor_) return;
    log::critical(on_log_, "dumping STK stderr:");
    for (const auto& line : supervisor_->drain_diagnostics()) {
        log::critical(on_log_, "STK said: " + line);
    }
}

void Session::disconnect() {
    if (connection_) connection_->close();
}

void Session::close() {
    disconnect();
    if (supervisor_) supervisor_->kill();
}

} // namespace stk
