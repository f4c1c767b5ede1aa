// include/stk/session.hpp
// Optional launched application plus its Connect client.

#pragma once

#include "config.hpp"
#include "connection.hpp"
#include "error.hpp"
#include "supervisor.hpp"
#include "types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stk {

// Owns a Connection and, when given a LaunchConfig, the Supervisor of the
// application it talks to.
//
// Example:
//   Session session(ConnectConfig::local(), LaunchConfig::builder().build());
//   session.launch();
//   session.connect();
//   session.send("New / Scenario Demo");
//   session.close();
class Session {
public:
    explicit Session(ConnectConfig connect_config);
    Session(ConnectConfig connect_config, LaunchConfig launch_config);

    // close()
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Start the application and point the connection at the port it
    // reported ready on. Throws StkError (Configuration) without a
    // LaunchConfig.
    void launch();

    void connect();

    // On NACK the application's pending stderr is logged at Critical level
    // before the error is rethrown.
    void send(const std::string& command);
    void send(const std::string& command, uint32_t attempts);

    void report(const ReportRequest& request);
    std::vector<std::string> report_rm(const ReportRequest& request);
    std::vector<std::string> report_rm(const ReportRequest& request,
                                       std::chrono::milliseconds timeout);

    // Close the socket; the application keeps running.
    void disconnect();

    // Close the socket and kill the application.
    void close();

    Connection& connection() noexcept { return *connection_; }
    Supervisor* supervisor() noexcept { return supervisor_.get(); }

private:
    template <typename Fn>
    auto guarded(const char* what, Fn&& fn) -> decltype(fn());

    void dump_diagnostics();

    LogCallback on_log_;
    std::unique_ptr<Connection> connection_;
    std::unique_ptr<Supervisor> supervisor_;
};

} // namespace stk
