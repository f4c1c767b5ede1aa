// include/stk/supervisor.hpp
// Launches the Connect console application and watches its stderr for the
// ready / license / bind markers.

#pragma once

#include "config.hpp"
#include "error.hpp"
#include "types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace stk {

// Line queue filled by the stderr reader thread and polled by the launch loop.
class DiagnosticStream {
public:
    void push(std::string line);

    // Non-blocking.
    std::optional<std::string> try_pop();

    // Wait up to `timeout` for a line. Returns nullopt on timeout or when
    // the stream is closed and empty.
    std::optional<std::string> pop_for(std::chrono::milliseconds timeout);

    // Remove and return every queued line.
    std::vector<std::string> drain();

    // Marks end of input; wakes waiters.
    void close();
    bool closed() const;

    void reset();
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> lines_;
    bool closed_ = false;
};

// Runs one instance of the application as a child process.
//
// Example:
//   Supervisor sup(LaunchConfig::builder().vendor_id("ABC").build());
//   Endpoint ep = sup.run();   // waits for "Accepting connection requests"
class Supervisor {
public:
    explicit Supervisor(LaunchConfig config);

    // Kills the child and joins the reader thread.
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // Launch and wait for readiness, up to run_attempts times. A bind
    // failure shifts the port by port_delta before the next attempt; a
    // license failure is fatal immediately. Throws the last StkError.
    Endpoint run();

    // Spawn the child with stderr piped into diagnostics().
    // Throws StkError (Launch).
    DiagnosticStream& start();

    // Poll diagnostics until a marker appears. Throws StkError (License,
    // Bind or Launch); Bind also shifts port() by port_delta.
    void wait_ready();

    // Queued stderr lines not yet consumed.
    std::vector<std::string> drain_diagnostics();

    void kill();

    // False once the child has exited (reaps it).
    bool running();

    int pid() const noexcept { return pid_; }
    uint16_t port() const noexcept { return port_; }
    Endpoint endpoint() const;
    uint32_t launch_attempts_used() const noexcept { return attempts_used_; }
    const std::string& command_line() const noexcept { return command_line_; }
    const LaunchConfig& config() const noexcept { return config_; }
    DiagnosticStream& diagnostics() noexcept { return diagnostics_; }

private:
    void reader_loop(int fd);
    void stop_reader();

    LaunchConfig config_;
    uint16_t port_;
    int pid_ = -1;
    int stderr_fd_ = -1;
    uint32_t attempts_used_ = 0;
    std::string command_line_;

    DiagnosticStream diagnostics_;
    std::thread reader_;
    std::atomic<bool> reading_{false};
};

} // namespace stk
