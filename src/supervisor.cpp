// src/supervisor.cpp
// Child process launch and stderr tailing.

#include "stk/supervisor.hpp"
#include "log.hpp"

#include <algorithm>
#include <cstring>
#include <iterator>
#include <thread>

// POSIX processes
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace stk {

// --- DiagnosticStream ---

void DiagnosticStream::push(std::string line) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back(std::move(line));
    }
    cv_.notify_one();
}

std::optional<std::string> DiagnosticStream::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (lines_.empty()) return std::nullopt;
    std::string line = std::move(lines_.front());
    lines_.pop_front();
    return line;
}

std::optional<std::string> DiagnosticStream::pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !lines_.empty() || closed_; });
    if (lines_.empty()) return std::nullopt;
    std::string line = std::move(lines_.front());
    lines_.pop_front();
    return line;
}

std::vector<std::string> DiagnosticStream::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out(std::make_move_iterator(lines_.begin()),
                                 std::make_move_iterator(lines_.end()));
    lines_.clear();
    return out;
}

void DiagnosticStream::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool DiagnosticStream::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void DiagnosticStream::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
    closed_ = false;
}

size_t DiagnosticStream::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

// --- Supervisor ---

Supervisor::Supervisor(LaunchConfig config)
    : config_(std::move(config)), port_(config_.port()) {}

Supervisor::~Supervisor() {
    kill();
}

Endpoint Supervisor::endpoint() const {
    Endpoint ep;
    ep.host = config_.host();
    ep.port = port_;
    return ep;
}

Endpoint Supervisor::run() {
    const auto& on_log = config_.on_log();
    for (uint32_t attempt = 1;; ++attempt) {
        attempts_used_ = attempt;
        log::debug(on_log, "attempting to launch STK (" + std::to_string(attempt) + " of " +
                           std::to_string(config_.run_attempts()) + ") on " +
                           endpoint().to_string());
        try {
            start();
            wait_ready();
            return endpoint();
        } catch (const StkError& e) {
            log::error(on_log, std::string("launch attempt failed: ") + e.what());
            kill();
            if (e.kind() == ErrorKind::License || attempt >= config_.run_attempts()) {
                if (e.kind() != ErrorKind::License) {
                    log::critical(on_log, "attempted to launch STK, exceeded max attempts (" +
                                          std::to_string(config_.run_attempts()) + ")");
                }
                throw;
            }
        }
        std::this_thread::sleep_for(config_.retry_delay());
    }
}

DiagnosticStream& Supervisor::start() {
    if (pid_ > 0 && running()) {
        throw StkError::launch("application is already running (pid " + std::to_string(pid_) + ")");
    }
    stop_reader();
    diagnostics_.reset();

    // Everything the child needs is built before fork().
    std::string exe = config_.executable().string();
    std::vector<std::string> args = {exe, "--port", std::to_string(port_), "--noGraphics"};
    if (config_.vendor_id()) {
        args.push_back("--vendorid");
        args.push_back(*config_.vendor_id());
    }

    std::vector<std::string> env;
    std::string old_ld_path;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        if (entry.rfind("STK_INSTALL_DIR=", 0) == 0 || entry.rfind("STK_CONFIG_DIR=", 0) == 0) {
            continue;
        }
        if (entry.rfind("LD_LIBRARY_PATH=", 0) == 0) {
            old_ld_path = entry.substr(std::strlen("LD_LIBRARY_PATH="));
            continue;
        }
        env.push_back(std::move(entry));
    }
    auto bin_dir = (config_.install_dir() / "bin").string();
    env.push_back("STK_INSTALL_DIR=" + config_.install_dir().string());
    env.push_back("STK_CONFIG_DIR=" + config_.config_dir().string());
    env.push_back("LD_LIBRARY_PATH=" + bin_dir + (old_ld_path.empty() ? "" : ":" + old_ld_path));

    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);
    std::vector<char*> envp;
    for (auto& e : env) envp.push_back(e.data());
    envp.push_back(nullptr);

    command_line_.clear();
    for (const auto& a : args) {
        if (!command_line_.empty()) command_line_ += ' ';
        command_line_ += a;
    }

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw StkError::launch(std::string("pipe failed: ") + std::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        throw StkError::launch(std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        ::dup2(fds[1], STDERR_FILENO);
        ::execve(argv[0], argv.data(), envp.data());
        static const char msg[] = "exec failed\n";
        ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        ::_exit(127);
    }

    ::close(fds[1]);
    pid_ = pid;
    stderr_fd_ = fds[0];
    log::debug(config_.on_log(), "launched '" + command_line_ + "' (pid " + std::to_string(pid_) + ")");

    reading_.store(true);
    reader_ = std::thread(&Supervisor::reader_loop, this, stderr_fd_);
    return diagnostics_;
}

void Supervisor::reader_loop(int fd) {
    std::string partial;
    char chunk[1024];

    while (reading_.load()) {
        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, 100);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) continue;

        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            break;
        }
        if (n == 0) break;

        partial.append(chunk, static_cast<size_t>(n));
        size_t nl;
        while ((nl = partial.find('\n')) != std::string::npos) {
            std::string line = partial.substr(0, nl);
            while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
            diagnostics_.push(std::move(line));
            partial.erase(0, nl + 1);
        }
    }

    if (!partial.empty()) diagnostics_.push(std::move(partial));
    diagnostics_.close();
}

void Supervisor::wait_ready() {
    const auto& on_log = config_.on_log();
    auto deadline = std::chrono::steady_clock::now() + config_.ready_timeout();

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            throw StkError::launch("no ready marker within " +
                                   std::to_string(config_.ready_timeout().count()) + " ms");
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto line = diagnostics_.pop_for(std::min(config_.poll_interval(), remaining));

        if (!line) {
            if (diagnostics_.closed() && diagnostics_.size() == 0) {
                throw StkError::launch("application exited before accepting connections: " +
                                       command_line_);
            }
            log::debug(on_log, "no output from STK yet");
            continue;
        }

        log::debug(on_log, "got output from STK: " + *line);
        if (line->find(Markers::LICENSE_FAILURE) != std::string::npos) {
            throw StkError::license(Markers::LICENSE_FAILURE);
        }
        if (line->find(Markers::BIND_FAILURE) != std::string::npos) {
            uint16_t old_port = port_;
            port_ = static_cast<uint16_t>(port_ + config_.port_delta());
            log::debug(on_log, "STK could not bind to port=" + std::to_string(old_port) +
                               ", setting port=" + std::to_string(port_) + " for retry");
            throw StkError::bind(std::string(Markers::BIND_FAILURE) + " (port " +
                                 std::to_string(old_port) + ")");
        }
        if (line->find(Markers::READY) != std::string::npos) {
            log::info(on_log, "STK is accepting connection requests at " + endpoint().to_string());
            return;
        }
    }
}

std::vector<std::string> Supervisor::drain_diagnostics() {
    return diagnostics_.drain();
}

bool Supervisor::running() {
    if (pid_ <= 0) return false;
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == 0) return true;
    pid_ = -1;
    return false;
}

void Supervisor::kill() {
    if (pid_ > 0) {
        log::debug(config_.on_log(), "killing STK process (pid " + std::to_string(pid_) + ")");
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        pid_ = -1;
    }
    stop_reader();
}

void Supervisor::stop_reader() {
    reading_.store(false);
    if (reader_.joinable()) reader_.join();
    if (stderr_fd_ >= 0) {
        ::close(stderr_fd_);
        stderr_fd_ = -1;
    }
}

} // namespace stk
