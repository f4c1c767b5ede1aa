// include/stk/error.hpp
// Error handling: a single exception class with a kind enum.

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace stk {

enum class ErrorKind {
    Configuration,   // Invalid config at construction
    Validation,      // Bad input (e.g. command containing a newline)
    Connect,         // Socket connect failed or exhausted retries
    Nack,            // Remote rejected a command after all send attempts
    MalformedHeader, // Wire data does not match the expected framing
    License,         // Application reported a missing license at launch
    Bind,            // Application could not bind its Connect port
    Launch,          // Application failed to start or never became ready
    Closed,          // Operation on an unconnected Connection
    Io               // Socket or system I/O error
};

class StkError : public std::exception {
public:
    StkError(ErrorKind kind, std::string message)
        : kind_(kind), message_(std::move(message)) {}

    StkError(ErrorKind kind, std::string message, std::string command)
        : kind_(kind), message_(std::move(message)), command_(std::move(command)) {}

    const char* what() const noexcept override { return message_.c_str(); }
    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }

    // Offending command text (Nack only).
    const std::string& command() const noexcept { return command_; }

    static StkError configuration(const std::string& msg) {
        return StkError(ErrorKind::Configuration, "configuration error: " + msg);
    }

    static StkError validation(const std::string& msg) {
        return StkError(ErrorKind::Validation, "validation error: " + msg);
    }

    static StkError connect(const std::string& msg) {
        return StkError(ErrorKind::Connect, "connect error: " + msg);
    }

    static StkError nack(const std::string& command) {
        return StkError(ErrorKind::Nack,
                        "NACK received: stk.send(\"" + command + "\")", command);
    }

    static StkError malformed_header(const std::string& msg) {
        return StkError(ErrorKind::MalformedHeader, "malformed header: " + msg);
    }

    static StkError license(const std::string& msg) {
        return StkError(ErrorKind::License, "license error: " + msg);
    }

    static StkError bind(const std::string& msg) {
        return StkError(ErrorKind::Bind, "bind error: " + msg);
    }

    static StkError launch(const std::string& msg) {
        return StkError(ErrorKind::Launch, "launch error: " + msg);
    }

    static StkError closed() {
        return StkError(ErrorKind::Closed, "connection is not open");
    }

    static StkError io(const std::string& msg) {
        return StkError(ErrorKind::Io, "io error: " + msg);
    }

private:
    ErrorKind kind_;
    std::string message_;
    std::string command_;
};

} // namespace stk
