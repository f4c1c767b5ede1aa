// include/stk/types.hpp
// Core enums, wire constants and value types shared across the library.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace stk {

// Response framing discipline negotiated at connect time.
enum class MessagingMode : uint8_t {
    Sync  = 0,  // 3-byte ACK/NACK, 40-byte "<name> <len>" headers
    Async = 1,  // 42-byte AGI envelope on every response
};

// Severity passed to the on_log callback.
enum class LogLevel : uint8_t {
    Critical = 0,
    Error    = 1,
    Warning  = 2,
    Info     = 3,
    Debug    = 4,
};

const char* to_string(LogLevel level) noexcept;

// Remote host and port of a Connect socket.
struct Endpoint {
    std::string host = "localhost";
    uint16_t port = 5001;

    // Parse "host:port". Throws StkError (Configuration) on bad input.
    static Endpoint parse(const std::string& text);

    std::string to_string() const { return host + ":" + std::to_string(port); }

    bool operator==(const Endpoint& other) const {
        return host == other.host && port == other.port;
    }
    bool operator!=(const Endpoint& other) const { return !(*this == other); }
};

// Wire-level constants of the Connect protocol.
struct Wire {
    static constexpr size_t ACK_SIZE = 3;
    static constexpr size_t NACK_CODE_SIZE = 1;
    static constexpr size_t SYNC_HEADER_SIZE = 40;
    static constexpr size_t ASYNC_HEADER_SIZE = 42;
    static constexpr size_t ASYNC_TYPE_FIELD_SIZE = 15;
    static constexpr size_t REPORT_ROW_PREFIX_SIZE = 18;

    static constexpr const char* ACK = "ACK";
    static constexpr const char* NACK = "NAC";
    static constexpr const char* ASYNC_SYNC = "AGI";
    static constexpr const char* ASYNC_ACK = "ACK";
    static constexpr const char* ASYNC_NACK = "NACK";

    static constexpr const char* REPORT_RM_MARKER = "AGI421009REPORT_RM      ";

    static constexpr const char* ASYNC_ON = "ConControl / AsyncOn";
    static constexpr const char* ACK_OFF = "ConControl / AckOff";
};

// Sentinel substrings of the application's stderr at launch.
struct Markers {
    static constexpr const char* READY = "STK/CON: Accepting connection requests";
    static constexpr const char* LICENSE_FAILURE = "STK Engine Runtime license not found";
    static constexpr const char* BIND_FAILURE = "STK/CON: Error binding to socket, error";
};

// Decoded 42-byte asynchronous message header.
struct AsyncHeader {
    std::string sync = Wire::ASYNC_SYNC;
    uint32_t header_length = 42;
    uint32_t major_version = 1;
    uint32_t minor_version = 0;
    uint32_t type_length = 0;
    std::string async_type;
    uint32_t identifier = 0;
    uint32_t total_packets = 1;
    uint32_t packet_number = 1;
    uint32_t data_length = 0;

    std::string version() const {
        return std::to_string(major_version) + "." + std::to_string(minor_version);
    }
};

// One framed response from the remote.
//
// Sync mode: name is the command name from the 40-byte header, header is empty.
// Async mode: name is the async_type and header carries the full envelope.
struct Message {
    std::string name;
    std::optional<AsyncHeader> header;
    std::string data;
};

// Parameters of a ReportCreate / Report_RM command. Unset optionals are omitted.
struct ReportRequest {
    std::string object_path;   // e.g. "Satellite/Sat1", prefixed with "*/"
    std::string style;         // built-in style name or path to a .rst file
    std::optional<std::string> type;       // e.g. "Export", "Save"
    std::optional<std::string> file_path;  // destination file
    std::optional<std::string> access_object;
    std::optional<std::string> time_period;
    std::optional<std::string> time_step;
    std::optional<std::string> additional_data;
    std::optional<std::string> summary;
    std::optional<std::string> all_lines;
};

} // namespace stk
