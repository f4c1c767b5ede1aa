// src/codec.cpp
// Connect wire frame codec.

#include "codec.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace stk {
namespace codec {

static std::string printable(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (char c : bytes) {
        out.push_back(std::isprint(static_cast<unsigned char>(c)) ? c : '?');
    }
    return out;
}

// Fixed-width ASCII decimal field. Surrounding blanks are tolerated.
static uint32_t parse_decimal(std::string_view field, const char* name) {
    size_t begin = 0;
    size_t end = field.size();
    while (begin < end && field[begin] == ' ') ++begin;
    while (end > begin && field[end - 1] == ' ') --end;
    if (begin == end) {
        throw StkError::malformed_header(std::string(name) + " is empty");
    }
    uint64_t value = 0;
    for (size_t i = begin; i < end; ++i) {
        char c = field[i];
        if (c < '0' || c > '9') {
            throw StkError::malformed_header(std::string(name) + " is not numeric: '" +
                                             printable(field) + "'");
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
        if (value > UINT32_MAX) {
            throw StkError::malformed_header(std::string(name) + " is out of range");
        }
    }
    return static_cast<uint32_t>(value);
}

static void append_decimal(std::string& out, uint64_t value, int width, const char* name) {
    char buf[24];
    int n = std::snprintf(buf, sizeof(buf), "%0*llu", width,
                          static_cast<unsigned long long>(value));
    if (n != width) {
        throw StkError::validation(std::string(name) + " does not fit in " +
                                   std::to_string(width) + " digits");
    }
    out.append(buf, static_cast<size_t>(n));
}

AckToken parse_simple_ack(std::string_view bytes) {
    if (bytes == Wire::ACK) return AckToken::Ack;
    if (bytes == Wire::NACK) return AckToken::Nack;
    throw StkError::malformed_header("expecting ACK or NACK, got: '" + printable(bytes) + "'");
}

AsyncHeader parse_async_header(std::string_view bytes) {
    if (bytes.size() != Wire::ASYNC_HEADER_SIZE) {
        throw StkError::malformed_header("async header must be 42 bytes, got " +
                                         std::to_string(bytes.size()));
    }
    if (bytes.substr(0, 3) != Wire::ASYNC_SYNC) {
        throw StkError::malformed_header("bad sync marker: '" + printable(bytes.substr(0, 3)) + "'");
    }

    AsyncHeader h;
    h.sync = std::string(bytes.substr(0, 3));
    h.header_length = parse_decimal(bytes.substr(3, 2), "header_length");
    h.major_version = parse_decimal(bytes.substr(5, 1), "major_version");
    h.minor_version = parse_decimal(bytes.substr(6, 1), "minor_version");
    h.type_length = parse_decimal(bytes.substr(7, 2), "type_length");
    if (h.type_length > Wire::ASYNC_TYPE_FIELD_SIZE) {
        throw StkError::malformed_header("type_length " + std::to_string(h.type_length) +
                                         " exceeds the 15-byte type field");
    }
    h.async_type = std::string(bytes.substr(9, h.type_length));
    h.identifier = parse_decimal(bytes.substr(24, 6), "identifier");
    h.total_packets = parse_decimal(bytes.substr(30, 4), "total_packets");
    h.packet_number = parse_decimal(bytes.substr(34, 4), "packet_number");
    h.data_length = parse_decimal(bytes.substr(38, 4), "data_length");
    return h;
}

std::string encode_async_header(const AsyncHeader& header) {
    if (header.sync.size() != 3) {
        throw StkError::validation("sync marker must be 3 bytes");
    }
    if (header.async_type.size() > Wire::ASYNC_TYPE_FIELD_SIZE) {
        throw StkError::validation("async_type longer than 15 bytes");
    }

    std::string out;
    out.reserve(Wire::ASYNC_HEADER_SIZE);
    out += header.sync;
    append_decimal(out, header.header_length, 2, "header_length");
    append_decimal(out, header.major_version, 1, "major_version");
    append_decimal(out, header.minor_version, 1, "minor_version");
    append_decimal(out, header.async_type.size(), 2, "type_length");
    out += header.async_type;
    out.append(Wire::ASYNC_TYPE_FIELD_SIZE - header.async_type.size(), ' ');
    append_decimal(out, header.identifier, 6, "identifier");
    append_decimal(out, header.total_packets, 4, "total_packets");
    append_decimal(out, header.packet_number, 4, "packet_number");
    append_decimal(out, header.data_length, 4, "data_length");
    return out;
}

std::pair<std::string, size_t> parse_sync_header(std::string_view bytes) {
    if (bytes.size() != Wire::SYNC_HEADER_SIZE) {
        throw StkError::malformed_header("sync header must be 40 bytes, got " +
                                         std::to_string(bytes.size()));
    }

    std::vector<std::string_view> tokens;
    size_t i = 0;
    while (i < bytes.size()) {
        while (i < bytes.size() && (bytes[i] == ' ' || bytes[i] == '\0')) ++i;
        size_t start = i;
        while (i < bytes.size() && bytes[i] != ' ' && bytes[i] != '\0') ++i;
        if (i > start) tokens.push_back(bytes.substr(start, i - start));
    }
    if (tokens.size() != 2) {
        throw StkError::malformed_header("expecting '<name> <length>', got: '" +
                                         printable(bytes) + "'");
    }
    return {std::string(tokens[0]), parse_decimal(tokens[1], "length")};
}

std::string encode_sync_header(const std::string& name, size_t length) {
    std::string out = name + " " + std::to_string(length);
    if (out.size() > Wire::SYNC_HEADER_SIZE) {
        throw StkError::validation("sync header longer than 40 bytes");
    }
    out.append(Wire::SYNC_HEADER_SIZE - out.size(), ' ');
    return out;
}

std::string build_command(const std::string& text) {
    if (text.find_first_of("\r\n") != std::string::npos) {
        throw StkError::validation("command contains a line break: " + text);
    }
    std::string out;
    out.reserve(text.size() + 1);
    out += text;
    out.push_back('\n');
    return out;
}

std::vector<std::string> split_report_buffer(const std::string& buffer,
                                             const std::string& marker,
                                             size_t prefix_size) {
    std::vector<std::string> rows;
    if (marker.empty()) return rows;

    size_t pos = buffer.find(marker);
    while (pos != std::string::npos) {
        size_t start = pos + marker.size();
        size_t next = buffer.find(marker, start);
        size_t end = next == std::string::npos ? buffer.size() : next;
        size_t row_start = std::min(start + prefix_size, end);
        rows.emplace_back(buffer, row_start, end - row_start);
        pos = next;
    }
    return rows;
}

std::vector<Message> split_sync_frames(const std::string& buffer, size_t* incomplete) {
    std::vector<Message> frames;
    size_t pos = 0;
    while (buffer.size() - pos >= Wire::SYNC_HEADER_SIZE) {
        auto [name, length] = parse_sync_header(
            std::string_view(buffer).substr(pos, Wire::SYNC_HEADER_SIZE));
        if (buffer.size() - pos - Wire::SYNC_HEADER_SIZE < length) break;
        pos += Wire::SYNC_HEADER_SIZE;
        Message m;
        m.name = std::move(name);
        m.data = buffer.substr(pos, length);
        frames.push_back(std::move(m));
        pos += length;
    }
    if (incomplete) *incomplete = buffer.size() - pos;
    return frames;
}

std::string build_report_command(const std::string& verb, const ReportRequest& request) {
    std::string message = verb + " */" + request.object_path +
                          " Style \"" + request.style + "\"";
    if (request.type)            message += " Type " + *request.type;
    if (request.file_path)       message += " File \"" + *request.file_path + "\"";
    if (request.access_object)   message += " AccessObject " + *request.access_object;
    if (request.time_period)     message += " TimePeriod " + *request.time_period;
    if (request.time_step)       message += " TimeStep " + *request.time_step;
    if (request.additional_data) message += " AdditionalData \"" + *request.additional_data + "\"";
    if (request.summary)         message += " Summary " + *request.summary;
    if (request.all_lines)       message += " AllLines " + *request.all_lines;
    return message;
}

} // namespace codec
} // namespace stk
