// src/sync_protocol.cpp
// Synchronous framing: ACK/NAC tokens and 40-byte text headers.

#include "codec.hpp"
#include "log.hpp"
#include "protocol.hpp"

#include <algorithm>
#include <cstdint>

namespace stk {

static bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\0';
}

static size_t parse_count(const std::string& body) {
    size_t begin = 0;
    size_t end = body.size();
    while (begin < end && is_blank(body[begin])) ++begin;
    while (end > begin && is_blank(body[end - 1])) --end;
    if (begin == end) {
        throw StkError::malformed_header("multi-message count is empty");
    }
    size_t value = 0;
    for (size_t i = begin; i < end; ++i) {
        char c = body[i];
        if (c < '0' || c > '9') {
            throw StkError::malformed_header("multi-message count is not numeric: '" + body + "'");
        }
        value = value * 10 + static_cast<size_t>(c - '0');
        if (value > UINT32_MAX) {
            throw StkError::malformed_header("multi-message count is out of range");
        }
    }
    return value;
}

void SyncProtocol::read_ack(const std::string& command) {
    auto token = codec::parse_simple_ack(transport_.read_exact(Wire::ACK_SIZE));
    if (token == codec::AckToken::Ack) {
        log::debug(on_log_, "ACK received");
        return;
    }

    // NACK status codes are assumed to be a single byte. A longer code
    // would leave bytes in the stream and desynchronize the next read.
    auto status = transport_.read_exact(Wire::NACK_CODE_SIZE);
    log::debug(on_log_, "NACK received (status '" + status + "') for: " + command);
    throw StkError::nack(command);
}

Message SyncProtocol::read_single_message() {
    auto [name, length] = codec::parse_sync_header(transport_.read_exact(Wire::SYNC_HEADER_SIZE));
    Message m;
    m.name = std::move(name);
    m.data = transport_.read_exact(length);
    return m;
}

std::vector<Message> SyncProtocol::read_multi_message() {
    Message count_msg = read_single_message();
    size_t count = parse_count(count_msg.data);

    std::vector<Message> messages;
    messages.reserve(std::min<size_t>(count, 1024));
    for (size_t i = 0; i < count; ++i) {
        messages.push_back(read_single_message());
    }
    return messages;
}

std::vector<std::string> SyncProtocol::decode_report(const std::string& buffer) const {
    std::vector<std::string> rows;
    if (buffer.empty()) return rows;

    // First frame carries the row count, the rest carry one row each. A
    // remote that pauses longer than the idle timeout leaves a cut-off frame
    // at the end; the rows decoded before it are kept.
    size_t incomplete = 0;
    auto frames = codec::split_sync_frames(buffer, &incomplete);
    if (incomplete > 0) {
        log::warning(on_log_, "Report_RM read ended inside a frame, " +
                              std::to_string(incomplete) + " trailing byte(s) not decoded");
    }
    for (size_t i = 1; i < frames.size(); ++i) {
        rows.push_back(std::move(frames[i].data));
    }
    if (!frames.empty()) {
        log::debug(on_log_, "Report_RM header '" + frames[0].name + " " + frames[0].data +
                            "', " + std::to_string(rows.size()) + " row(s) received");
    }
    return rows;
}

} // namespace stk
