// src/async_protocol.cpp
// Asynchronous framing: 42-byte AGI envelope and multi-packet reassembly.

#include "codec.hpp"
#include "log.hpp"
#include "protocol.hpp"

#include <optional>

namespace stk {

std::vector<std::string> AsyncProtocol::handshake_commands() const {
    return {Wire::ASYNC_ON};
}

Message AsyncProtocol::read_single_message() {
    AsyncHeader header = codec::parse_async_header(transport_.read_exact(Wire::ASYNC_HEADER_SIZE));

    Message m;
    m.name = header.async_type;
    m.data = transport_.read_exact(header.data_length);
    m.header = std::move(header);
    return m;
}

void AsyncProtocol::read_ack(const std::string& command) {
    Message m = read_single_message();
    if (m.name == Wire::ASYNC_ACK) {
        log::debug(on_log_, "ACK received");
        return;
    }
    if (m.name == Wire::ASYNC_NACK) {
        log::debug(on_log_, "NACK received for: " + command);
        throw StkError::nack(command);
    }
    throw StkError::malformed_header("expecting ACK or NACK message, got type '" + m.name + "'");
}

std::vector<Message> AsyncProtocol::read_multi_message() {
    Message first = read_single_message();
    const uint32_t total = first.header->total_packets;
    const uint32_t identifier = first.header->identifier;
    if (total == 0) {
        throw StkError::malformed_header("message group declares zero packets");
    }

    // Packets are placed by packet_number, whatever order they arrive in.
    std::vector<std::optional<Message>> group(total);
    auto place = [&](Message m) {
        uint32_t number = m.header->packet_number;
        if (m.header->identifier != identifier || m.header->total_packets != total) {
            throw StkError::malformed_header(
                "packet " + std::to_string(number) + " of message " +
                std::to_string(m.header->identifier) + "/" + std::to_string(m.header->total_packets) +
                " does not belong to group " + std::to_string(identifier) + "/" +
                std::to_string(total));
        }
        if (number == 0 || number > total) {
            throw StkError::malformed_header("packet " + std::to_string(number) +
                                             " outside group of " + std::to_string(total));
        }
        if (group[number - 1]) {
            throw StkError::malformed_header("duplicate packet " + std::to_string(number));
        }
        log::debug(on_log_, "got packet " + std::to_string(number) + " of " +
                            std::to_string(total) + " (" + m.name + ")");
        group[number - 1] = std::move(m);
    };

    place(std::move(first));
    for (uint32_t i = 1; i < total; ++i) {
        place(read_single_message());
    }

    std::vector<Message> messages;
    messages.reserve(total);
    for (auto& slot : group) {
        messages.push_back(std::move(*slot));
    }
    if (messages.back().data.empty()) {
        messages.pop_back();
    }
    return messages;
}

std::vector<std::string> AsyncProtocol::decode_report(const std::string& buffer) const {
    return codec::split_report_buffer(buffer, Wire::REPORT_RM_MARKER);
}

} // namespace stk
