// src/codec.hpp
// Connect wire frame codec: ACK tokens, message headers, command lines and
// report buffers. Pure functions, no I/O.

#pragma once

#include "stk/error.hpp"
#include "stk/types.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stk {
namespace codec {

enum class AckToken {
    Ack,
    Nack,  // caller must consume Wire::NACK_CODE_SIZE more bytes
};

// Decode a 3-byte synchronous acknowledgement. Throws MalformedHeader on
// anything other than "ACK" or "NAC".
AckToken parse_simple_ack(std::string_view bytes);

// Decode a 42-byte asynchronous header. Throws MalformedHeader if the sync
// marker is not "AGI", a numeric field is not decimal, or the type length
// does not fit the 15-byte type field.
AsyncHeader parse_async_header(std::string_view bytes);

// Encode an AsyncHeader into its 42-byte wire form. type_length is taken
// from async_type. Throws Validation if a field does not fit its width.
std::string encode_async_header(const AsyncHeader& header);

// Decode a 40-byte synchronous header "<name> <decimal length>".
std::pair<std::string, size_t> parse_sync_header(std::string_view bytes);

// Encode a 40-byte synchronous header, blank padded.
std::string encode_sync_header(const std::string& name, size_t length);

// Frame a command line. Throws Validation if text contains a line break.
std::string build_command(const std::string& text);

// Split a Report_RM buffer on marker, dropping the pre-marker segment and
// prefix_size bytes of sub-header from every row.
std::vector<std::string> split_report_buffer(const std::string& buffer,
                                             const std::string& marker,
                                             size_t prefix_size = Wire::REPORT_ROW_PREFIX_SIZE);

// Decode the complete frames at the front of a buffer of back-to-back
// 40-byte-header frames. A frame cut off by the end of the buffer is left
// undecoded and its byte count stored in *incomplete. Throws MalformedHeader
// if a complete header does not parse.
std::vector<Message> split_sync_frames(const std::string& buffer,
                                       size_t* incomplete = nullptr);

// Build a report command: "<verb> */<object> Style "<style>"" followed by
// the optional clauses in their fixed order.
std::string build_report_command(const std::string& verb, const ReportRequest& request);

} // namespace codec
} // namespace stk
