#pragma once

#include "codec/decoder.hpp"
#include "codec/encoder.hpp"
#include "codec/value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mrpc::rpc {

enum class MessageKind : int {
    request = 0,
    response = 1,
    notification = 2,
};

struct Request {
    std::uint64_t id = 0;
    std::string method;
    std::vector<codec::Value> params;
};

struct Response {
    std::uint64_t id = 0;
    std::optional<codec::Value> error;
    codec::Value result;
};

struct Notification {
    std::string method;
    std::vector<codec::Value> params;
};

using Message = std::variant<Request, Response, Notification>;

/**
 * Envelope fields read by read_message_header().
 *
 * On return the decoder is positioned on the params array header for
 * requests and notifications (`argc` holds its length), and right before
 * the error value for responses.
 */
struct MessageHeader {
    MessageKind kind = MessageKind::request;
    std::uint64_t id = 0;
    std::string method;
    std::uint32_t argc = 0;
};

/// Reads the next envelope. Returns false at end of input. Throws
/// ProtocolError for a malformed envelope; the caller should then
/// discard_message() and carry on.
bool read_message_header(codec::Decoder& dec, MessageHeader& header);

/// Each writer emits the envelope up to (not including) the params or the
/// error value; the caller appends the rest.
void write_request_header(codec::Encoder& enc, std::uint64_t id, const std::string& method);
void write_response_header(codec::Encoder& enc, std::uint64_t id);
void write_notification_header(codec::Encoder& enc, const std::string& method);

void encode_message(codec::Encoder& enc, const Message& message);

/// Reads one whole message. Returns std::nullopt at end of input.
std::optional<Message> decode_message(codec::Decoder& dec);

} // namespace mrpc::rpc
