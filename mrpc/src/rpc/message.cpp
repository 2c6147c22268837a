#include "message.hpp"

#include "codec/binding.hpp"
#include "errors.hpp"

namespace mrpc::rpc {

namespace {

void expect_arity(std::uint32_t arity, std::uint32_t expected, const char* kind) {
    if (arity != expected) {
        throw ProtocolError(std::string("mrpc: ") + kind + " has " + std::to_string(arity) + " elements, want " +
                            std::to_string(expected));
    }
}

void next_field(codec::Decoder& dec) {
    if (!dec.next()) {
        throw TransportError("mrpc: unexpected end of input");
    }
}

std::vector<codec::Value> read_params(codec::Decoder& dec, std::uint32_t argc) {
    std::vector<codec::Value> params(argc);
    for (auto& param : params) {
        next_field(dec);
        param = codec::read_value(dec);
    }
    return params;
}

void write_params(codec::Encoder& enc, const std::vector<codec::Value>& params) {
    enc.pack_array_len(params.size());
    for (const auto& param : params) {
        codec::write_value(enc, param);
    }
}

template <typename... Fs>
struct overloaded : Fs... {
    using Fs::operator()...;
};
template <typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

} // namespace

bool read_message_header(codec::Decoder& dec, MessageHeader& header) {
    if (!dec.next()) {
        return false;
    }

    try {
        if (dec.type() != codec::Type::array_len) {
            throw ProtocolError(std::string("mrpc: message is a ") + codec::type_name(dec.type()) + ", want array");
        }
        std::uint32_t arity = dec.array_length();
        if (arity == 0) {
            throw ProtocolError("mrpc: empty message array");
        }

        next_field(dec);
        std::int64_t kind = dec.int_value();
        switch (kind) {
        case static_cast<int>(MessageKind::request):
            expect_arity(arity, 4, "request");
            header.kind = MessageKind::request;
            next_field(dec);
            header.id = dec.uint_value();
            next_field(dec);
            header.method = dec.string_value();
            next_field(dec);
            header.argc = dec.array_length();
            break;
        case static_cast<int>(MessageKind::response):
            expect_arity(arity, 4, "response");
            header.kind = MessageKind::response;
            next_field(dec);
            header.id = dec.uint_value();
            header.method.clear();
            header.argc = 0;
            break;
        case static_cast<int>(MessageKind::notification):
            expect_arity(arity, 3, "notification");
            header.kind = MessageKind::notification;
            header.id = 0;
            next_field(dec);
            header.method = dec.string_value();
            next_field(dec);
            header.argc = dec.array_length();
            break;
        default:
            throw ProtocolError("mrpc: unknown message kind " + std::to_string(kind));
        }
    } catch (const ConvertError& exc) {
        throw ProtocolError(std::string("mrpc: malformed message envelope: ") + exc.what());
    }
    return true;
}

void write_request_header(codec::Encoder& enc, std::uint64_t id, const std::string& method) {
    enc.pack_array_len(4);
    enc.pack_int(static_cast<int>(MessageKind::request));
    enc.pack_uint(id);
    enc.pack_string(method);
}

void write_response_header(codec::Encoder& enc, std::uint64_t id) {
    enc.pack_array_len(4);
    enc.pack_int(static_cast<int>(MessageKind::response));
    enc.pack_uint(id);
}

void write_notification_header(codec::Encoder& enc, const std::string& method) {
    enc.pack_array_len(3);
    enc.pack_int(static_cast<int>(MessageKind::notification));
    enc.pack_string(method);
}

void encode_message(codec::Encoder& enc, const Message& message) {
    std::visit(overloaded{
                   [&](const Request& request) {
                       write_request_header(enc, request.id, request.method);
                       write_params(enc, request.params);
                   },
                   [&](const Response& response) {
                       write_response_header(enc, response.id);
                       if (response.error) {
                           codec::write_value(enc, *response.error);
                       } else {
                           enc.pack_nil();
                       }
                       codec::write_value(enc, response.result);
                   },
                   [&](const Notification& notification) {
                       write_notification_header(enc, notification.method);
                       write_params(enc, notification.params);
                   },
               },
               message);
}

std::optional<Message> decode_message(codec::Decoder& dec) {
    MessageHeader header;
    if (!read_message_header(dec, header)) {
        return std::nullopt;
    }

    switch (header.kind) {
    case MessageKind::request:
        return Message(Request{header.id, header.method, read_params(dec, header.argc)});
    case MessageKind::notification:
        return Message(Notification{header.method, read_params(dec, header.argc)});
    case MessageKind::response:
        break;
    }

    Response response;
    response.id = header.id;
    codec::Value error;
    codec::decode(dec, error);
    if (!error.is_nil()) {
        response.error = std::move(error);
    }
    codec::decode(dec, response.result);
    return Message(std::move(response));
}

} // namespace mrpc::rpc
