#include "decoder.hpp"

#include "errors.hpp"
#include "extension.hpp"
#include "logger.hpp"
#include "transport.hpp"

#include <log4cplus/loggingmacros.h>

#include <cstring>
#include <limits>

namespace mrpc::codec {

namespace {

constexpr std::size_t kReadSize = 64 * 1024;

// As msgpack-c's default: strings and binaries point into the unpacker buffer.
bool reference_buffer(msgpack::type::object_type, std::size_t, void*) {
    return true;
}

std::unique_ptr<msgpack::unpacker> make_unpacker() {
    msgpack::unpack_limit limit(0xffffffff, 0xffffffff, 0xffffffff, 0xffffffff, 0xffffffff, kMaxNestingDepth);
    return std::make_unique<msgpack::unpacker>(&reference_buffer, nullptr, MSGPACK_UNPACKER_INIT_BUFFER_SIZE,
                                               limit);
}

} // namespace

Type type_of(const msgpack::object& object) {
    switch (object.type) {
    case msgpack::type::NIL:
        return Type::nil;
    case msgpack::type::BOOLEAN:
        return Type::boolean;
    case msgpack::type::POSITIVE_INTEGER:
        return Type::unsigned_integer;
    case msgpack::type::NEGATIVE_INTEGER:
        return Type::integer;
    case msgpack::type::FLOAT32:
    case msgpack::type::FLOAT64:
        return Type::floating;
    case msgpack::type::STR:
        return Type::string;
    case msgpack::type::BIN:
        return Type::binary;
    case msgpack::type::ARRAY:
        return Type::array_len;
    case msgpack::type::MAP:
        return Type::map_len;
    case msgpack::type::EXT:
        return Type::extension;
    default:
        break;
    }
    return Type::invalid;
}

Decoder::Decoder(transport::Reader& reader, const ExtensionRegistry* extensions)
    : reader_(&reader), extensions_(extensions), unpacker_(make_unpacker()) {}

Decoder::Decoder(std::string_view bytes, const ExtensionRegistry* extensions)
    : extensions_(extensions), unpacker_(make_unpacker()) {
    unpacker_->reserve_buffer(bytes.size());
    std::memcpy(unpacker_->buffer(), bytes.data(), bytes.size());
    unpacker_->buffer_consumed(bytes.size());
}

Decoder::Decoder(const msgpack::object& object, const ExtensionRegistry* extensions) : extensions_(extensions) {
    flatten(object);
}

bool Decoder::next() {
    if (pos_ >= tokens_.size() && !fill()) {
        type_ = Type::invalid;
        return false;
    }
    ++pos_;
    type_ = type_of(current());
    return true;
}

bool Decoder::fill() {
    tokens_.clear();
    pos_ = 0;
    if (!unpacker_) {
        return false;
    }

    for (;;) {
        try {
            if (unpacker_->next(handle_)) {
                break;
            }
        } catch (const msgpack::unpack_error& exc) {
            LOG4CPLUS_WARN(codec_logger(), "Malformed input after " << unpacker_->parsed_size() << " bytes");
            throw TransportError(std::string("mrpc: malformed msgpack: ") + exc.what());
        }

        std::size_t n = 0;
        if (reader_) {
            unpacker_->reserve_buffer(kReadSize);
            n = reader_->read(unpacker_->buffer(), unpacker_->buffer_capacity());
        }
        if (n == 0) {
            if (unpacker_->nonparsed_size() > 0) {
                LOG4CPLUS_DEBUG(codec_logger(), "Input ended inside a value, " << unpacker_->nonparsed_size()
                                                                               << " bytes pending");
                throw TransportError("mrpc: unexpected end of input");
            }
            return false;
        }
        unpacker_->buffer_consumed(n);
    }

    flatten(handle_.get());
    return true;
}

void Decoder::flatten(const msgpack::object& root) {
    // Pre-order walk; members are pushed in reverse so they pop in order.
    std::vector<const msgpack::object*> pending{&root};
    while (!pending.empty()) {
        const msgpack::object* object = pending.back();
        pending.pop_back();
        tokens_.push_back(object);
        if (object->type == msgpack::type::ARRAY) {
            for (std::uint32_t i = object->via.array.size; i > 0; --i) {
                pending.push_back(&object->via.array.ptr[i - 1]);
            }
        } else if (object->type == msgpack::type::MAP) {
            for (std::uint32_t i = object->via.map.size; i > 0; --i) {
                pending.push_back(&object->via.map.ptr[i - 1].val);
                pending.push_back(&object->via.map.ptr[i - 1].key);
            }
        }
    }
}

void Decoder::convert_error(const std::string& requested) {
    Type wire = type_;
    skip();
    throw ConvertError(wire, requested);
}

bool Decoder::bool_value() {
    if (type_ != Type::boolean) {
        convert_error("bool");
    }
    return current().via.boolean;
}

std::int64_t Decoder::int_value() {
    if (type_ == Type::integer) {
        return current().via.i64;
    }
    if (type_ == Type::unsigned_integer &&
        current().via.u64 <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return static_cast<std::int64_t>(current().via.u64);
    }
    convert_error("int64");
}

std::uint64_t Decoder::uint_value() {
    if (type_ != Type::unsigned_integer) {
        convert_error("uint64");
    }
    return current().via.u64;
}

double Decoder::float_value() {
    switch (type_) {
    case Type::floating:
        return current().via.f64;
    case Type::integer:
        return static_cast<double>(current().via.i64);
    case Type::unsigned_integer:
        return static_cast<double>(current().via.u64);
    default:
        break;
    }
    convert_error("float64");
}

std::string Decoder::string_value() {
    if (type_ == Type::string) {
        return std::string(current().via.str.ptr, current().via.str.size);
    }
    if (type_ == Type::binary) {
        return std::string(current().via.bin.ptr, current().via.bin.size);
    }
    convert_error("string");
}

std::string_view Decoder::bytes() {
    switch (type_) {
    case Type::string:
        return std::string_view(current().via.str.ptr, current().via.str.size);
    case Type::binary:
        return std::string_view(current().via.bin.ptr, current().via.bin.size);
    case Type::extension:
        return std::string_view(current().via.ext.data(), current().via.ext.size);
    default:
        break;
    }
    convert_error("bytes");
}

std::uint32_t Decoder::array_length() {
    if (type_ != Type::array_len) {
        convert_error("array");
    }
    return current().via.array.size;
}

std::uint32_t Decoder::map_length() {
    if (type_ != Type::map_len) {
        convert_error("map");
    }
    return current().via.map.size;
}

std::int8_t Decoder::extension_type() {
    if (type_ != Type::extension) {
        convert_error("extension");
    }
    return current().via.ext.type();
}

const msgpack::object& Decoder::object() {
    if (pos_ == 0 || type_ == Type::invalid) {
        throw ProtocolError("mrpc: decoder is not positioned on a value");
    }
    const msgpack::object& value = current();
    skip();
    return value;
}

void Decoder::skip() {
    std::uint64_t members = 0;
    if (type_ == Type::array_len) {
        members = current().via.array.size;
    } else if (type_ == Type::map_len) {
        members = 2ull * current().via.map.size;
    }

    for (std::uint64_t i = 0; i < members; ++i) {
        if (!in_message() || !next()) {
            throw TransportError("mrpc: unexpected end of composite value");
        }
        skip();
    }
    type_ = Type::invalid;
}

void Decoder::discard_message() {
    pos_ = tokens_.size();
    type_ = Type::invalid;
}

void Decoder::unpack_registered(const std::type_index& type, void* out) {
    const ExtensionRegistry::Entry* entry = extensions_ ? extensions_->find(type) : nullptr;
    if (!entry) {
        convert_error(type.name());
    }
    if (type_ != Type::extension || current().via.ext.type() != entry->type) {
        convert_error(entry->name);
    }
    entry->decode(bytes(), out);
}

} // namespace mrpc::codec
