#pragma once

#include "errors.hpp"
#include "types.hpp"

#include <msgpack.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

namespace mrpc::transport {
class Reader;
}

namespace mrpc::codec {

class ExtensionRegistry;

/// Deepest nesting of arrays and maps accepted from the wire.
constexpr std::size_t kMaxNestingDepth = 512;

/// Wire type of a decoded msgpack-c object.
Type type_of(const msgpack::object& object);

/**
 * Pull-style MessagePack decoder.
 *
 * next() positions the decoder on the following value and exposes its
 * type(); the caller then reads it with the matching accessor. Array and map
 * headers are values of their own: after array_length() returns n the next
 * n values are the members, and it is up to the caller to consume (or skip)
 * exactly that many.
 *
 * Bytes are framed one top-level object at a time by msgpack::unpacker, so
 * a conversion failure never leaves the stream misaligned. Objects nested
 * deeper than kMaxNestingDepth are malformed input.
 */
class Decoder {
public:
    explicit Decoder(transport::Reader& reader, const ExtensionRegistry* extensions = nullptr);
    explicit Decoder(std::string_view bytes, const ExtensionRegistry* extensions = nullptr);
    explicit Decoder(const msgpack::object& object, const ExtensionRegistry* extensions = nullptr);

    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

    /// Loads the next value. Returns false at a clean end of input; throws
    /// TransportError for I/O failures, malformed bytes or a truncated value.
    bool next();

    Type type() const { return type_; }

    bool bool_value();
    std::int64_t int_value();
    std::uint64_t uint_value();
    double float_value();
    std::string string_value();

    /// Binary, string or extension payload. Valid until the next top-level
    /// object is read.
    std::string_view bytes();

    std::uint32_t array_length();
    std::uint32_t map_length();
    std::int8_t extension_type();

    /// Returns the current value (a whole subtree for composites) and moves
    /// past its members. Valid until the next top-level object is read.
    const msgpack::object& object();

    /// Converts the current value (members included) through msgpack-c's
    /// adaptors. A type or range mismatch skips it and throws ConvertError.
    template <typename T>
    void convert(T& out, const std::string& requested) {
        const msgpack::object& value = object();
        try {
            value.convert(out);
        } catch (const msgpack::type_error&) {
            throw ConvertError(type_of(value), requested);
        }
    }

    /// Discards the current value and, for composites, its members.
    void skip();

    /// Drops whatever remains of the current top-level object.
    void discard_message();

    /// True while positioned inside a top-level object that still has
    /// unread members.
    bool in_message() const { return pos_ < tokens_.size(); }

    /// Decodes a registered extension type into `out`.
    void unpack_registered(const std::type_index& type, void* out);

    const ExtensionRegistry* extensions() const { return extensions_; }

    [[noreturn]] void convert_error(const std::string& requested);

private:
    bool fill();
    void flatten(const msgpack::object& object);
    const msgpack::object& current() const { return *tokens_[pos_ - 1]; }

    transport::Reader* reader_ = nullptr;
    const ExtensionRegistry* extensions_ = nullptr;
    std::unique_ptr<msgpack::unpacker> unpacker_;
    msgpack::object_handle handle_;
    std::vector<const msgpack::object*> tokens_;
    std::size_t pos_ = 0;
    Type type_ = Type::invalid;
};

} // namespace mrpc::codec
