#pragma once

#include "errors.hpp"

#include <msgpack.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <typeindex>

namespace mrpc::codec {

class ExtensionRegistry;

/**
 * Appends MessagePack values to an in-memory buffer.
 *
 * Every pack_* call writes the shortest wire form for its value. Composite
 * values are written as a header (pack_array_len / pack_map_len) followed by
 * exactly that many member values.
 */
class Encoder {
public:
    explicit Encoder(const ExtensionRegistry* extensions = nullptr);

    void pack_nil();
    void pack_bool(bool value);
    void pack_int(std::int64_t value);
    void pack_uint(std::uint64_t value);
    void pack_float(double value);
    void pack_float32(float value);
    void pack_string(std::string_view value);
    void pack_binary(const void* data, std::size_t size);
    void pack_array_len(std::size_t len);
    void pack_map_len(std::size_t len);
    void pack_extension(std::int8_t type, std::string_view payload);

    /// Appends bytes that are already MessagePack encoded.
    void pack_raw(std::string_view bytes);

    /// Packs through msgpack-c's own adaptors: standard strings, numbers and
    /// containers of them, msgpack::object and Value.
    template <typename T>
    void pack_native(const T& value) {
        try {
            packer().pack(value);
        } catch (const msgpack::container_size_overflow& exc) {
            throw EncodeError(std::string("mrpc: value too large to encode: ") + exc.what());
        }
    }

    /// Packs a value of a type registered in the extension registry.
    void pack_registered(const std::type_index& type, const void* value);

    const char* data() const { return buffer_.data(); }
    std::size_t size() const { return buffer_.size(); }
    std::string_view bytes() const { return std::string_view(buffer_.data(), buffer_.size()); }
    void clear() { buffer_.clear(); }

    const ExtensionRegistry* extensions() const { return extensions_; }

private:
    msgpack::packer<msgpack::sbuffer> packer() { return msgpack::packer<msgpack::sbuffer>(buffer_); }

    msgpack::sbuffer buffer_;
    const ExtensionRegistry* extensions_ = nullptr;
};

} // namespace mrpc::codec
