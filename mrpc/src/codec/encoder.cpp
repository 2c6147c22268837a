#include "encoder.hpp"

#include "errors.hpp"
#include "extension.hpp"

#include <limits>

namespace mrpc::codec {

namespace {

std::uint32_t checked_length(std::size_t len, const char* what) {
    if (len > std::numeric_limits<std::uint32_t>::max()) {
        throw EncodeError(std::string("mrpc: ") + what + " too long to encode");
    }
    return static_cast<std::uint32_t>(len);
}

} // namespace

Encoder::Encoder(const ExtensionRegistry* extensions) : extensions_(extensions) {}

void Encoder::pack_nil() {
    packer().pack_nil();
}

void Encoder::pack_bool(bool value) {
    if (value) {
        packer().pack_true();
    } else {
        packer().pack_false();
    }
}

void Encoder::pack_int(std::int64_t value) {
    // msgpack-c picks fixint, (u)int8/16/32/64 by magnitude.
    packer().pack_int64(value);
}

void Encoder::pack_uint(std::uint64_t value) {
    packer().pack_uint64(value);
}

void Encoder::pack_float(double value) {
    packer().pack_double(value);
}

void Encoder::pack_float32(float value) {
    packer().pack_float(value);
}

void Encoder::pack_string(std::string_view value) {
    auto len = checked_length(value.size(), "string");
    auto pk = packer();
    pk.pack_str(len);
    pk.pack_str_body(value.data(), len);
}

void Encoder::pack_binary(const void* data, std::size_t size) {
    auto len = checked_length(size, "binary");
    auto pk = packer();
    pk.pack_bin(len);
    pk.pack_bin_body(static_cast<const char*>(data), len);
}

void Encoder::pack_array_len(std::size_t len) {
    packer().pack_array(checked_length(len, "array"));
}

void Encoder::pack_map_len(std::size_t len) {
    packer().pack_map(checked_length(len, "map"));
}

void Encoder::pack_extension(std::int8_t type, std::string_view payload) {
    auto len = checked_length(payload.size(), "extension");
    auto pk = packer();
    pk.pack_ext(len, type);
    pk.pack_ext_body(payload.data(), len);
}

void Encoder::pack_raw(std::string_view bytes) {
    buffer_.write(bytes.data(), bytes.size());
}

void Encoder::pack_registered(const std::type_index& type, const void* value) {
    const ExtensionRegistry::Entry* entry = extensions_ ? extensions_->find(type) : nullptr;
    if (!entry) {
        throw EncodeError(std::string("mrpc: no extension registered for ") + type.name());
    }
    pack_extension(entry->type, entry->encode(value));
}

} // namespace mrpc::codec
