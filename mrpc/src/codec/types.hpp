#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mrpc::codec {

/// Discriminant of the value the decoder is positioned on.
enum class Type {
    invalid,
    nil,
    boolean,
    integer,          // negative integer
    unsigned_integer, // non-negative integer
    floating,
    string,
    binary,
    array_len,
    map_len,
    extension,
};

const char* type_name(Type type);

using Binary = std::vector<std::uint8_t>;

struct Extension {
    std::int8_t type = 0;
    std::string data;

    bool operator==(const Extension& other) const { return type == other.type && data == other.data; }
    bool operator!=(const Extension& other) const { return !(*this == other); }
};

/// Explicit nil, for call sites that want to send a nil argument.
struct Nil {};

} // namespace mrpc::codec
