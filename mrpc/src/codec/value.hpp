#pragma once

#include "types.hpp"

#include <msgpack.hpp>

#include <memory>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace mrpc::codec {

class Decoder;
class Encoder;

/**
 * A decoded MessagePack value of any shape: a msgpack::object together with
 * the zone that owns its strings and members.
 *
 * Built from anything msgpack-c has an adaptor for (including vectors and
 * maps of Value), or taken over from a decoded subtree with copy_of().
 * Copies are deep.
 */
class Value {
public:
    using Array = std::vector<Value>;

    Value() = default;
    explicit Value(msgpack::object_handle handle) : handle_(std::move(handle)) {}
    explicit Value(const char* text) : Value(std::string(text)) {}

    template <typename T, typename = std::enable_if_t<!std::is_array_v<T> && !std::is_same_v<T, Value> &&
                                                      !std::is_same_v<T, msgpack::object_handle>>>
    explicit Value(const T& value) {
        auto zone = std::make_unique<msgpack::zone>();
        msgpack::object object(value, *zone);
        handle_ = msgpack::object_handle(object, std::move(zone));
    }

    Value(const Value& other) : handle_(msgpack::clone(other.object())) {}
    Value(Value&&) = default;

    Value& operator=(const Value& other) {
        if (this != &other) {
            handle_ = msgpack::clone(other.object());
        }
        return *this;
    }
    Value& operator=(Value&&) = default;

    /// Deep copy of `object`, independent of the buffer it was decoded from.
    static Value copy_of(const msgpack::object& object) { return Value(msgpack::clone(object)); }

    const msgpack::object& object() const { return handle_.get(); }

    Type type() const;
    bool is_nil() const { return object().type == msgpack::type::NIL; }

    bool operator==(const Value& other) const { return object() == other.object(); }
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    msgpack::object_handle handle_;
};

/// Decodes the current value of `dec` with all of its members.
Value read_value(Decoder& dec);

void write_value(Encoder& enc, const Value& value);

/// Human readable rendering, used in error messages and logs. Strings are
/// rendered bare; everything else in msgpack-c's JSON-like notation.
std::string to_string(const msgpack::object& object);
std::string to_string(const Value& value);

std::ostream& operator<<(std::ostream& out, const Value& value);

} // namespace mrpc::codec

namespace msgpack {
MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS) {
namespace adaptor {

template <>
struct convert<mrpc::codec::Value> {
    msgpack::object const& operator()(msgpack::object const& o, mrpc::codec::Value& v) const {
        v = mrpc::codec::Value::copy_of(o);
        return o;
    }
};

template <>
struct pack<mrpc::codec::Value> {
    template <typename Stream>
    msgpack::packer<Stream>& operator()(msgpack::packer<Stream>& o, mrpc::codec::Value const& v) const {
        o.pack(v.object());
        return o;
    }
};

template <>
struct object_with_zone<mrpc::codec::Value> {
    void operator()(msgpack::object::with_zone& o, mrpc::codec::Value const& v) const {
        static_cast<msgpack::object&>(o) = msgpack::object(v.object(), o.zone);
    }
};

} // namespace adaptor
} // MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS)
} // namespace msgpack
