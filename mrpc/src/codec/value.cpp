#include "value.hpp"

#include "decoder.hpp"
#include "encoder.hpp"

#include <sstream>

namespace mrpc::codec {

Type Value::type() const {
    return type_of(object());
}

Value read_value(Decoder& dec) {
    return Value::copy_of(dec.object());
}

void write_value(Encoder& enc, const Value& value) {
    enc.pack_native(value.object());
}

std::string to_string(const msgpack::object& object) {
    if (object.type == msgpack::type::STR) {
        return std::string(object.via.str.ptr, object.via.str.size);
    }
    std::ostringstream out;
    out << object;
    return out.str();
}

std::string to_string(const Value& value) {
    return to_string(value.object());
}

std::ostream& operator<<(std::ostream& out, const Value& value) {
    return out << value.object();
}

} // namespace mrpc::codec
