#include "types.hpp"

namespace mrpc::codec {

const char* type_name(Type type) {
    switch (type) {
    case Type::nil:
        return "nil";
    case Type::boolean:
        return "bool";
    case Type::integer:
        return "int";
    case Type::unsigned_integer:
        return "uint";
    case Type::floating:
        return "float";
    case Type::string:
        return "string";
    case Type::binary:
        return "binary";
    case Type::array_len:
        return "array";
    case Type::map_len:
        return "map";
    case Type::extension:
        return "extension";
    case Type::invalid:
        break;
    }
    return "invalid";
}

} // namespace mrpc::codec
