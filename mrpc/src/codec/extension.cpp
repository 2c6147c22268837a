#include "extension.hpp"

#include "errors.hpp"

#include <cstdio>

namespace mrpc::codec {

namespace {

std::uint64_t big_endian(std::string_view bytes) {
    std::uint64_t value = 0;
    for (char c : bytes) {
        value = (value << 8) | static_cast<std::uint8_t>(c);
    }
    return value;
}

std::string hex(std::string_view bytes) {
    std::string text;
    char digits[3];
    for (char c : bytes) {
        std::snprintf(digits, sizeof(digits), "%02x", static_cast<std::uint8_t>(c));
        text += digits;
    }
    return text;
}

} // namespace

void ExtensionRegistry::add_entry(const std::type_index& index, Entry entry) {
    auto previous = by_tag_.find(entry.type);
    if (previous != by_tag_.end() && previous->second != index) {
        by_type_.erase(previous->second);
    }
    by_tag_.insert_or_assign(entry.type, index);
    by_type_.insert_or_assign(index, std::move(entry));
}

const ExtensionRegistry::Entry* ExtensionRegistry::find(const std::type_index& type) const {
    auto it = by_type_.find(type);
    if (it == by_type_.end()) {
        return nullptr;
    }
    return &it->second;
}

const ExtensionRegistry::Entry* ExtensionRegistry::find(std::int8_t type) const {
    auto it = by_tag_.find(type);
    if (it == by_tag_.end()) {
        return nullptr;
    }
    return find(it->second);
}

std::string encode_handle(std::int64_t id) {
    auto n = static_cast<std::uint32_t>(static_cast<std::int32_t>(id));
    std::string payload(5, '\0');
    payload[0] = static_cast<char>(0xd2);
    payload[1] = static_cast<char>(n >> 24);
    payload[2] = static_cast<char>(n >> 16);
    payload[3] = static_cast<char>(n >> 8);
    payload[4] = static_cast<char>(n);
    return payload;
}

std::int64_t decode_handle(std::string_view payload) {
    if (!payload.empty()) {
        auto head = static_cast<std::uint8_t>(payload[0]);
        auto body = payload.substr(1);
        switch (payload.size()) {
        case 1:
            if (head <= 0x7f) {
                return head;
            }
            if (head >= 0xe0) {
                return static_cast<std::int8_t>(head);
            }
            break;
        case 2:
            if (head == 0xcc) {
                return static_cast<std::uint8_t>(big_endian(body));
            }
            if (head == 0xd0) {
                return static_cast<std::int8_t>(big_endian(body));
            }
            break;
        case 3:
            if (head == 0xcd) {
                return static_cast<std::uint16_t>(big_endian(body));
            }
            if (head == 0xd1) {
                return static_cast<std::int16_t>(big_endian(body));
            }
            break;
        case 5:
            if (head == 0xce) {
                return static_cast<std::uint32_t>(big_endian(body));
            }
            if (head == 0xd2) {
                return static_cast<std::int32_t>(big_endian(body));
            }
            break;
        default:
            break;
        }
    }
    throw ConvertError(Type::extension, "handle (payload " + hex(payload) + ")");
}

} // namespace mrpc::codec
