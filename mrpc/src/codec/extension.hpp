#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>

namespace mrpc::codec {

/**
 * Maps MessagePack extension tags to application types.
 *
 * The codec never interprets extension payloads itself. Applications
 * register a decoder (payload -> value) and an encoder (value -> payload)
 * per tag; typed binding then resolves registered types in both directions.
 */
class ExtensionRegistry {
public:
    struct Entry {
        std::int8_t type = 0;
        std::string name;
        std::function<void(std::string_view payload, void* out)> decode;
        std::function<std::string(const void* value)> encode;
    };

    template <typename T>
    void add(std::int8_t type,
             std::function<T(std::string_view)> decode,
             std::function<std::string(const T&)> encode,
             std::string name = typeid(T).name()) {
        Entry entry;
        entry.type = type;
        entry.name = std::move(name);
        entry.decode = [decode = std::move(decode)](std::string_view payload, void* out) {
            *static_cast<T*>(out) = decode(payload);
        };
        entry.encode = [encode = std::move(encode)](const void* value) {
            return encode(*static_cast<const T*>(value));
        };
        add_entry(std::type_index(typeid(T)), std::move(entry));
    }

    const Entry* find(const std::type_index& type) const;
    const Entry* find(std::int8_t type) const;

private:
    void add_entry(const std::type_index& index, Entry entry);

    std::unordered_map<std::type_index, Entry> by_type_;
    std::unordered_map<std::int8_t, std::type_index> by_tag_;
};

/// Handle payloads carry a MessagePack integer: written as int32, read in
/// any integer form.
std::string encode_handle(std::int64_t id);
std::int64_t decode_handle(std::string_view payload);

/// Registers a handle type: any T constructible as T{id} with an `id` member.
template <typename T>
void add_handle_type(ExtensionRegistry& registry, std::int8_t type, std::string name = typeid(T).name()) {
    registry.add<T>(
        type,
        [](std::string_view payload) { return T{decode_handle(payload)}; },
        [](const T& value) { return encode_handle(value.id); },
        std::move(name));
}

} // namespace mrpc::codec
