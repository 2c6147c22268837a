#pragma once

#include "decoder.hpp"
#include "encoder.hpp"
#include "errors.hpp"
#include "value.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mrpc::codec {

namespace detail {

/// Types msgpack-c packs and converts with its own adaptors.
template <typename T, typename = void>
struct is_native : std::false_type {};

template <typename T>
struct is_native<T, std::enable_if_t<std::is_arithmetic_v<T>>> : std::true_type {};

template <>
struct is_native<std::string> : std::true_type {};

template <>
struct is_native<Value> : std::true_type {};

template <typename T>
struct is_native<std::optional<T>> : is_native<T> {};

template <typename T, typename A>
struct is_native<std::vector<T, A>> : is_native<T> {};

template <typename K, typename V, typename C, typename A>
struct is_native<std::map<K, V, C, A>> : std::conjunction<is_native<K>, is_native<V>> {};

template <typename K, typename V, typename H, typename E, typename A>
struct is_native<std::unordered_map<K, V, H, E, A>> : std::conjunction<is_native<K>, is_native<V>> {};

template <typename... Ts>
struct is_native<std::tuple<Ts...>> : std::conjunction<is_native<Ts>...> {};

template <typename A, typename B>
struct is_native<std::pair<A, B>> : std::conjunction<is_native<A>, is_native<B>> {};

template <typename T>
constexpr bool is_native_v = is_native<T>::value;

/// Name of a scalar target in ConvertError messages.
template <typename T>
std::string type_label() {
    if constexpr (std::is_same_v<T, bool>) {
        return "bool";
    } else if constexpr (std::is_integral_v<T>) {
        return (std::is_signed_v<T> ? "int" : "uint") + std::to_string(sizeof(T) * 8);
    } else {
        return "float" + std::to_string(sizeof(T) * 8);
    }
}

} // namespace detail

/**
 * Adaptor<T> maps a C++ type onto codec values.
 *
 *   static void pack(Encoder&, const T&);
 *   static void unpack(Decoder&, T&);   // decoder positioned on the value
 *
 * Standard types msgpack-c knows are packed by msgpack-c directly (see
 * codec::pack) and their Adaptors only unpack. The primary template covers
 * application types registered in the ExtensionRegistry.
 */
template <typename T, typename Enable = void>
struct Adaptor {
    static void pack(Encoder& enc, const T& value) { enc.pack_registered(std::type_index(typeid(T)), &value); }
    static void unpack(Decoder& dec, T& value) { dec.unpack_registered(std::type_index(typeid(T)), &value); }
};

template <typename T>
void pack(Encoder& enc, const T& value) {
    if constexpr (detail::is_native_v<T>) {
        enc.pack_native(value);
    } else {
        Adaptor<T>::pack(enc, value);
    }
}

/// Converts the current value of `dec` into `value`. Nil yields T{}, at any
/// depth.
template <typename T>
void unpack(Decoder& dec, T& value) {
    if (dec.type() == Type::nil) {
        value = T{};
        return;
    }
    Adaptor<T>::unpack(dec, value);
}

/// Reads the next value of `dec` into `value`.
template <typename T>
void decode(Decoder& dec, T& value) {
    if (!dec.next()) {
        throw TransportError("mrpc: unexpected end of input");
    }
    unpack(dec, value);
}

/// bool, integers and floats. msgpack-c range-checks integer targets and
/// widens integers into floats.
template <typename T>
struct Adaptor<T, std::enable_if_t<std::is_arithmetic_v<T>>> {
    static void unpack(Decoder& dec, T& value) { dec.convert(value, detail::type_label<T>()); }
};

template <typename T>
struct Adaptor<T, std::enable_if_t<std::is_enum_v<T>>> {
    using U = std::underlying_type_t<T>;
    static void pack(Encoder& enc, T value) { codec::pack(enc, static_cast<U>(value)); }
    static void unpack(Decoder& dec, T& value) {
        U v{};
        codec::unpack(dec, v);
        value = static_cast<T>(v);
    }
};

/// Accepts String and Binary.
template <>
struct Adaptor<std::string> {
    static void unpack(Decoder& dec, std::string& value) { dec.convert(value, "string"); }
};

template <>
struct Adaptor<std::string_view> {
    static void pack(Encoder& enc, std::string_view value) { enc.pack_string(value); }
};

template <>
struct Adaptor<const char*> {
    static void pack(Encoder& enc, const char* value) { enc.pack_string(value); }
};

template <std::size_t N>
struct Adaptor<char[N]> {
    static void pack(Encoder& enc, const char (&value)[N]) { enc.pack_string(std::string_view(value)); }
};

template <>
struct Adaptor<std::nullptr_t> {
    static void pack(Encoder& enc, std::nullptr_t) { enc.pack_nil(); }
};

template <>
struct Adaptor<Nil> {
    static void pack(Encoder& enc, Nil) { enc.pack_nil(); }
    static void unpack(Decoder& dec, Nil&) { dec.skip(); }
};

/// Accepts Binary and String.
template <>
struct Adaptor<Binary> {
    static void unpack(Decoder& dec, Binary& value) { dec.convert(value, "binary"); }
};

template <>
struct Adaptor<Extension> {
    static void pack(Encoder& enc, const Extension& value) { enc.pack_extension(value.type, value.data); }
    static void unpack(Decoder& dec, Extension& value) {
        value.type = dec.extension_type();
        value.data = std::string(dec.bytes());
    }
};

template <>
struct Adaptor<Value> {
    static void unpack(Decoder& dec, Value& value) { value = read_value(dec); }
};

// Containers walk their members so the nil rule applies inside them too.
// Their pack functions only run for members msgpack-c cannot pack itself.

template <typename T>
struct Adaptor<std::optional<T>> {
    static void pack(Encoder& enc, const std::optional<T>& value) {
        if (value) {
            codec::pack(enc, *value);
        } else {
            enc.pack_nil();
        }
    }
    static void unpack(Decoder& dec, std::optional<T>& value) {
        T v{};
        codec::unpack(dec, v);
        value = std::move(v);
    }
};

template <typename T, typename A>
struct Adaptor<std::vector<T, A>, std::enable_if_t<!std::is_same_v<std::vector<T, A>, Binary>>> {
    static void pack(Encoder& enc, const std::vector<T, A>& value) {
        enc.pack_array_len(value.size());
        for (const auto& member : value) {
            codec::pack(enc, member);
        }
    }
    static void unpack(Decoder& dec, std::vector<T, A>& value) {
        std::uint32_t len = dec.array_length();
        value.clear();
        value.resize(len);
        for (auto& member : value) {
            decode(dec, member);
        }
    }
};

namespace detail {

template <typename MapType>
void pack_map(Encoder& enc, const MapType& value) {
    enc.pack_map_len(value.size());
    for (const auto& entry : value) {
        codec::pack(enc, entry.first);
        codec::pack(enc, entry.second);
    }
}

template <typename MapType>
void unpack_map(Decoder& dec, MapType& value) {
    std::uint32_t len = dec.map_length();
    value.clear();
    for (std::uint32_t i = 0; i < len; ++i) {
        typename MapType::key_type key{};
        typename MapType::mapped_type mapped{};
        decode(dec, key);
        decode(dec, mapped);
        value.insert_or_assign(std::move(key), std::move(mapped));
    }
}

template <typename Tuple, std::size_t... I>
void pack_tuple(Encoder& enc, const Tuple& value, std::index_sequence<I...>) {
    enc.pack_array_len(sizeof...(I));
    (codec::pack(enc, std::get<I>(value)), ...);
}

template <typename Tuple, std::size_t... I>
void unpack_tuple(Decoder& dec, Tuple& value, std::index_sequence<I...>) {
    std::uint32_t len = dec.array_length();
    value = Tuple{};
    std::uint32_t index = 0;
    auto member = [&](auto& field) {
        if (index++ < len) {
            decode(dec, field);
        }
    };
    (member(std::get<I>(value)), ...);
    for (Nil surplus; index < len; ++index) {
        decode(dec, surplus);
    }
}

} // namespace detail

template <typename K, typename V, typename C, typename A>
struct Adaptor<std::map<K, V, C, A>> {
    static void pack(Encoder& enc, const std::map<K, V, C, A>& value) { detail::pack_map(enc, value); }
    static void unpack(Decoder& dec, std::map<K, V, C, A>& value) { detail::unpack_map(dec, value); }
};

template <typename K, typename V, typename H, typename E, typename A>
struct Adaptor<std::unordered_map<K, V, H, E, A>> {
    static void pack(Encoder& enc, const std::unordered_map<K, V, H, E, A>& value) { detail::pack_map(enc, value); }
    static void unpack(Decoder& dec, std::unordered_map<K, V, H, E, A>& value) { detail::unpack_map(dec, value); }
};

/// Tuples travel as fixed-length arrays. Missing members default and
/// surplus members are skipped.
template <typename... Ts>
struct Adaptor<std::tuple<Ts...>> {
    static void pack(Encoder& enc, const std::tuple<Ts...>& value) {
        detail::pack_tuple(enc, value, std::index_sequence_for<Ts...>{});
    }
    static void unpack(Decoder& dec, std::tuple<Ts...>& value) {
        detail::unpack_tuple(dec, value, std::index_sequence_for<Ts...>{});
    }
};

template <typename A, typename B>
struct Adaptor<std::pair<A, B>> {
    static void pack(Encoder& enc, const std::pair<A, B>& value) {
        enc.pack_array_len(2);
        codec::pack(enc, value.first);
        codec::pack(enc, value.second);
    }
    static void unpack(Decoder& dec, std::pair<A, B>& value) {
        std::tuple<A, B> t;
        Adaptor<std::tuple<A, B>>::unpack(dec, t);
        value = std::make_pair(std::move(std::get<0>(t)), std::move(std::get<1>(t)));
    }
};

/// Packs `args` as one array, the params shape of requests and notifications.
template <typename... Args>
void pack_params(Encoder& enc, const Args&... args) {
    enc.pack_array_len(sizeof...(Args));
    (codec::pack(enc, args), ...);
}

} // namespace mrpc::codec
