#include <gtest/gtest.h>

#include "codec/binding.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

using mrpc::codec::Decoder;
using mrpc::codec::Encoder;
using mrpc::codec::Type;
using mrpc::codec::Value;

namespace {

std::string hex(const std::string& bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    for (unsigned char c : bytes) {
        out += digits[c >> 4];
        out += digits[c & 0xf];
    }
    return out;
}

template <typename T>
T round_trip(const T& value) {
    std::string bytes = encode_bytes([&](Encoder& enc) { mrpc::codec::pack(enc, value); });
    Decoder dec(bytes);
    T out{};
    mrpc::codec::decode(dec, out);
    EXPECT_FALSE(dec.next());
    return out;
}

} // namespace

TEST(Codec, SignedIntegerBoundariesRoundTrip) {
    const std::int64_t values[] = {0,      1,      127,     128,    255,   256,    65535,
                                   65536,  -1,     -32,     -33,    -127,  -128,   -129,
                                   -255,   -256,   -32768,  -32769, -65535, -65536,
                                   std::numeric_limits<std::int64_t>::min(), std::numeric_limits<std::int64_t>::max()};
    for (std::int64_t v : values) {
        EXPECT_EQ(round_trip(v), v) << v;
    }
}

TEST(Codec, UnsignedIntegerBoundariesRoundTrip) {
    const std::uint64_t values[] = {0, 127, 128, 255, 256, 65535, 65536, 4294967295ull, 4294967296ull,
                                    std::numeric_limits<std::uint64_t>::max()};
    for (std::uint64_t v : values) {
        EXPECT_EQ(round_trip(v), v) << v;
    }
}

TEST(Codec, IntegersUseShortestEncoding) {
    auto int_hex = [](std::int64_t v) { return hex(encode_bytes([v](Encoder& enc) { enc.pack_int(v); })); };
    EXPECT_EQ(int_hex(0), "00");
    EXPECT_EQ(int_hex(127), "7f");
    EXPECT_EQ(int_hex(128), "cc80");
    EXPECT_EQ(int_hex(255), "ccff");
    EXPECT_EQ(int_hex(256), "cd0100");
    EXPECT_EQ(int_hex(65535), "cdffff");
    EXPECT_EQ(int_hex(65536), "ce00010000");
    EXPECT_EQ(int_hex(-1), "ff");
    EXPECT_EQ(int_hex(-32), "e0");
    EXPECT_EQ(int_hex(-33), "d0df");
    EXPECT_EQ(int_hex(-128), "d080");
    EXPECT_EQ(int_hex(-129), "d1ff7f");
    EXPECT_EQ(int_hex(-32769), "d2ffff7fff");
}

TEST(Codec, ScalarsUseExpectedMarkers) {
    EXPECT_EQ(hex(encode_bytes([](Encoder& enc) { enc.pack_nil(); })), "c0");
    EXPECT_EQ(hex(encode_bytes([](Encoder& enc) { enc.pack_bool(false); })), "c2");
    EXPECT_EQ(hex(encode_bytes([](Encoder& enc) { enc.pack_bool(true); })), "c3");
    EXPECT_EQ(hex(encode_bytes([](Encoder& enc) { enc.pack_float(1.5); })), "cb3ff8000000000000");
    EXPECT_EQ(hex(encode_bytes([](Encoder& enc) { enc.pack_float32(1.5f); })), "ca3fc00000");
}

TEST(Codec, StringHeadersFollowLength) {
    auto first_bytes = [](std::size_t len) {
        std::string bytes = encode_bytes([len](Encoder& enc) { enc.pack_string(std::string(len, 'x')); });
        return hex(bytes.substr(0, 3));
    };
    EXPECT_EQ(first_bytes(0), "a0");
    EXPECT_EQ(first_bytes(31), "bf7878");
    EXPECT_EQ(first_bytes(32), "d92078");
    EXPECT_EQ(first_bytes(255), "d9ff78");
    EXPECT_EQ(first_bytes(256), "da0100");
    EXPECT_EQ(first_bytes(65536).substr(0, 2), "db");

    for (std::size_t len : {0u, 31u, 32u, 255u, 256u, 65535u, 65536u}) {
        std::string s(len, 'q');
        EXPECT_EQ(round_trip(s), s) << len;
    }
}

TEST(Codec, ArrayAndMapHeadersFollowLength) {
    EXPECT_EQ(hex(encode_bytes([](Encoder& enc) { enc.pack_array_len(15); })), "9f");
    EXPECT_EQ(hex(encode_bytes([](Encoder& enc) { enc.pack_array_len(16); })), "dc0010");
    EXPECT_EQ(hex(encode_bytes([](Encoder& enc) { enc.pack_array_len(65536); })), "dd00010000");
    EXPECT_EQ(hex(encode_bytes([](Encoder& enc) { enc.pack_map_len(15); })), "8f");
    EXPECT_EQ(hex(encode_bytes([](Encoder& enc) { enc.pack_map_len(16); })), "de0010");
}

TEST(Codec, BinaryRoundTrip) {
    mrpc::codec::Binary empty;
    EXPECT_EQ(hex(encode_bytes([&](Encoder& enc) { mrpc::codec::pack(enc, empty); })), "c400");

    mrpc::codec::Binary data = {0x00, 0xff, 0x10, 0x80};
    EXPECT_EQ(round_trip(data), data);
}

TEST(Codec, BinaryHeaderFollowsLength) {
    const struct {
        std::size_t len;
        std::string header;
    } cases[] = {
        {255, "c4ff"},
        {256, "c50100"},
        {65535, "c5ffff"},
        {65536, "c600010000"},
    };
    for (const auto& c : cases) {
        mrpc::codec::Binary data(c.len);
        for (std::size_t i = 0; i < c.len; ++i) {
            data[i] = static_cast<std::uint8_t>(i * 7);
        }
        std::string bytes = encode_bytes([&](Encoder& enc) { mrpc::codec::pack(enc, data); });
        EXPECT_EQ(hex(bytes.substr(0, c.header.size() / 2)), c.header) << c.len;
        EXPECT_EQ(bytes.size(), c.header.size() / 2 + c.len) << c.len;
        EXPECT_EQ(round_trip(data), data) << c.len;
    }
}

TEST(Codec, DecoderReportsWireTypes) {
    std::string bytes = encode_bytes([](Encoder& enc) {
        enc.pack_nil();
        enc.pack_bool(true);
        enc.pack_int(-5);
        enc.pack_uint(5);
        enc.pack_float(0.25);
        enc.pack_string("s");
        enc.pack_binary("b", 1);
        enc.pack_array_len(0);
        enc.pack_map_len(0);
        enc.pack_extension(3, "e");
    });

    Decoder dec(bytes);
    const Type expected[] = {Type::nil,    Type::boolean, Type::integer,   Type::unsigned_integer,
                             Type::floating, Type::string, Type::binary, Type::array_len,
                             Type::map_len, Type::extension};
    for (Type type : expected) {
        ASSERT_TRUE(dec.next());
        EXPECT_EQ(dec.type(), type) << mrpc::codec::type_name(type);
        dec.skip();
    }
    EXPECT_FALSE(dec.next());
}

TEST(Codec, ConvertErrorSkipsValueAndKeepsAlignment) {
    std::string bytes = encode_bytes([](Encoder& enc) {
        enc.pack_array_len(3);
        enc.pack_string("not a number");
        enc.pack_int(7);
        enc.pack_array_len(2);
        enc.pack_int(1);
        enc.pack_int(2);
        enc.pack_int(9);
    });

    Decoder dec(bytes);
    ASSERT_TRUE(dec.next());
    ASSERT_EQ(dec.array_length(), 3u);

    ASSERT_TRUE(dec.next());
    try {
        dec.int_value();
        FAIL() << "expected ConvertError";
    } catch (const mrpc::ConvertError& exc) {
        EXPECT_EQ(exc.wire_type(), Type::string);
        EXPECT_EQ(exc.requested_type(), "int64");
    }

    ASSERT_TRUE(dec.next());
    EXPECT_EQ(dec.int_value(), 7);

    // A failed conversion of a composite skips its members too.
    ASSERT_TRUE(dec.next());
    EXPECT_THROW(dec.string_value(), mrpc::ConvertError);

    ASSERT_TRUE(dec.next());
    EXPECT_EQ(dec.int_value(), 9);
    EXPECT_FALSE(dec.next());
}

TEST(Codec, NumericWideningAndRangeChecks) {
    std::string bytes = encode_bytes([](Encoder& enc) {
        enc.pack_int(300);
        enc.pack_int(300);
        enc.pack_int(-1);
        enc.pack_int(42);
    });

    Decoder dec(bytes);
    double d = 0;
    mrpc::codec::decode(dec, d);
    EXPECT_DOUBLE_EQ(d, 300.0);

    std::int8_t small = 0;
    EXPECT_THROW(mrpc::codec::decode(dec, small), mrpc::ConvertError);

    std::uint32_t u = 0;
    EXPECT_THROW(mrpc::codec::decode(dec, u), mrpc::ConvertError);

    std::int16_t fits = 0;
    mrpc::codec::decode(dec, fits);
    EXPECT_EQ(fits, 42);
}

TEST(Codec, NilDecodesToDefaultValue) {
    std::string bytes = encode_bytes([](Encoder& enc) {
        enc.pack_nil();
        enc.pack_nil();
        enc.pack_nil();
    });

    Decoder dec(bytes);
    int i = 5;
    mrpc::codec::decode(dec, i);
    EXPECT_EQ(i, 0);

    std::string s = "x";
    mrpc::codec::decode(dec, s);
    EXPECT_TRUE(s.empty());

    std::optional<int> opt = 3;
    mrpc::codec::decode(dec, opt);
    EXPECT_FALSE(opt.has_value());
}

TEST(Codec, ContainersRoundTrip) {
    std::vector<std::string> words = {"a", "", "ccc"};
    EXPECT_EQ(round_trip(words), words);

    std::map<std::string, int> counts = {{"x", 1}, {"y", -2}};
    EXPECT_EQ(round_trip(counts), counts);

    std::tuple<int, std::string, bool> record{7, "seven", true};
    EXPECT_EQ(round_trip(record), record);

    std::optional<double> maybe = 2.5;
    EXPECT_EQ(round_trip(maybe), maybe);
}

TEST(Codec, TupleSkipsSurplusAndDefaultsMissingMembers) {
    std::string bytes = encode_bytes([](Encoder& enc) {
        enc.pack_array_len(3);
        enc.pack_int(1);
        enc.pack_string("two");
        enc.pack_array_len(1);
        enc.pack_int(3);
        enc.pack_array_len(1);
        enc.pack_int(4);
        enc.pack_int(5);
    });

    Decoder dec(bytes);
    std::tuple<int, std::string> first;
    mrpc::codec::decode(dec, first);
    EXPECT_EQ(first, std::make_tuple(1, std::string("two")));

    std::tuple<int, int> second{9, 9};
    mrpc::codec::decode(dec, second);
    EXPECT_EQ(std::get<0>(second), 4);
    EXPECT_EQ(std::get<1>(second), 0);

    int tail = 0;
    mrpc::codec::decode(dec, tail);
    EXPECT_EQ(tail, 5);
}

TEST(Codec, DynamicValueRoundTrip) {
    std::map<std::string, Value> fields;
    fields.emplace("k", Value(Value::Array{Value(1), Value(-2), Value(true), Value()}));
    fields.emplace("half", Value(0.5));
    fields.emplace("big", Value(std::numeric_limits<std::uint64_t>::max()));
    Value value(fields);

    Value out = round_trip(value);
    EXPECT_EQ(out, value);
    EXPECT_EQ(out.type(), Type::map_len);
    EXPECT_EQ(round_trip(Value(5)).type(), Type::unsigned_integer);
    EXPECT_EQ(round_trip(Value(-5)).type(), Type::integer);

    // Copies own their data.
    Value copy = out;
    out = Value("replaced");
    EXPECT_EQ(copy, value);
    EXPECT_EQ(mrpc::codec::to_string(out), "replaced");
}

TEST(Codec, ValueDecodesIntoTypedTargets) {
    std::string bytes = encode_bytes([](Encoder& enc) {
        mrpc::codec::pack(enc, Value(Value::Array{Value(3), Value("x")}));
    });

    Decoder dec(bytes);
    std::tuple<int, std::string> out;
    mrpc::codec::decode(dec, out);
    EXPECT_EQ(out, std::make_tuple(3, std::string("x")));
}

TEST(Codec, TruncatedInputIsTransportError) {
    std::string bytes = encode_bytes([](Encoder& enc) { enc.pack_int(65535); });
    Decoder dec(std::string_view(bytes.data(), bytes.size() - 1));
    EXPECT_THROW(dec.next(), mrpc::TransportError);
}

TEST(Codec, ExcessiveNestingIsTransportError) {
    // One array header per level, far deeper than any legitimate message.
    std::string bytes(100000, '\x91');
    bytes += '\xc0';
    Decoder dec(bytes);
    EXPECT_THROW(dec.next(), mrpc::TransportError);
}

TEST(Codec, ModerateNestingDecodes) {
    std::string bytes(100, '\x91');
    bytes += '\x07';
    Decoder dec(bytes);

    Value value;
    mrpc::codec::decode(dec, value);
    const msgpack::object* level = &value.object();
    int depth = 0;
    while (level->type == msgpack::type::ARRAY) {
        ASSERT_EQ(level->via.array.size, 1u);
        level = &level->via.array.ptr[0];
        ++depth;
    }
    EXPECT_EQ(depth, 100);
    EXPECT_EQ(level->via.u64, 7u);
    EXPECT_FALSE(dec.next());
}

TEST(Codec, ObjectCapturesWholeSubtree) {
    std::string bytes = encode_bytes([](Encoder& enc) {
        enc.pack_array_len(2);
        enc.pack_map_len(1);
        enc.pack_string("a");
        enc.pack_int(1);
        enc.pack_string("after");
    });

    Decoder dec(bytes);
    ASSERT_TRUE(dec.next());
    ASSERT_EQ(dec.array_length(), 2u);
    ASSERT_TRUE(dec.next());
    const msgpack::object& subtree = dec.object();

    ASSERT_TRUE(dec.next());
    EXPECT_EQ(dec.string_value(), "after");

    Decoder sub(subtree);
    std::map<std::string, int> m;
    mrpc::codec::decode(sub, m);
    EXPECT_EQ(m.at("a"), 1);
}
