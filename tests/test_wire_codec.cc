#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

#include "callbridge/BridgeError.hpp"
#include "callbridge/WireCodec.hpp"

using namespace callbridge;

// Expect fn to throw BridgeError of the given kind.
template <typename Fn>
static void expect_error(ErrorKind kind, Fn fn) {
    try {
        fn();
        FAIL() << "expected " << error_kind_name(kind);
    } catch (const BridgeError& e) {
        EXPECT_EQ(e.kind(), kind) << e.what();
    }
}

// ============================================================================
// VALUE ROUND TRIPS
// ============================================================================

TEST(WireCodecTest, RoundTripsEveryValueKind) {
    const WireValue values[] = {
        WireValue{},
        WireValue{std::string("hello")},
        WireValue{std::string()},
        WireValue{int64_t{42}},
        WireValue{int64_t{-1}},
        WireValue{std::numeric_limits<int64_t>::min()},
        WireValue{true},
        WireValue{false},
        WireValue{WireFloat{3.5}},
        WireValue{RawObjectRef{CALLBRIDGE_OBJECT_COLLECTOR, 0xdeadbeefULL}},
    };

    for (const auto& v : values) {
        Bytes encoded = wire::encode(v);
        EXPECT_EQ(wire::decode_value(encoded), v) << wire_value_to_string(v);
    }
}

TEST(WireCodecTest, NaNRoundTripsBitForBit) {
    WireValue v{WireFloat{std::numeric_limits<double>::quiet_NaN()}};
    WireValue back = wire::decode_value(wire::encode(v));

    ASSERT_TRUE(std::holds_alternative<WireFloat>(back));
    EXPECT_TRUE(std::isnan(std::get<WireFloat>(back).value));
    EXPECT_EQ(back, v);
}

TEST(WireCodecTest, TagIsAuthoritative) {
    // 1 as int and true as bool must not collapse into each other.
    Bytes as_int = wire::encode(WireValue{int64_t{1}});
    Bytes as_bool = wire::encode(WireValue{true});
    EXPECT_NE(as_int, as_bool);

    EXPECT_TRUE(std::holds_alternative<int64_t>(wire::decode_value(as_int)));
    EXPECT_TRUE(std::holds_alternative<bool>(wire::decode_value(as_bool)));
}

TEST(WireCodecTest, EncodesLittleEndianLayout) {
    Bytes b = wire::encode(WireValue{int64_t{0x0102}});
    Bytes expected = {1, 6, 0x02, 0x02, 0x01, 0, 0, 0, 0, 0, 0};
    EXPECT_EQ(b, expected);

    Bytes s = wire::encode(WireValue{std::string("ab")});
    Bytes expected_s = {1, 6, 0x01, 2, 0, 0, 0, 'a', 'b'};
    EXPECT_EQ(s, expected_s);
}

// ============================================================================
// MESSAGE ROUND TRIPS
// ============================================================================

TEST(WireCodecTest, KwargsMapKeepsOrderAndTags) {
    KwargsMap kwargs = {
        {"key1", WireValue{std::string("value1")}},
        {"key2", WireValue{int64_t{42}}},
        {"key3", WireValue{true}},
    };

    KwargsMap back = wire::decode_kwargs(wire::encode(kwargs));
    ASSERT_EQ(back.size(), 3u);
    EXPECT_EQ(back[0].key, "key1");
    EXPECT_EQ(std::get<std::string>(back[0].value), "value1");
    EXPECT_EQ(back[1].key, "key2");
    EXPECT_EQ(std::get<int64_t>(back[1].value), 42);
    EXPECT_EQ(back[2].key, "key3");
    EXPECT_TRUE(std::get<bool>(back[2].value));
}

TEST(WireCodecTest, DuplicateKeysArePreserved) {
    KwargsMap kwargs = {
        {"k", WireValue{int64_t{1}}},
        {"k", WireValue{int64_t{2}}},
    };
    KwargsMap back = wire::decode_kwargs(wire::encode(kwargs));
    EXPECT_EQ(back, kwargs);
    EXPECT_EQ(std::get<int64_t>(*find_kwarg(back, "k")), 1);
}

TEST(WireCodecTest, RoundTripsRequests) {
    FunctionCallRequest fn;
    fn.function_name = "ExtractResume";
    fn.kwargs = {{"text", WireValue{std::string("John Doe")}}, {"limit", WireValue{int64_t{3}}}};
    fn.env = {{"API_KEY", "secret"}, {"EMPTY", ""}};
    EXPECT_EQ(wire::decode_function_call(wire::encode(fn)), fn);

    ObjectConstructorRequest ctor;
    ctor.kind = CALLBRIDGE_OBJECT_COLLECTOR;
    ctor.kwargs = {{"name", WireValue{std::string("my-collector")}}};
    EXPECT_EQ(wire::decode_object_constructor(wire::encode(ctor)), ctor);

    ObjectMethodRequest method;
    method.object = RawObjectRef{CALLBRIDGE_OBJECT_TYPE_BUILDER, 0x7f0012345678ULL};
    method.method_name = "add_class";
    method.kwargs = {{"name", WireValue{std::string("Person")}}};
    EXPECT_EQ(wire::decode_object_method(wire::encode(method)), method);

    RawObjectRef ref{CALLBRIDGE_OBJECT_FUNCTION_LOG, 1};
    EXPECT_EQ(wire::decode_raw_object(wire::encode(ref)), ref);
}

TEST(WireCodecTest, EncodingIsDeterministic) {
    ObjectMethodRequest method;
    method.object = RawObjectRef{CALLBRIDGE_OBJECT_COLLECTOR, 99};
    method.method_name = "add";
    method.kwargs = {{"function_name", WireValue{std::string("f")}}, {"x", WireValue{WireFloat{0.25}}}};

    Bytes first = wire::encode(method);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(wire::encode(method), first);
    }
}

// ============================================================================
// MALFORMED INPUT
// ============================================================================

TEST(WireCodecTest, EveryTruncationIsMalformed) {
    FunctionCallRequest fn;
    fn.function_name = "echo";
    fn.kwargs = {{"value", WireValue{std::string("hello")}}};
    fn.env = {{"A", "B"}};
    Bytes full = wire::encode(fn);

    for (size_t len = 0; len < full.size(); ++len) {
        expect_error(ErrorKind::MalformedMessage, [&]() { wire::decode_function_call(full.data(), len); });
    }
}

TEST(WireCodecTest, TrailingBytesAreMalformed) {
    Bytes b = wire::encode(WireValue{int64_t{7}});
    b.push_back(0);
    expect_error(ErrorKind::MalformedMessage, [&]() { wire::decode_value(b); });
}

TEST(WireCodecTest, RejectsWrongVersionAndKind) {
    Bytes b = wire::encode(WireValue{});
    Bytes bad_version = b;
    bad_version[0] = 2;
    expect_error(ErrorKind::MalformedMessage, [&]() { wire::decode_value(bad_version); });

    // A value message is not a kwargs message.
    expect_error(ErrorKind::MalformedMessage, [&]() { wire::decode_kwargs(b); });
}

TEST(WireCodecTest, UnknownTagIsUnsupported) {
    Bytes b = {1, 6, 0x09};
    expect_error(ErrorKind::UnsupportedValueKind, [&]() { wire::decode_value(b); });
}

TEST(WireCodecTest, BoolByteMustBeZeroOrOne) {
    Bytes b = {1, 6, 0x03, 2};
    expect_error(ErrorKind::MalformedMessage, [&]() { wire::decode_value(b); });
}

TEST(WireCodecTest, UnknownObjectKindIsMalformed) {
    Bytes zero = {1, 4, 0, 1, 0, 0, 0, 0, 0, 0, 0};
    expect_error(ErrorKind::MalformedMessage, [&]() { wire::decode_raw_object(zero); });

    Bytes high = {1, 4, 42, 1, 0, 0, 0, 0, 0, 0, 0};
    expect_error(ErrorKind::MalformedMessage, [&]() { wire::decode_raw_object(high); });
}

TEST(WireCodecTest, HostileCountsFailWithoutAllocating) {
    // kwargs count 0xFFFFFFFF with no entries behind it
    Bytes b = {1, 5, 0xFF, 0xFF, 0xFF, 0xFF};
    expect_error(ErrorKind::MalformedMessage, [&]() { wire::decode_kwargs(b); });

    // string length beyond the limit
    Bytes s = {1, 6, 0x01, 0xFF, 0xFF, 0xFF, 0x7F};
    expect_error(ErrorKind::MalformedMessage, [&]() { wire::decode_value(s); });
}

TEST(WireCodecTest, EmptyBufferIsMalformed) {
    expect_error(ErrorKind::MalformedMessage, [&]() { wire::decode_value(nullptr, 0); });
}
