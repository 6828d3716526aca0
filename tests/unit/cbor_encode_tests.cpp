#include <doctest/doctest.h>
#include <hcert/cbor.hpp>

using namespace hcert;

static Value round_trip(const Value& v) {
    auto res = decode_cbor(encode_cbor(v));
    REQUIRE(res.isOk());
    return res.value();
}

TEST_CASE("encode_cbor uses the shortest argument form") {
    CHECK(encode_cbor(Value::integer(0)) == Bytes{0x00});
    CHECK(encode_cbor(Value::integer(23)) == Bytes{0x17});
    CHECK(encode_cbor(Value::integer(24)) == Bytes{0x18, 0x18});
    CHECK(encode_cbor(Value::integer(256)) == Bytes{0x19, 0x01, 0x00});
    CHECK(encode_cbor(Value::integer(-1)) == Bytes{0x20});
    CHECK(encode_cbor(Value::integer(-260)) == Bytes{0x39, 0x01, 0x03});
    CHECK(encode_cbor(Value::text("IE")) == Bytes{0x62, 'I', 'E'});
    CHECK(encode_cbor(Value::map({})) == Bytes{0xA0});
    CHECK(encode_cbor(Value::boolean(true)) == Bytes{0xF5});
    CHECK(encode_cbor(Value::null()) == Bytes{0xF6});
}

TEST_CASE("encode_cbor writes dates as tag 1") {
    CHECK(encode_cbor(Value::date(Timestamp{1623661200})) ==
          Bytes{0xC1, 0x1A, 0x60, 0xC7, 0x1A, 0x90});
}

TEST_CASE("CBOR round trip preserves trees") {
    SUBCASE("empty map") {
        Value v = Value::map({});
        CHECK(round_trip(v) == v);
    }
    SUBCASE("nested array of three integers") {
        Value::Array inner = {Value::integer(1), Value::integer(-2), Value::integer(300000)};
        Value::Array outer;
        outer.push_back(Value::array(inner));
        Value v = Value::array(outer);
        CHECK(round_trip(v) == v);
    }
    SUBCASE("tagged epoch date") {
        Value v = Value::date(Timestamp{1623051988});
        Value back = round_trip(v);
        REQUIRE(back.is_date());
        CHECK(back == v);
    }
    SUBCASE("indefinite text decodes to the same value as definite") {
        Bytes chunked = {0x7F, 0x63, 'J', 'a', 'n', 0x61, 'e', 0xFF};
        auto decoded = decode_cbor(chunked);
        REQUIRE(decoded.isOk());
        CHECK(decoded.value() == Value::text("Jane"));
        CHECK(encode_cbor(decoded.value()) == Bytes{0x64, 'J', 'a', 'n', 'e'});
    }
    SUBCASE("mixed map with tags and floats") {
        Value::Map m;
        m.push_back({Value::text("b"), Value::bytes({0x01, 0x02})});
        m.push_back({Value::integer(-260), Value::tagged(99, Value::text("x"))});
        m.push_back({Value::text("f"), Value::floating(1.5)});
        m.push_back({Value::text("s"), Value::simple(99)});
        Value v = Value::map(m);
        CHECK(round_trip(v) == v);
    }
}

TEST_CASE("Value equality distinguishes kinds") {
    CHECK(Value::integer(1) != Value::floating(1.0));
    CHECK(Value::text("1") != Value::bytes({'1'}));
    CHECK(Value::null() != Value::undefined());
    CHECK(Value::tagged(1, Value::integer(5)) != Value::date(Timestamp{5}));
}
