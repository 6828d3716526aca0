#include <doctest/doctest.h>
#include <hcert/base45.hpp>

#include <string>

using namespace hcert;

static Bytes bytes_of(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

TEST_CASE("base45 decodes RFC 9285 examples") {
    auto ab = base45_decode("BB8");
    REQUIRE(ab.isOk());
    CHECK(ab.value() == bytes_of("AB"));

    auto hello = base45_decode("%69 VD92EX0");
    REQUIRE(hello.isOk());
    CHECK(hello.value() == bytes_of("Hello!!"));

    auto base = base45_decode("UJCLQE7W581");
    REQUIRE(base.isOk());
    CHECK(base.value() == bytes_of("base-45"));

    auto ietf = base45_decode("QED8WEX0");
    REQUIRE(ietf.isOk());
    CHECK(ietf.value() == bytes_of("ietf!"));
}

TEST_CASE("base45 encodes RFC 9285 examples") {
    CHECK(base45_encode(bytes_of("AB")) == "BB8");
    CHECK(base45_encode(bytes_of("Hello!!")) == "%69 VD92EX0");
    CHECK(base45_encode(bytes_of("base-45")) == "UJCLQE7W581");
}

TEST_CASE("base45 round trips odd and even lengths") {
    Bytes even = {0x00, 0xFF, 0x10, 0x80};
    Bytes odd = {0xFF, 0xFF, 0x01};

    auto e = base45_decode(base45_encode(even));
    REQUIRE(e.isOk());
    CHECK(e.value() == even);

    auto o = base45_decode(base45_encode(odd));
    REQUIRE(o.isOk());
    CHECK(o.value() == odd);
}

TEST_CASE("base45 decodes empty input to empty bytes") {
    auto res = base45_decode("");
    REQUIRE(res.isOk());
    CHECK(res.value().empty());
}

TEST_CASE("base45 rejects malformed input") {
    SUBCASE("character outside the alphabet") {
        auto res = base45_decode("BBa");
        REQUIRE(res.isErr());
        CHECK(res.error().code() == ErrorCode::DECODE_ERROR);
    }
    SUBCASE("dangling single character") {
        auto res = base45_decode("BB8B");
        REQUIRE(res.isErr());
        CHECK(res.error().code() == ErrorCode::DECODE_ERROR);
    }
    SUBCASE("triple above 65535") {
        auto res = base45_decode("GGW");
        REQUIRE(res.isErr());
        CHECK(res.error().code() == ErrorCode::DECODE_ERROR);
    }
    SUBCASE("trailing pair above 255") {
        auto res = base45_decode("BB8GG");
        REQUIRE(res.isErr());
        CHECK(res.error().code() == ErrorCode::DECODE_ERROR);
    }
}

TEST_CASE("base45 accepts the largest valid groups") {
    // 65535 = 15 + 16*45 + 32*2025, 255 = 30 + 5*45
    auto triple = base45_decode("FGW");
    REQUIRE(triple.isOk());
    CHECK(triple.value() == Bytes{0xFF, 0xFF});

    auto pair = base45_decode("U5");
    REQUIRE(pair.isOk());
    CHECK(pair.value() == Bytes{0xFF});
}
