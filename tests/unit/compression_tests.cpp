#include <doctest/doctest.h>
#include <hcert/compression.hpp>

#include <string>

using namespace hcert;

static Bytes sample_text() {
    std::string s;
    for (int i = 0; i < 50; ++i) {
        s += "Digital Covid Certificate " + std::to_string(i) + "\n";
    }
    return Bytes(s.begin(), s.end());
}

TEST_CASE("has_zlib_header recognises the deflate wrapper") {
    CHECK(has_zlib_header({0x78, 0xDA}));
    CHECK(has_zlib_header({0x78, 0x9C}));
    CHECK(has_zlib_header({0x78, 0x01}));
    CHECK(has_zlib_header({0x78, 0x00}));         // check bits wrong, left to inflate
    CHECK(has_zlib_header({0x78}));
    CHECK(has_zlib_header({0x08, 0x1D}));         // 256-byte window
    CHECK_FALSE(has_zlib_header({0x88, 0x98}));   // window above 32K
    CHECK_FALSE(has_zlib_header({0x79, 0x9C}));   // method 9
    CHECK_FALSE(has_zlib_header({0xD2, 0x84}));   // COSE tag 18
    CHECK_FALSE(has_zlib_header({}));
}

TEST_CASE("maybe_decompress rejects a damaged header check value") {
    auto compressed = zlib_deflate(sample_text());
    REQUIRE(compressed.isOk());

    SUBCASE("FLG with the low bit flipped") {
        Bytes bad = compressed.value();
        bad[1] ^= 0x01;
        auto res = maybe_decompress(bad);
        REQUIRE(res.isErr());
        CHECK(res.error().code() == ErrorCode::DECOMPRESS_ERROR);
    }
    SUBCASE("FLG with the second bit flipped") {
        Bytes bad = compressed.value();
        bad[1] ^= 0x02;
        auto res = maybe_decompress(bad);
        REQUIRE(res.isErr());
        CHECK(res.error().code() == ErrorCode::DECOMPRESS_ERROR);
    }
}

TEST_CASE("zlib_inflate reverses zlib_deflate") {
    Bytes data = sample_text();
    auto compressed = zlib_deflate(data);
    REQUIRE(compressed.isOk());
    CHECK(has_zlib_header(compressed.value()));
    CHECK(compressed.value().size() < data.size());

    auto inflated = zlib_inflate(compressed.value());
    REQUIRE(inflated.isOk());
    CHECK(inflated.value() == data);
}

TEST_CASE("maybe_decompress passes uncompressed input through") {
    Bytes raw = {0xD2, 0x84, 0x43, 0xA1, 0x01, 0x26};
    auto res = maybe_decompress(raw);
    REQUIRE(res.isOk());
    CHECK(res.value() == raw);
}

TEST_CASE("zlib_inflate reports corrupt streams") {
    auto compressed = zlib_deflate(sample_text());
    REQUIRE(compressed.isOk());

    SUBCASE("flipped body bytes") {
        Bytes bad = compressed.value();
        for (size_t i = 4; i < bad.size() - 4; i += 3) {
            bad[i] ^= 0x5A;
        }
        auto res = zlib_inflate(bad);
        REQUIRE(res.isErr());
        CHECK(res.error().code() == ErrorCode::DECOMPRESS_ERROR);
    }
    SUBCASE("damaged checksum") {
        Bytes bad = compressed.value();
        bad.back() ^= 0xFF;
        auto res = zlib_inflate(bad);
        REQUIRE(res.isErr());
        CHECK(res.error().code() == ErrorCode::DECOMPRESS_ERROR);
    }
    SUBCASE("truncated stream") {
        Bytes bad(compressed.value().begin(), compressed.value().end() - 8);
        auto res = zlib_inflate(bad);
        REQUIRE(res.isErr());
        CHECK(res.error().code() == ErrorCode::DECOMPRESS_ERROR);
    }
}

TEST_CASE("zlib_inflate enforces the output limit") {
    Bytes zeros(100000, 0);
    auto compressed = zlib_deflate(zeros);
    REQUIRE(compressed.isOk());

    auto limited = zlib_inflate(compressed.value(), 1024);
    REQUIRE(limited.isErr());
    CHECK(limited.error().code() == ErrorCode::DECOMPRESS_ERROR);

    auto exact = zlib_inflate(compressed.value(), zeros.size());
    REQUIRE(exact.isOk());
    CHECK(exact.value().size() == zeros.size());
}
