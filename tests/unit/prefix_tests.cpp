#include <doctest/doctest.h>
#include <hcert/prefix.hpp>

using namespace hcert;

TEST_CASE("strip_prefix accepts HC1 and returns the body") {
    auto res = strip_prefix("HC1:NCFE70X90");
    REQUIRE(res.isOk());
    CHECK(res.value().scheme == "HC");
    CHECK(res.value().version == 1);
    CHECK(res.value().body == "NCFE70X90");
}

TEST_CASE("strip_prefix trims surrounding whitespace") {
    auto res = strip_prefix("  HC1:6BFOXN\r\n");
    REQUIRE(res.isOk());
    CHECK(res.value().body == "6BFOXN");
}

TEST_CASE("strip_prefix rejects malformed markers") {
    SUBCASE("missing scheme") {
        auto res = strip_prefix("NCFE70X90T9WTWGVLKX49");
        REQUIRE(res.isErr());
        CHECK(res.error().code() == ErrorCode::FORMAT_ERROR);
    }
    SUBCASE("lowercase scheme") {
        auto res = strip_prefix("hc1:NCFE70X90");
        REQUIRE(res.isErr());
        CHECK(res.error().code() == ErrorCode::FORMAT_ERROR);
    }
    SUBCASE("no separator") {
        auto res = strip_prefix("HC1NCFE70X90");
        REQUIRE(res.isErr());
        CHECK(res.error().code() == ErrorCode::FORMAT_ERROR);
    }
    SUBCASE("too short") {
        auto res = strip_prefix("HC1");
        REQUIRE(res.isErr());
        CHECK(res.error().code() == ErrorCode::FORMAT_ERROR);
    }
    SUBCASE("empty") {
        auto res = strip_prefix("");
        REQUIRE(res.isErr());
        CHECK(res.error().code() == ErrorCode::FORMAT_ERROR);
    }
}

TEST_CASE("strip_prefix rejects unsupported versions") {
    auto res = strip_prefix("HC2:NCFE70X90");
    REQUIRE(res.isErr());
    CHECK(res.error().code() == ErrorCode::FORMAT_ERROR);
    CHECK(res.error().message().find("HC2") != std::string::npos);
}

TEST_CASE("strip_prefix allows an empty body") {
    auto res = strip_prefix("HC1:");
    REQUIRE(res.isOk());
    CHECK(res.value().body.empty());
}
