#include <doctest/doctest.h>
#include <hcert/certificate.hpp>

#include "../fixtures.hpp"

#include <algorithm>

using namespace hcert;

static bool has_issue(const CertificateRecord& record, const std::string& path) {
    return std::any_of(record.issues.begin(), record.issues.end(),
                       [&path](const SchemaIssue& i) { return i.path == path; });
}

TEST_CASE("map_certificate fills a vaccination record") {
    auto record = map_certificate(test::vaccination_claims());

    CHECK(record.issues.empty());
    CHECK(record.issuer == std::optional<std::string>("IE"));
    REQUIRE(record.issued_at);
    CHECK(record.issued_at->epoch_seconds == 1623051988);
    REQUIRE(record.expires_at);
    CHECK(record.expires_at->epoch_seconds == 1623661200);
    CHECK(record.schema_version == std::optional<std::string>("1.0.4"));

    CHECK(record.identity.surname == std::optional<std::string>("Bloggs"));
    CHECK(record.identity.forename == std::optional<std::string>("Jane"));
    CHECK(record.identity.surname_transliterated == std::optional<std::string>("BLOGGS"));
    CHECK(record.identity.forename_transliterated == std::optional<std::string>("JANE"));
    CHECK(record.identity.date_of_birth == std::optional<std::string>("1988-06-07"));

    REQUIRE(record.vaccinations.size() == 1);
    const auto& v = record.vaccinations[0];
    CHECK(v.dose_number == std::optional<int64_t>(1));
    CHECK(v.total_doses == std::optional<int64_t>(2));
    CHECK(v.manufacturer == std::optional<std::string>("ORG-100030215"));
    CHECK(v.product == std::optional<std::string>("EU/1/20/1528"));
    CHECK(v.prophylaxis == std::optional<std::string>("1119349007"));
    CHECK(v.target_disease == std::optional<std::string>("840539006"));
    CHECK(v.date == std::optional<std::string>("2021-05-06"));
    CHECK(v.country == std::optional<std::string>("IE"));
    CHECK(v.issuer == std::optional<std::string>("HSE"));
    CHECK(v.certificate_id == std::optional<std::string>("URN:UVCI:01:IE:52d0dc929c884cf8998a7987f0b9d863#2"));

    CHECK(record.tests.empty());
    CHECK(record.recoveries.empty());
}

TEST_CASE("map_certificate accepts float dose counts and date claims") {
    auto entry = test::text_map({
        {"dn", Value::floating(2.0)},
        {"sd", Value::floating(2.0)},
        {"tg", Value::text("840539006")},
        {"vp", Value::text("J07BX03")},
        {"mp", Value::text("EU/1/21/1529")},
        {"ma", Value::text("ORG-100001699")},
        {"dt", Value::text("2021-04-01")},
        {"co", Value::text("NL")},
        {"is", Value::text("Ministry of Health")},
        {"ci", Value::text("URN:UVCI:01:NL:X")},
    });
    auto claims = test::int_map({
        {CWT_CLAIM_ISSUER, Value::text("NL")},
        {CWT_CLAIM_ISSUED_AT, Value::date(Timestamp{1623051988})},
        {CWT_CLAIM_EXPIRES_AT, Value::floating(1623661200.0)},
        {CWT_CLAIM_HCERT, test::int_map({{HCERT_EU_DCC_V1, test::dcc("v", entry)}})},
    });

    auto record = map_certificate(claims);
    CHECK(record.issues.empty());
    REQUIRE(record.vaccinations.size() == 1);
    CHECK(record.vaccinations[0].dose_number == std::optional<int64_t>(2));
    CHECK(record.vaccinations[0].total_doses == std::optional<int64_t>(2));
    CHECK(record.issued_at->epoch_seconds == 1623051988);
    CHECK(record.expires_at->epoch_seconds == 1623661200);
}

TEST_CASE("map_certificate degrades per field") {
    SUBCASE("surname missing") {
        auto dcc = test::text_map({
            {"v", Value::array({test::vaccination_entry()})},
            {"nam", test::text_map({{"gn", Value::text("Jane")}, {"fnt", Value::text("BLOGGS")},
                                    {"gnt", Value::text("JANE")}})},
            {"ver", Value::text("1.0.4")},
            {"dob", Value::text("1988-06-07")},
        });
        auto record = map_certificate(test::claims(dcc));
        CHECK_FALSE(record.identity.surname);
        CHECK(record.identity.forename == std::optional<std::string>("Jane"));
        CHECK(has_issue(record, "-260.1.nam.fn"));
        CHECK(record.issues.size() == 1);
        CHECK(record.vaccinations.size() == 1);
    }
    SUBCASE("wrong variant") {
        auto dcc = test::text_map({
            {"v", Value::array({test::vaccination_entry()})},
            {"nam", test::name_entry()},
            {"ver", Value::text("1.0.4")},
            {"dob", Value::integer(19880607)},
        });
        auto record = map_certificate(test::claims(dcc));
        CHECK_FALSE(record.identity.date_of_birth);
        REQUIRE(record.issues.size() == 1);
        CHECK(record.issues[0].path == "-260.1.dob");
        CHECK(record.issues[0].reason == "expected text, got integer");
        CHECK(record.issues[0].code == ErrorCode::SCHEMA_ERROR);
        CHECK(record.identity.surname == std::optional<std::string>("Bloggs"));
    }
    SUBCASE("fractional dose count") {
        auto entry = test::vaccination_entry();
        Value::Map m = *entry.as_map();
        for (auto& e : m) {
            if (e.key == Value::text("dn")) e.value = Value::floating(1.5);
        }
        auto record = map_certificate(test::claims(test::dcc("v", Value::map(m))));
        REQUIRE(record.vaccinations.size() == 1);
        CHECK_FALSE(record.vaccinations[0].dose_number);
        CHECK(has_issue(record, "-260.1.v.0.dn"));
    }
    SUBCASE("event entry is not a map") {
        auto record = map_certificate(test::claims(test::dcc("v", Value::text("oops"))));
        CHECK(record.vaccinations.empty());
        CHECK(has_issue(record, "-260.1.v.0"));
        CHECK(has_issue(record, "-260.1"));
    }
    SUBCASE("hcert claim missing") {
        auto claims = test::int_map({
            {CWT_CLAIM_ISSUER, Value::text("IE")},
            {CWT_CLAIM_ISSUED_AT, Value::integer(1)},
            {CWT_CLAIM_EXPIRES_AT, Value::integer(2)},
        });
        auto record = map_certificate(claims);
        CHECK(record.issuer == std::optional<std::string>("IE"));
        CHECK(has_issue(record, "-260"));
        CHECK(record.issues.size() == 1);
    }
    SUBCASE("payload is not a map") {
        auto record = map_certificate(Value::array({}));
        CHECK_FALSE(record.issuer);
        CHECK(record.issues.size() == 1);
    }
}

TEST_CASE("map_certificate reads test and recovery events") {
    auto test_entry = test::text_map({
        {"tg", Value::text("840539006")},
        {"tt", Value::text("LP6464-4")},
        {"nm", Value::text("Roche LightCycler qPCR")},
        {"sc", Value::text("2021-04-13T14:20:00+00:00")},
        {"tr", Value::text("260415000")},
        {"tc", Value::text("GGD Fryslân")},
        {"co", Value::text("NL")},
        {"is", Value::text("Ministry of Public Health")},
        {"ci", Value::text("URN:UVCI:01:NL:T")},
    });
    auto tested = map_certificate(test::claims(test::dcc("t", test_entry)));
    CHECK(tested.issues.empty());
    REQUIRE(tested.tests.size() == 1);
    CHECK(tested.tests[0].test_type == std::optional<std::string>("LP6464-4"));
    CHECK(tested.tests[0].result == std::optional<std::string>("260415000"));
    CHECK_FALSE(tested.tests[0].test_device);

    auto recovery_entry = test::text_map({
        {"tg", Value::text("840539006")},
        {"fr", Value::text("2021-03-01")},
        {"co", Value::text("DE")},
        {"is", Value::text("Robert Koch-Institut")},
        {"df", Value::text("2021-03-29")},
        {"du", Value::text("2021-08-28")},
        {"ci", Value::text("URN:UVCI:01:DE:R")},
    });
    auto recovered = map_certificate(test::claims(test::dcc("r", recovery_entry)));
    CHECK(recovered.issues.empty());
    REQUIRE(recovered.recoveries.size() == 1);
    CHECK(recovered.recoveries[0].valid_until == std::optional<std::string>("2021-08-28"));
}

TEST_CASE("get_field reads record fields by DCC path") {
    auto record = map_certificate(test::vaccination_claims());

    CHECK(get_field(record, "iss") == std::optional<std::string>("IE"));
    CHECK(get_field(record, "iat") == std::optional<std::string>("2021-06-07T07:46:28Z"));
    CHECK(get_field(record, "exp") == std::optional<std::string>("2021-06-14T09:00:00Z"));
    CHECK(get_field(record, "nam.fn") == std::optional<std::string>("Bloggs"));
    CHECK(get_field(record, "nam.gnt") == std::optional<std::string>("JANE"));
    CHECK(get_field(record, "dob") == std::optional<std::string>("1988-06-07"));
    CHECK(get_field(record, "v.0.dn") == std::optional<std::string>("1"));
    CHECK(get_field(record, "v.0.sd") == std::optional<std::string>("2"));
    CHECK(get_field(record, "v.0.mp") == std::optional<std::string>("EU/1/20/1528"));

    CHECK_FALSE(get_field(record, "v.1.dn"));
    CHECK_FALSE(get_field(record, "t.0.tt"));
    CHECK_FALSE(get_field(record, "v.0.zz"));
    CHECK_FALSE(get_field(record, "v.x.dn"));
    CHECK_FALSE(get_field(record, "nope"));
}
