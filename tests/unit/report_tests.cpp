#include <doctest/doctest.h>
#include <hcert/report.hpp>

#include "../fixtures.hpp"

using namespace hcert;

TEST_CASE("render_text prints the identity, vaccine and certificate sections") {
    auto record = map_certificate(test::vaccination_claims());
    std::string text = render_text(record, builtin_value_sets());

    CHECK(text.find("# Identity Info\n") == 0);
    CHECK(text.find("SURNAME(S):\tBloggs\n") != std::string::npos);
    CHECK(text.find("FORENAME(S):\tJane\n") != std::string::npos);
    CHECK(text.find("ID SURNAME(S):\tBLOGGS\n") != std::string::npos);
    CHECK(text.find("ID FORENAME(S):\tJANE\n") != std::string::npos);
    CHECK(text.find("DOB:\t\t1988-06-07\n") != std::string::npos);
    CHECK(text.find("\n# Vaccine Info\n") != std::string::npos);
    CHECK(text.find("Doses (rcvd/rqrd):\t1/2\n") != std::string::npos);
    CHECK(text.find("Latest Dose Date:\t2021-05-06\n") != std::string::npos);
    CHECK(text.find("Manufacturer:\t\tBiontech Manufacturing GmbH\n") != std::string::npos);
    CHECK(text.find("Product:\t\tComirnaty\n") != std::string::npos);
    CHECK(text.find("Issue Date:\tMon, 07 Jun 2021 07:46:28 +0000\n") != std::string::npos);
    CHECK(text.find("Expire Date:\tMon, 14 Jun 2021 09:00:00 +0000\n") != std::string::npos);
    CHECK(text.find("# Schema Issues") == std::string::npos);
}

TEST_CASE("render_text marks absent fields") {
    CertificateRecord record;
    record.identity.surname = "Bloggs";
    VaccinationEvent v;
    v.dose_number = 1;
    record.vaccinations.push_back(v);
    record.issues.push_back({"-260.1.v.0.sd", "missing"});

    std::string text = render_text(record, builtin_value_sets());
    CHECK(text.find("FORENAME(S):\t<missing>\n") != std::string::npos);
    CHECK(text.find("Doses (rcvd/rqrd):\t<missing>\n") != std::string::npos);
    CHECK(text.find("Issue Date:\t<missing>\n") != std::string::npos);
    CHECK(text.find("-260.1.v.0.sd:\tmissing\n") != std::string::npos);
}

TEST_CASE("render_text shows unknown codes verbatim") {
    auto record = map_certificate(test::vaccination_claims());
    std::string text = render_text(record, ValueSets());
    CHECK(text.find("Manufacturer:\t\tORG-100030215\n") != std::string::npos);
    CHECK(text.find("Product:\t\tEU/1/20/1528\n") != std::string::npos);
}

TEST_CASE("to_json carries codes and display names") {
    auto record = map_certificate(test::vaccination_claims());
    auto j = to_json(record, builtin_value_sets());

    CHECK(j["issuer"] == "IE");
    CHECK(j["issued_at"]["utc"] == "2021-06-07T07:46:28Z");
    CHECK(j["issued_at"]["epoch"] == 1623051988);
    CHECK(j["identity"]["surname"] == "Bloggs");
    CHECK(j["identity"]["date_of_birth"] == "1988-06-07");
    REQUIRE(j["vaccinations"].size() == 1);
    CHECK(j["vaccinations"][0]["manufacturer"]["code"] == "ORG-100030215");
    CHECK(j["vaccinations"][0]["manufacturer"]["display"] == "Biontech Manufacturing GmbH");
    CHECK(j["vaccinations"][0]["dose_number"] == 1);
    CHECK(j["tests"].empty());
    CHECK(j["issues"].empty());
}

TEST_CASE("to_json lists schema issues with their kind") {
    CertificateRecord record;
    record.issues.push_back({"-260.1.nam.fn", "missing"});

    auto j = to_json(record, builtin_value_sets());
    REQUIRE(j["issues"].size() == 1);
    CHECK(j["issues"][0]["kind"] == "SchemaError");
    CHECK(j["issues"][0]["path"] == "-260.1.nam.fn");
    CHECK(j["issues"][0]["reason"] == "missing");
}
