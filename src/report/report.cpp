#include "hcert/report.hpp"

#include <sstream>

namespace hcert {

namespace {

constexpr const char* MISSING = "<missing>";

std::string or_missing(const std::optional<std::string>& v) {
    return v ? *v : MISSING;
}

std::string display_or_missing(const ValueSets& sets, ValueSetKind kind,
                               const std::optional<std::string>& code) {
    return code ? sets.display(kind, *code) : MISSING;
}

std::string time_or_missing(const std::optional<Timestamp>& ts) {
    return ts ? format_rfc2822(*ts) : MISSING;
}

std::string doses(const VaccinationEvent& v) {
    if (!v.dose_number || !v.total_doses) {
        return MISSING;
    }
    return std::to_string(*v.dose_number) + "/" + std::to_string(*v.total_doses);
}

template<typename T>
nlohmann::json opt(const std::optional<T>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

// {"code": "ORG-100030215", "display": "Biontech Manufacturing GmbH"}
nlohmann::json coded(const ValueSets& sets, ValueSetKind kind, const std::optional<std::string>& code) {
    if (!code) return nullptr;
    return {{"code", *code}, {"display", sets.display(kind, *code)}};
}

nlohmann::json time_json(const std::optional<Timestamp>& ts) {
    if (!ts) return nullptr;
    return {{"epoch", ts->epoch_seconds}, {"utc", format_rfc3339(*ts)}};
}

} // namespace

std::string render_text(const CertificateRecord& record, const ValueSets& value_sets) {
    std::ostringstream out;
    const Identity& id = record.identity;

    out << "# Identity Info\n";
    out << "SURNAME(S):\t" << or_missing(id.surname) << "\n";
    out << "FORENAME(S):\t" << or_missing(id.forename) << "\n";
    out << "ID SURNAME(S):\t" << or_missing(id.surname_transliterated) << "\n";
    out << "ID FORENAME(S):\t" << or_missing(id.forename_transliterated) << "\n";
    out << "DOB:\t\t" << or_missing(id.date_of_birth) << "\n";

    for (const auto& v : record.vaccinations) {
        out << "\n# Vaccine Info\n";
        out << "Doses (rcvd/rqrd):\t" << doses(v) << "\n";
        out << "Latest Dose Date:\t" << or_missing(v.date) << "\n";
        out << "Manufacturer:\t\t" << display_or_missing(value_sets, ValueSetKind::Manufacturer, v.manufacturer) << "\n";
        out << "Product:\t\t" << display_or_missing(value_sets, ValueSetKind::Product, v.product) << "\n";
    }

    for (const auto& t : record.tests) {
        out << "\n# Test Info\n";
        out << "Test Type:\t\t" << display_or_missing(value_sets, ValueSetKind::TestType, t.test_type) << "\n";
        if (t.test_name) {
            out << "Test Name:\t\t" << *t.test_name << "\n";
        }
        if (t.test_device) {
            out << "Test Device:\t\t" << *t.test_device << "\n";
        }
        out << "Sample Collected:\t" << or_missing(t.sample_collected) << "\n";
        out << "Result:\t\t\t" << display_or_missing(value_sets, ValueSetKind::TestResult, t.result) << "\n";
        out << "Testing Centre:\t\t" << or_missing(t.testing_centre) << "\n";
    }

    for (const auto& r : record.recoveries) {
        out << "\n# Recovery Info\n";
        out << "First Positive:\t\t" << or_missing(r.first_positive) << "\n";
        out << "Valid From:\t\t" << or_missing(r.valid_from) << "\n";
        out << "Valid Until:\t\t" << or_missing(r.valid_until) << "\n";
    }

    out << "\n# Cert Info\n";
    out << "Issuer:\t\t" << or_missing(record.issuer) << "\n";
    out << "Issue Date:\t" << time_or_missing(record.issued_at) << "\n";
    out << "Expire Date:\t" << time_or_missing(record.expires_at) << "\n";

    if (!record.issues.empty()) {
        out << "\n# Schema Issues\n";
        for (const auto& issue : record.issues) {
            out << issue.path << ":\t" << issue.reason << "\n";
        }
    }

    return out.str();
}

nlohmann::json to_json(const CertificateRecord& record, const ValueSets& value_sets) {
    nlohmann::json j;
    const Identity& id = record.identity;

    j["issuer"] = opt(record.issuer);
    j["issued_at"] = time_json(record.issued_at);
    j["expires_at"] = time_json(record.expires_at);
    j["version"] = opt(record.schema_version);
    j["identity"] = {
        {"surname", opt(id.surname)},
        {"forename", opt(id.forename)},
        {"surname_transliterated", opt(id.surname_transliterated)},
        {"forename_transliterated", opt(id.forename_transliterated)},
        {"date_of_birth", opt(id.date_of_birth)},
    };

    j["vaccinations"] = nlohmann::json::array();
    for (const auto& v : record.vaccinations) {
        j["vaccinations"].push_back({
            {"target_disease", coded(value_sets, ValueSetKind::Disease, v.target_disease)},
            {"prophylaxis", coded(value_sets, ValueSetKind::Prophylaxis, v.prophylaxis)},
            {"product", coded(value_sets, ValueSetKind::Product, v.product)},
            {"manufacturer", coded(value_sets, ValueSetKind::Manufacturer, v.manufacturer)},
            {"dose_number", opt(v.dose_number)},
            {"total_doses", opt(v.total_doses)},
            {"date", opt(v.date)},
            {"country", opt(v.country)},
            {"issuer", opt(v.issuer)},
            {"certificate_id", opt(v.certificate_id)},
        });
    }

    j["tests"] = nlohmann::json::array();
    for (const auto& t : record.tests) {
        j["tests"].push_back({
            {"target_disease", coded(value_sets, ValueSetKind::Disease, t.target_disease)},
            {"test_type", coded(value_sets, ValueSetKind::TestType, t.test_type)},
            {"test_name", opt(t.test_name)},
            {"test_device", opt(t.test_device)},
            {"sample_collected", opt(t.sample_collected)},
            {"result", coded(value_sets, ValueSetKind::TestResult, t.result)},
            {"testing_centre", opt(t.testing_centre)},
            {"country", opt(t.country)},
            {"issuer", opt(t.issuer)},
            {"certificate_id", opt(t.certificate_id)},
        });
    }

    j["recoveries"] = nlohmann::json::array();
    for (const auto& r : record.recoveries) {
        j["recoveries"].push_back({
            {"target_disease", coded(value_sets, ValueSetKind::Disease, r.target_disease)},
            {"first_positive", opt(r.first_positive)},
            {"country", opt(r.country)},
            {"issuer", opt(r.issuer)},
            {"valid_from", opt(r.valid_from)},
            {"valid_until", opt(r.valid_until)},
            {"certificate_id", opt(r.certificate_id)},
        });
    }

    j["issues"] = nlohmann::json::array();
    for (const auto& issue : record.issues) {
        j["issues"].push_back({{"kind", error_code_to_string(issue.code)},
                               {"path", issue.path},
                               {"reason", issue.reason}});
    }

    return j;
}

} // namespace hcert
