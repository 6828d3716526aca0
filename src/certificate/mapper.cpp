#include "hcert/certificate.hpp"

#include <cmath>

#include <spdlog/spdlog.h>

namespace hcert {

namespace {

// Largest double that still converts to int64_t without overflow
constexpr double MAX_INTEGRAL_DOUBLE = 9223372036854774784.0;

/**
 * Walks the claims tree and collects SchemaIssues. Every read takes the
 * path of the containing map so issues name the exact DCC field.
 */
class Mapper {
public:
    std::vector<SchemaIssue> take_issues() { return std::move(issues_); }

    void issue(const std::string& path, const std::string& reason) {
        spdlog::debug("schema issue at {}: {}", path, reason);
        issues_.push_back({path, reason});
    }

    void mismatch(const std::string& path, const char* expected, const Value& got) {
        issue(path, std::string("expected ") + expected + ", got " + kind_to_string(got.kind()));
    }

    template<typename Key>
    const Value* lookup(const Value& map, const Key& key, const std::string& path, bool required) {
        const Value* v = map.find(key);
        if (!v && required) {
            issue(path, "missing");
        }
        return v;
    }

    template<typename Key>
    std::optional<std::string> text(const Value& map, const Key& key, const std::string& path,
                                    bool required = true) {
        const Value* v = lookup(map, key, path, required);
        if (!v) return std::nullopt;
        if (const std::string* s = v->as_text()) {
            return *s;
        }
        mismatch(path, "text", *v);
        return std::nullopt;
    }

    // Integer, float or tagged date, as epoch seconds
    std::optional<Timestamp> epoch(const Value& map, int64_t key, const std::string& path) {
        const Value* v = lookup(map, key, path, true);
        if (!v) return std::nullopt;
        if (const int64_t* i = v->as_integer()) {
            return Timestamp{*i};
        }
        if (const Timestamp* ts = v->as_date()) {
            return *ts;
        }
        if (const double* d = v->as_float()) {
            if (std::isfinite(*d) && std::fabs(*d) <= MAX_INTEGRAL_DOUBLE) {
                return Timestamp{static_cast<int64_t>(std::floor(*d))};
            }
            issue(path, "epoch value out of range");
            return std::nullopt;
        }
        mismatch(path, "integer or date", *v);
        return std::nullopt;
    }

    // Integer, or a float with no fractional part
    std::optional<int64_t> count(const Value& map, const std::string& key, const std::string& path) {
        const Value* v = lookup(map, key, path, true);
        if (!v) return std::nullopt;
        if (const int64_t* i = v->as_integer()) {
            return *i;
        }
        if (const double* d = v->as_float()) {
            if (std::isfinite(*d) && std::trunc(*d) == *d && std::fabs(*d) <= MAX_INTEGRAL_DOUBLE) {
                return static_cast<int64_t>(*d);
            }
            issue(path, "expected whole number, got fractional float");
            return std::nullopt;
        }
        mismatch(path, "integer", *v);
        return std::nullopt;
    }

    const Value* map_at(const Value& map, const Value& key, const std::string& path, bool required) {
        const Value* v = nullptr;
        if (const int64_t* i = key.as_integer()) {
            v = lookup(map, *i, path, required);
        } else if (const std::string* s = key.as_text()) {
            v = lookup(map, *s, path, required);
        }
        if (!v) return nullptr;
        if (!v->is_map()) {
            mismatch(path, "map", *v);
            return nullptr;
        }
        return v;
    }

    Identity identity(const Value& dcc, const std::string& base) {
        Identity id;
        id.date_of_birth = text(dcc, std::string("dob"), base + ".dob");

        const Value* nam = map_at(dcc, Value::text("nam"), base + ".nam", true);
        if (!nam) return id;
        std::string p = base + ".nam";
        id.surname = text(*nam, std::string("fn"), p + ".fn");
        id.forename = text(*nam, std::string("gn"), p + ".gn");
        id.surname_transliterated = text(*nam, std::string("fnt"), p + ".fnt");
        id.forename_transliterated = text(*nam, std::string("gnt"), p + ".gnt");
        return id;
    }

    VaccinationEvent vaccination(const Value& entry, const std::string& p) {
        VaccinationEvent v;
        v.target_disease = text(entry, std::string("tg"), p + ".tg");
        v.prophylaxis = text(entry, std::string("vp"), p + ".vp");
        v.product = text(entry, std::string("mp"), p + ".mp");
        v.manufacturer = text(entry, std::string("ma"), p + ".ma");
        v.dose_number = count(entry, "dn", p + ".dn");
        v.total_doses = count(entry, "sd", p + ".sd");
        v.date = text(entry, std::string("dt"), p + ".dt");
        v.country = text(entry, std::string("co"), p + ".co");
        v.issuer = text(entry, std::string("is"), p + ".is");
        v.certificate_id = text(entry, std::string("ci"), p + ".ci");
        return v;
    }

    TestEvent test(const Value& entry, const std::string& p) {
        TestEvent t;
        t.target_disease = text(entry, std::string("tg"), p + ".tg");
        t.test_type = text(entry, std::string("tt"), p + ".tt");
        // Name for NAAT, device identifier for rapid antigen tests
        t.test_name = text(entry, std::string("nm"), p + ".nm", false);
        t.test_device = text(entry, std::string("ma"), p + ".ma", false);
        t.sample_collected = text(entry, std::string("sc"), p + ".sc");
        t.result = text(entry, std::string("tr"), p + ".tr");
        t.testing_centre = text(entry, std::string("tc"), p + ".tc");
        t.country = text(entry, std::string("co"), p + ".co");
        t.issuer = text(entry, std::string("is"), p + ".is");
        t.certificate_id = text(entry, std::string("ci"), p + ".ci");
        return t;
    }

    RecoveryEvent recovery(const Value& entry, const std::string& p) {
        RecoveryEvent r;
        r.target_disease = text(entry, std::string("tg"), p + ".tg");
        r.first_positive = text(entry, std::string("fr"), p + ".fr");
        r.country = text(entry, std::string("co"), p + ".co");
        r.issuer = text(entry, std::string("is"), p + ".is");
        r.valid_from = text(entry, std::string("df"), p + ".df");
        r.valid_until = text(entry, std::string("du"), p + ".du");
        r.certificate_id = text(entry, std::string("ci"), p + ".ci");
        return r;
    }

    // Event arrays are optional individually; each array element must be a map
    template<typename Event, typename Fn>
    std::vector<Event> events(const Value& dcc, const char* key, const std::string& base, Fn fn) {
        std::vector<Event> out;
        std::string path = base + "." + key;
        const Value* arr = dcc.find(std::string(key));
        if (!arr) return out;
        if (!arr->is_array()) {
            mismatch(path, "array", *arr);
            return out;
        }
        size_t index = 0;
        for (const auto& entry : *arr->as_array()) {
            std::string p = path + "." + std::to_string(index++);
            if (!entry.is_map()) {
                mismatch(p, "map", entry);
                continue;
            }
            out.push_back(fn(entry, p));
        }
        return out;
    }

private:
    std::vector<SchemaIssue> issues_;
};

} // namespace

CertificateRecord map_certificate(const Value& payload) {
    CertificateRecord record;
    Mapper m;

    if (!payload.is_map()) {
        m.mismatch("payload", "map", payload);
        record.issues = m.take_issues();
        return record;
    }

    record.issuer = m.text(payload, CWT_CLAIM_ISSUER, std::to_string(CWT_CLAIM_ISSUER));
    record.issued_at = m.epoch(payload, CWT_CLAIM_ISSUED_AT, std::to_string(CWT_CLAIM_ISSUED_AT));
    record.expires_at = m.epoch(payload, CWT_CLAIM_EXPIRES_AT, std::to_string(CWT_CLAIM_EXPIRES_AT));

    std::string hcert_path = std::to_string(CWT_CLAIM_HCERT);
    const Value* hcert = m.map_at(payload, Value::integer(CWT_CLAIM_HCERT), hcert_path, true);
    if (hcert) {
        std::string dcc_path = hcert_path + "." + std::to_string(HCERT_EU_DCC_V1);
        const Value* dcc = m.map_at(*hcert, Value::integer(HCERT_EU_DCC_V1), dcc_path, true);
        if (dcc) {
            record.schema_version = m.text(*dcc, std::string("ver"), dcc_path + ".ver");
            record.identity = m.identity(*dcc, dcc_path);
            record.vaccinations = m.events<VaccinationEvent>(
                *dcc, "v", dcc_path, [&m](const Value& e, const std::string& p) { return m.vaccination(e, p); });
            record.tests = m.events<TestEvent>(
                *dcc, "t", dcc_path, [&m](const Value& e, const std::string& p) { return m.test(e, p); });
            record.recoveries = m.events<RecoveryEvent>(
                *dcc, "r", dcc_path, [&m](const Value& e, const std::string& p) { return m.recovery(e, p); });

            if (record.vaccinations.empty() && record.tests.empty() && record.recoveries.empty()) {
                m.issue(dcc_path, "no vaccination, test or recovery entries");
            }
        }
    }

    record.issues = m.take_issues();
    if (!record.issues.empty()) {
        spdlog::debug("certificate mapped with {} schema issues", record.issues.size());
    }
    return record;
}

} // namespace hcert
