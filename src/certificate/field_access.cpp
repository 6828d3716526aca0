#include "hcert/certificate.hpp"

#include <cctype>

namespace hcert {

namespace {

using Field = std::optional<std::string>;

Field count_field(const std::optional<int64_t>& v) {
    if (!v) return std::nullopt;
    return std::to_string(*v);
}

Field time_field(const std::optional<Timestamp>& ts) {
    if (!ts) return std::nullopt;
    return format_rfc3339(*ts);
}

Field vaccination_field(const VaccinationEvent& v, const std::string& key) {
    if (key == "tg") return v.target_disease;
    if (key == "vp") return v.prophylaxis;
    if (key == "mp") return v.product;
    if (key == "ma") return v.manufacturer;
    if (key == "dn") return count_field(v.dose_number);
    if (key == "sd") return count_field(v.total_doses);
    if (key == "dt") return v.date;
    if (key == "co") return v.country;
    if (key == "is") return v.issuer;
    if (key == "ci") return v.certificate_id;
    return std::nullopt;
}

Field test_field(const TestEvent& t, const std::string& key) {
    if (key == "tg") return t.target_disease;
    if (key == "tt") return t.test_type;
    if (key == "nm") return t.test_name;
    if (key == "ma") return t.test_device;
    if (key == "sc") return t.sample_collected;
    if (key == "tr") return t.result;
    if (key == "tc") return t.testing_centre;
    if (key == "co") return t.country;
    if (key == "is") return t.issuer;
    if (key == "ci") return t.certificate_id;
    return std::nullopt;
}

Field recovery_field(const RecoveryEvent& r, const std::string& key) {
    if (key == "tg") return r.target_disease;
    if (key == "fr") return r.first_positive;
    if (key == "co") return r.country;
    if (key == "is") return r.issuer;
    if (key == "df") return r.valid_from;
    if (key == "du") return r.valid_until;
    if (key == "ci") return r.certificate_id;
    return std::nullopt;
}

// "v.0.dn" -> ("v", 0, "dn")
bool split_event_path(const std::string& name, std::string& group, size_t& index, std::string& key) {
    size_t first = name.find('.');
    if (first == std::string::npos) return false;
    size_t second = name.find('.', first + 1);
    if (second == std::string::npos) return false;

    std::string digits = name.substr(first + 1, second - first - 1);
    if (digits.empty() || digits.size() > 9) return false;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }

    group = name.substr(0, first);
    index = static_cast<size_t>(std::stoul(digits));
    key = name.substr(second + 1);
    return true;
}

template<typename Event, typename Fn>
Field event_field(const std::vector<Event>& events, size_t index, const std::string& key, Fn fn) {
    if (index >= events.size()) return std::nullopt;
    return fn(events[index], key);
}

} // namespace

std::optional<std::string> get_field(const CertificateRecord& record, const std::string& name) {
    if (name == "iss") return record.issuer;
    if (name == "iat") return time_field(record.issued_at);
    if (name == "exp") return time_field(record.expires_at);
    if (name == "ver") return record.schema_version;
    if (name == "dob") return record.identity.date_of_birth;
    if (name == "nam.fn") return record.identity.surname;
    if (name == "nam.gn") return record.identity.forename;
    if (name == "nam.fnt") return record.identity.surname_transliterated;
    if (name == "nam.gnt") return record.identity.forename_transliterated;

    std::string group;
    size_t index = 0;
    std::string key;
    if (!split_event_path(name, group, index, key)) {
        return std::nullopt;
    }
    if (group == "v") return event_field(record.vaccinations, index, key, vaccination_field);
    if (group == "t") return event_field(record.tests, index, key, test_field);
    if (group == "r") return event_field(record.recoveries, index, key, recovery_field);
    return std::nullopt;
}

} // namespace hcert
