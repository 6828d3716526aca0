#pragma once

#include "hcert/cbor_value.hpp"
#include "hcert/result.hpp"
#include "hcert/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hcert {

// ============================================================================
// Certificate Record (EU DCC schema 1.x)
// ============================================================================

// CWT claim keys
constexpr int64_t CWT_CLAIM_ISSUER = 1;
constexpr int64_t CWT_CLAIM_EXPIRES_AT = 4;
constexpr int64_t CWT_CLAIM_ISSUED_AT = 6;
constexpr int64_t CWT_CLAIM_HCERT = -260;
constexpr int64_t HCERT_EU_DCC_V1 = 1;

struct Identity {
    std::optional<std::string> surname;                  // nam.fn
    std::optional<std::string> forename;                 // nam.gn
    std::optional<std::string> surname_transliterated;   // nam.fnt
    std::optional<std::string> forename_transliterated;  // nam.gnt
    std::optional<std::string> date_of_birth;            // dob
};

struct VaccinationEvent {
    std::optional<std::string> target_disease;   // tg
    std::optional<std::string> prophylaxis;      // vp
    std::optional<std::string> product;          // mp
    std::optional<std::string> manufacturer;     // ma
    std::optional<int64_t> dose_number;          // dn
    std::optional<int64_t> total_doses;          // sd
    std::optional<std::string> date;             // dt
    std::optional<std::string> country;          // co
    std::optional<std::string> issuer;           // is
    std::optional<std::string> certificate_id;   // ci
};

struct TestEvent {
    std::optional<std::string> target_disease;   // tg
    std::optional<std::string> test_type;        // tt
    std::optional<std::string> test_name;        // nm
    std::optional<std::string> test_device;      // ma
    std::optional<std::string> sample_collected; // sc
    std::optional<std::string> result;           // tr
    std::optional<std::string> testing_centre;   // tc
    std::optional<std::string> country;          // co
    std::optional<std::string> issuer;           // is
    std::optional<std::string> certificate_id;   // ci
};

struct RecoveryEvent {
    std::optional<std::string> target_disease;   // tg
    std::optional<std::string> first_positive;   // fr
    std::optional<std::string> country;          // co
    std::optional<std::string> issuer;           // is
    std::optional<std::string> valid_from;       // df
    std::optional<std::string> valid_until;      // du
    std::optional<std::string> certificate_id;   // ci
};

// A missing key or a value of the wrong type. The field it refers to is
// left absent; mapping carries on with the remaining fields.
struct SchemaIssue {
    std::string path;    // e.g. "-260.1.nam.fn"
    std::string reason;  // "missing" or "expected text, got integer"
    ErrorCode code = ErrorCode::SCHEMA_ERROR;
};

struct CertificateRecord {
    std::optional<std::string> issuer;
    std::optional<Timestamp> issued_at;
    std::optional<Timestamp> expires_at;
    std::optional<std::string> schema_version;   // ver
    Identity identity;
    std::vector<VaccinationEvent> vaccinations;
    std::vector<TestEvent> tests;
    std::vector<RecoveryEvent> recoveries;
    std::vector<SchemaIssue> issues;
};

// Map a decoded CWT payload onto the record. Never fails: each absent or
// mistyped field degrades on its own and is listed in record.issues.
CertificateRecord map_certificate(const Value& payload);

// Field access by DCC path: "iss", "iat", "exp", "ver", "dob",
// "nam.fn", "nam.gn", "nam.fnt", "nam.gnt", and "v.<i>.<key>",
// "t.<i>.<key>", "r.<i>.<key>". Timestamps render as RFC 3339, dose
// counts as decimal. Returns std::nullopt for absent fields and unknown names.
std::optional<std::string> get_field(const CertificateRecord& record, const std::string& name);

} // namespace hcert
