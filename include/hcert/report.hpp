#pragma once

#include "hcert/certificate.hpp"
#include "hcert/value_sets.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace hcert {

// Human-readable report:
//   # Identity Info
//   SURNAME(S):     Bloggs
//   ...
//   Doses (rcvd/rqrd):      1/2
// Absent fields print as "<missing>".
std::string render_text(const CertificateRecord& record, const ValueSets& value_sets);

// Same data as JSON; codes are kept alongside their display names.
nlohmann::json to_json(const CertificateRecord& record, const ValueSets& value_sets);

} // namespace hcert
