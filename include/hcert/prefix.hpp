#pragma once

#include "hcert/result.hpp"

#include <string>

namespace hcert {

// ============================================================================
// Scheme Prefix
// ============================================================================

constexpr const char* HCERT_SCHEME = "HC";
constexpr int HCERT_SUPPORTED_VERSION = 1;

struct PrefixInfo {
    std::string scheme;   // "HC"
    int version = 0;      // context identifier digit, "HC1:" -> 1
    std::string body;     // base45 text after the ':' separator
};

// Validate and strip the "HC1:" context identifier. Surrounding whitespace
// is trimmed first. Fails with FORMAT_ERROR when the marker is absent,
// malformed, or names an unsupported version.
Result<PrefixInfo> strip_prefix(const std::string& raw_token);

} // namespace hcert
