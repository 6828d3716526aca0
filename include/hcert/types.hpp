#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hcert {

using Bytes = std::vector<uint8_t>;

// ============================================================================
// Timestamp
// ============================================================================

// Absolute instant in UTC, whole seconds since the Unix epoch.
struct Timestamp {
    int64_t epoch_seconds = 0;

    bool operator==(const Timestamp& other) const { return epoch_seconds == other.epoch_seconds; }
    bool operator!=(const Timestamp& other) const { return !(*this == other); }
    bool operator<(const Timestamp& other) const { return epoch_seconds < other.epoch_seconds; }
};

// "2021-06-07T07:46:28Z"
std::string format_rfc3339(const Timestamp& ts);

// "Mon, 07 Jun 2021 07:46:28 +0000"
std::string format_rfc2822(const Timestamp& ts);

// Parse an RFC 3339 date-time ("2021-06-07T07:46:28Z", "...+02:00",
// fractional seconds truncated). Returns std::nullopt when malformed.
std::optional<Timestamp> parse_rfc3339(const std::string& text);

// Hex helpers for key identifiers and diagnostics
std::string bytes_to_hex(const Bytes& data);

std::string base64_encode(const Bytes& data);
std::optional<Bytes> base64_decode(const std::string& text);

} // namespace hcert
