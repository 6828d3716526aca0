#pragma once

#include "hcert/cbor_value.hpp"
#include "hcert/result.hpp"
#include "hcert/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace hcert {

// ============================================================================
// COSE_Sign1 Envelope (RFC 9052)
// ============================================================================

constexpr int64_t COSE_HEADER_ALG = 1;
constexpr int64_t COSE_HEADER_KID = 4;

enum class CoseAlgorithm {
    Unknown,
    ES256,   // -7
    ES384,   // -35
    ES512,   // -36
    PS256,   // -37
    EdDSA,   // -8
};

CoseAlgorithm cose_algorithm_from_id(int64_t id);
const char* cose_algorithm_to_string(CoseAlgorithm alg);

struct ProtectedHeader {
    std::optional<int64_t> algorithm_id;
    std::optional<Bytes> key_id;
    Value map;  // full decoded header map (empty map for a zero-length header)

    CoseAlgorithm algorithm() const {
        return algorithm_id ? cose_algorithm_from_id(*algorithm_id) : CoseAlgorithm::Unknown;
    }
};

struct Envelope {
    Bytes protected_bytes;            // serialized protected header, signed as-is
    ProtectedHeader protected_header;
    Value unprotected_header;         // map, possibly empty
    Bytes payload;                    // CBOR-encoded CWT claims
    Bytes signature;
    bool tagged = false;              // wrapped in tag 18

    // kid from the protected header, falling back to the unprotected one
    std::optional<Bytes> key_id() const;
};

// Parse a COSE_Sign1 structure. Fails with ENVELOPE_ERROR on a wrong
// element count or element type; CBOR malformation surfaces as DECODE_ERROR.
Result<Envelope> parse_envelope(const Bytes& data);

// Sig_structure for a Signature1 context: ["Signature1", protected, h'', payload]
Bytes build_sig_structure(const Bytes& protected_bytes, const Bytes& payload);

} // namespace hcert
