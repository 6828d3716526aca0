#pragma once

/**
 * @file decoder.hpp
 * @brief One-call decode of an HC1 token into a CertificateRecord
 *
 * @example
 * ```cpp
 * #include <hcert/decoder.hpp>
 *
 * auto decoded = hcert::decode_certificate(token);
 * if (decoded.isOk()) {
 *     const auto& record = decoded.value().record;
 *     // record.identity.surname, record.vaccinations, ...
 * }
 * ```
 */

#include "hcert/certificate.hpp"
#include "hcert/compression.hpp"
#include "hcert/cose.hpp"
#include "hcert/prefix.hpp"
#include "hcert/result.hpp"

#include <string>

namespace hcert {

struct DecodeOptions {
    size_t max_inflated_size = DEFAULT_MAX_INFLATED_SIZE;
};

struct DecodedCertificate {
    PrefixInfo prefix;
    bool compressed = false;   // zlib wrapper was present
    Envelope envelope;
    Value payload;             // raw CWT claims tree
    CertificateRecord record;
};

// Run prefix, base45, zlib, COSE and CBOR stages and map the payload.
// Any stage up to the CBOR decode aborts the whole decode with its error
// kind; field mapping degrades per field.
Result<DecodedCertificate> decode_certificate(const std::string& token,
                                              const DecodeOptions& options = {});

// Sample token from the EU DCC test data (Jane Bloggs, Ireland)
extern const char* const SAMPLE_TOKEN;

} // namespace hcert
