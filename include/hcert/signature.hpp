#pragma once

#include "hcert/cose.hpp"
#include "hcert/result.hpp"
#include "hcert/types.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace hcert {

// ============================================================================
// Signature Verification (optional capability)
// ============================================================================

// Opaque public key handle (wraps an OpenSSL EVP_PKEY)
class PublicKey {
public:
    struct Impl;

    explicit PublicKey(std::shared_ptr<Impl> impl) : impl_(std::move(impl)) {}

    // "EC", "RSA", "ED25519" or "unknown"
    std::string type() const;
    Impl* impl() const { return impl_.get(); }

private:
    std::shared_ptr<Impl> impl_;
};

// Load a key from PEM or DER; accepts SubjectPublicKeyInfo and X.509
// certificates. KEY_ERROR when nothing usable is found.
Result<PublicKey> load_public_key(const Bytes& pem_or_der);
Result<PublicKey> load_public_key_file(const std::string& path);

enum class VerificationStatus {
    Verified,
    Unverified,
};

inline const char* verification_status_to_string(VerificationStatus s) {
    return s == VerificationStatus::Verified ? "verified" : "unverified";
}

// Check a COSE_Sign1 signature. Unverified means the signature does not
// match; errors mean the check could not be performed (CRYPTO_ERROR for an
// unsupported algorithm or OpenSSL failure, KEY_ERROR for a key that does
// not fit the algorithm).
Result<VerificationStatus> verify_signature(const Bytes& protected_bytes,
                                            const Bytes& payload,
                                            const Bytes& signature,
                                            const PublicKey& key);

// Same, reading the algorithm from the parsed envelope
Result<VerificationStatus> verify_envelope(const Envelope& envelope, const PublicKey& key);

// DCC key identifier: first 8 bytes of SHA-256 over the DER certificate
Result<Bytes> compute_key_id(const Bytes& certificate_der);

/**
 * @brief Local set of signer keys indexed by kid
 *
 * Loaded from JSON:
 * {"keys": [{"kid": "BlF4ts8oNcg=", "key": "-----BEGIN PUBLIC KEY-----..."}]}
 */
class KeyRing {
public:
    void add(const Bytes& kid, PublicKey key);
    const PublicKey* find(const Bytes& kid) const;
    size_t size() const { return keys_.size(); }

private:
    std::map<Bytes, PublicKey> keys_;
};

Result<KeyRing> parse_key_ring(const std::string& json_str);
Result<KeyRing> load_key_ring(const std::string& path);

} // namespace hcert
