#include "hcert/signature.hpp"
#include "hcert/cbor.hpp"
#include "hcert/file_io.hpp"

#include <algorithm>
#include <memory>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/ecdsa.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include <spdlog/spdlog.h>

namespace hcert {

// ============================================================================
// OpenSSL handles
// ============================================================================

struct PublicKey::Impl {
    explicit Impl(EVP_PKEY* k) : pkey(k) {}
    ~Impl() { EVP_PKEY_free(pkey); }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    EVP_PKEY* pkey;
};

namespace {

using bio_ptr = std::unique_ptr<BIO, decltype(&BIO_free)>;
using x509_ptr = std::unique_ptr<X509, decltype(&X509_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string openssl_error() {
    unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

bool looks_like_pem(const Bytes& data) {
    static const std::string marker = "-----BEGIN";
    return std::search(data.begin(), data.end(), marker.begin(), marker.end()) != data.end();
}

EVP_PKEY* pkey_from_pem(const Bytes& data) {
    bio_ptr bio{BIO_new_mem_buf(data.data(), static_cast<int>(data.size())), BIO_free};
    if (!bio) return nullptr;
    if (EVP_PKEY* pkey = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr)) {
        return pkey;
    }
    ERR_clear_error();

    bio_ptr cert_bio{BIO_new_mem_buf(data.data(), static_cast<int>(data.size())), BIO_free};
    if (!cert_bio) return nullptr;
    x509_ptr cert{PEM_read_bio_X509(cert_bio.get(), nullptr, nullptr, nullptr), X509_free};
    if (!cert) return nullptr;
    return X509_get_pubkey(cert.get());
}

EVP_PKEY* pkey_from_der(const Bytes& data) {
    const unsigned char* p = data.data();
    if (EVP_PKEY* pkey = d2i_PUBKEY(nullptr, &p, static_cast<long>(data.size()))) {
        return pkey;
    }
    ERR_clear_error();

    p = data.data();
    x509_ptr cert{d2i_X509(nullptr, &p, static_cast<long>(data.size())), X509_free};
    if (!cert) return nullptr;
    return X509_get_pubkey(cert.get());
}

// COSE carries ECDSA signatures as fixed-width r || s; OpenSSL wants DER
std::optional<Bytes> raw_ecdsa_to_der(const Bytes& raw) {
    size_t half = raw.size() / 2;
    auto sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
    if (!sig) return std::nullopt;

    auto r = bignum_ptr{BN_bin2bn(raw.data(), static_cast<int>(half), nullptr), BN_free};
    auto s = bignum_ptr{BN_bin2bn(raw.data() + half, static_cast<int>(half), nullptr), BN_free};
    if (!r || !s || ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) {
        return std::nullopt;
    }
    // Ownership moved into sig
    r.release();
    s.release();

    int der_len = i2d_ECDSA_SIG(sig.get(), nullptr);
    if (der_len <= 0) return std::nullopt;
    Bytes der(static_cast<size_t>(der_len));
    unsigned char* der_ptr = der.data();
    i2d_ECDSA_SIG(sig.get(), &der_ptr);
    return der;
}

struct AlgorithmParams {
    const EVP_MD* digest = nullptr;
    int key_type = EVP_PKEY_NONE;
    size_t raw_signature_size = 0;  // 0 when not fixed-width ECDSA
    bool pss = false;
};

std::optional<AlgorithmParams> params_for(CoseAlgorithm alg) {
    AlgorithmParams p;
    switch (alg) {
        case CoseAlgorithm::ES256:
            p.digest = EVP_sha256();
            p.key_type = EVP_PKEY_EC;
            p.raw_signature_size = 64;
            return p;
        case CoseAlgorithm::ES384:
            p.digest = EVP_sha384();
            p.key_type = EVP_PKEY_EC;
            p.raw_signature_size = 96;
            return p;
        case CoseAlgorithm::ES512:
            p.digest = EVP_sha512();
            p.key_type = EVP_PKEY_EC;
            p.raw_signature_size = 132;
            return p;
        case CoseAlgorithm::PS256:
            p.digest = EVP_sha256();
            p.key_type = EVP_PKEY_RSA;
            p.pss = true;
            return p;
        case CoseAlgorithm::EdDSA:
            p.key_type = EVP_PKEY_ED25519;
            return p;
        default:
            return std::nullopt;
    }
}

} // namespace

// ============================================================================
// Keys
// ============================================================================

std::string PublicKey::type() const {
    if (!impl_ || !impl_->pkey) return "unknown";
    switch (EVP_PKEY_get_base_id(impl_->pkey)) {
        case EVP_PKEY_EC: return "EC";
        case EVP_PKEY_RSA: return "RSA";
        case EVP_PKEY_ED25519: return "ED25519";
        default: return "unknown";
    }
}

Result<PublicKey> load_public_key(const Bytes& pem_or_der) {
    if (pem_or_der.empty()) {
        return Result<PublicKey>::err(make_error(ErrorCode::KEY_ERROR, "empty key data"));
    }
    EVP_PKEY* pkey = looks_like_pem(pem_or_der) ? pkey_from_pem(pem_or_der) : pkey_from_der(pem_or_der);
    if (!pkey) {
        return Result<PublicKey>::err(make_error(
            ErrorCode::KEY_ERROR, "no public key or certificate found: " + openssl_error()));
    }
    return Result<PublicKey>::ok(PublicKey(std::make_shared<PublicKey::Impl>(pkey)));
}

Result<PublicKey> load_public_key_file(const std::string& path) {
    auto content = fs::read_binary_file(path);
    if (!content) {
        return Result<PublicKey>::err(make_error(ErrorCode::KEY_ERROR, "cannot read key file: " + path));
    }
    auto key = load_public_key(*content);
    if (key.isErr()) {
        key.error().withContext(path);
    }
    return key;
}

// ============================================================================
// Verification
// ============================================================================

Result<VerificationStatus> verify_signature(const Bytes& protected_bytes,
                                            const Bytes& payload,
                                            const Bytes& signature,
                                            const PublicKey& key) {
    if (!key.impl() || !key.impl()->pkey) {
        return Result<VerificationStatus>::err(make_error(ErrorCode::KEY_ERROR, "empty public key"));
    }
    EVP_PKEY* pkey = key.impl()->pkey;

    CoseAlgorithm alg = CoseAlgorithm::Unknown;
    if (!protected_bytes.empty()) {
        auto header = decode_cbor(protected_bytes);
        if (header.isErr()) {
            return Result<VerificationStatus>::err(header.error().withContext("protected header"));
        }
        if (const Value* id = header.value().find(COSE_HEADER_ALG)) {
            if (const int64_t* v = id->as_integer()) {
                alg = cose_algorithm_from_id(*v);
            }
        }
    }

    auto params = params_for(alg);
    if (!params) {
        return Result<VerificationStatus>::err(
            make_error(ErrorCode::CRYPTO_ERROR, "unsupported or missing signature algorithm"));
    }
    if (EVP_PKEY_get_base_id(pkey) != params->key_type) {
        return Result<VerificationStatus>::err(make_error(
            ErrorCode::KEY_ERROR,
            key.type() + " key cannot check " + cose_algorithm_to_string(alg) + " signatures"));
    }

    Bytes to_verify = signature;
    if (params->raw_signature_size != 0) {
        if (signature.size() != params->raw_signature_size) {
            spdlog::debug("signature is {} bytes, {} expects {}", signature.size(),
                          cose_algorithm_to_string(alg), params->raw_signature_size);
            return Result<VerificationStatus>::ok(VerificationStatus::Unverified);
        }
        auto der = raw_ecdsa_to_der(signature);
        if (!der) {
            return Result<VerificationStatus>::err(
                make_error(ErrorCode::CRYPTO_ERROR, "ECDSA signature conversion failed: " + openssl_error()));
        }
        to_verify = std::move(*der);
    }

    Bytes tbs = build_sig_structure(protected_bytes, payload);

    EvpMdCtx ctx;
    if (!ctx) {
        return Result<VerificationStatus>::err(make_error(ErrorCode::CRYPTO_ERROR, "EVP_MD_CTX_new failed"));
    }

    EVP_PKEY_CTX* pctx = nullptr;
    if (EVP_DigestVerifyInit(ctx.get(), &pctx, params->digest, nullptr, pkey) != 1) {
        return Result<VerificationStatus>::err(
            make_error(ErrorCode::CRYPTO_ERROR, "EVP_DigestVerifyInit failed: " + openssl_error()));
    }
    if (params->pss) {
        if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) != 1 ||
            EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, RSA_PSS_SALTLEN_DIGEST) != 1 ||
            EVP_PKEY_CTX_set_rsa_mgf1_md(pctx, params->digest) != 1) {
            return Result<VerificationStatus>::err(
                make_error(ErrorCode::CRYPTO_ERROR, "RSA-PSS setup failed: " + openssl_error()));
        }
    }

    int rc = EVP_DigestVerify(ctx.get(), to_verify.data(), to_verify.size(), tbs.data(), tbs.size());
    if (rc != 1) {
        // 0 is a clean mismatch, negative values a malformed signature
        ERR_clear_error();
        return Result<VerificationStatus>::ok(VerificationStatus::Unverified);
    }
    return Result<VerificationStatus>::ok(VerificationStatus::Verified);
}

Result<VerificationStatus> verify_envelope(const Envelope& envelope, const PublicKey& key) {
    return verify_signature(envelope.protected_bytes, envelope.payload, envelope.signature, key);
}

Result<Bytes> compute_key_id(const Bytes& certificate_der) {
    const unsigned char* p = certificate_der.data();
    x509_ptr cert{d2i_X509(nullptr, &p, static_cast<long>(certificate_der.size())), X509_free};
    if (!cert) {
        return Result<Bytes>::err(
            make_error(ErrorCode::KEY_ERROR, "not a DER certificate: " + openssl_error()));
    }

    EvpMdCtx ctx;
    if (!ctx) {
        return Result<Bytes>::err(make_error(ErrorCode::CRYPTO_ERROR, "EVP_MD_CTX_new failed"));
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return Result<Bytes>::err(make_error(ErrorCode::CRYPTO_ERROR, "EVP_DigestInit_ex failed"));
    }
    if (EVP_DigestUpdate(ctx.get(), certificate_der.data(), certificate_der.size()) != 1) {
        return Result<Bytes>::err(make_error(ErrorCode::CRYPTO_ERROR, "EVP_DigestUpdate failed"));
    }
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        return Result<Bytes>::err(make_error(ErrorCode::CRYPTO_ERROR, "EVP_DigestFinal_ex failed"));
    }
    return Result<Bytes>::ok(Bytes(hash, hash + 8));
}

} // namespace hcert
