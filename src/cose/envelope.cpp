#include "hcert/cose.hpp"
#include "hcert/cbor.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace hcert {

namespace {

constexpr size_t COSE_SIGN1_ELEMENTS = 4;

enum EnvelopeElement : size_t {
    PROTECTED = 0,
    UNPROTECTED = 1,
    PAYLOAD = 2,
    SIGNATURE = 3,
};

Error envelope_error(const std::string& message) {
    return make_error(ErrorCode::ENVELOPE_ERROR, message);
}

const char* element_name(size_t index) {
    switch (index) {
        case PROTECTED: return "protected header";
        case UNPROTECTED: return "unprotected header";
        case PAYLOAD: return "payload";
        case SIGNATURE: return "signature";
        default: return "element";
    }
}

Error wrong_type(size_t index, const char* expected, const Value& got) {
    return envelope_error(std::string(element_name(index)) + " must be a " + expected + ", got " +
                          kind_to_string(got.kind()));
}

Result<ProtectedHeader> parse_protected_header(const Bytes& protected_bytes) {
    ProtectedHeader header;
    if (protected_bytes.empty()) {
        // Zero-length protected header stands for an empty map
        header.map = Value::map({});
        return Result<ProtectedHeader>::ok(std::move(header));
    }

    auto decoded = decode_cbor(protected_bytes);
    if (decoded.isErr()) {
        return Result<ProtectedHeader>::err(decoded.error().withContext("protected header"));
    }
    if (!decoded.value().is_map()) {
        return Result<ProtectedHeader>::err(envelope_error(
            std::string("protected header must encode a map, got ") +
            kind_to_string(decoded.value().kind())));
    }
    header.map = std::move(decoded.value());

    if (const Value* alg = header.map.find(COSE_HEADER_ALG)) {
        if (const int64_t* id = alg->as_integer()) {
            header.algorithm_id = *id;
        }
    }
    if (const Value* kid = header.map.find(COSE_HEADER_KID)) {
        if (const Bytes* b = kid->as_bytes()) {
            header.key_id = *b;
        }
    }
    return Result<ProtectedHeader>::ok(std::move(header));
}

} // namespace

CoseAlgorithm cose_algorithm_from_id(int64_t id) {
    switch (id) {
        case -7: return CoseAlgorithm::ES256;
        case -35: return CoseAlgorithm::ES384;
        case -36: return CoseAlgorithm::ES512;
        case -37: return CoseAlgorithm::PS256;
        case -8: return CoseAlgorithm::EdDSA;
        default: return CoseAlgorithm::Unknown;
    }
}

const char* cose_algorithm_to_string(CoseAlgorithm alg) {
    switch (alg) {
        case CoseAlgorithm::ES256: return "ES256";
        case CoseAlgorithm::ES384: return "ES384";
        case CoseAlgorithm::ES512: return "ES512";
        case CoseAlgorithm::PS256: return "PS256";
        case CoseAlgorithm::EdDSA: return "EdDSA";
        default: return "unknown";
    }
}

std::optional<Bytes> Envelope::key_id() const {
    if (protected_header.key_id) {
        return protected_header.key_id;
    }
    if (const Value* kid = unprotected_header.find(COSE_HEADER_KID)) {
        if (const Bytes* b = kid->as_bytes()) {
            return *b;
        }
    }
    return std::nullopt;
}

Result<Envelope> parse_envelope(const Bytes& data) {
    Envelope envelope;
    CborReader reader(data);

    if (reader.peek_major_type() == std::optional<uint8_t>(CBOR_TAG)) {
        auto tag = reader.read_tag();
        if (tag.isErr()) return Result<Envelope>::err(tag.error());
        if (tag.value() != CBOR_TAG_COSE_SIGN1) {
            return Result<Envelope>::err(envelope_error(
                "unexpected tag " + std::to_string(tag.value()) + ", expected 18 (COSE_Sign1)"));
        }
        envelope.tagged = true;
    }

    if (reader.peek_major_type() != std::optional<uint8_t>(CBOR_ARRAY)) {
        return Result<Envelope>::err(envelope_error("envelope is not a CBOR array"));
    }
    auto header = reader.read_array_header();
    if (header.isErr()) return Result<Envelope>::err(header.error());
    if (!header.value().indefinite && header.value().count != COSE_SIGN1_ELEMENTS) {
        return Result<Envelope>::err(envelope_error(
            "envelope has " + std::to_string(header.value().count) + " elements, expected 4"));
    }

    std::vector<Value> elements;
    elements.reserve(COSE_SIGN1_ELEMENTS);
    while (elements.size() < COSE_SIGN1_ELEMENTS) {
        if (header.value().indefinite && reader.at_break()) {
            break;
        }
        auto element = reader.read_value();
        if (element.isErr()) {
            return Result<Envelope>::err(
                element.error().withContext(element_name(elements.size())));
        }
        elements.push_back(std::move(element.value()));
    }
    if (header.value().indefinite) {
        if (!reader.at_break()) {
            return Result<Envelope>::err(envelope_error("envelope has more than 4 elements"));
        }
        auto brk = reader.read_break();
        if (brk.isErr()) return Result<Envelope>::err(brk.error());
    }
    if (elements.size() != COSE_SIGN1_ELEMENTS) {
        return Result<Envelope>::err(envelope_error(
            "envelope has " + std::to_string(elements.size()) + " elements, expected 4"));
    }
    if (!reader.at_end()) {
        return Result<Envelope>::err(envelope_error(
            std::to_string(data.size() - reader.offset()) + " trailing bytes after envelope"));
    }

    const Bytes* protected_bytes = elements[PROTECTED].as_bytes();
    if (!protected_bytes) {
        return Result<Envelope>::err(wrong_type(PROTECTED, "byte string", elements[PROTECTED]));
    }
    if (!elements[UNPROTECTED].is_map()) {
        return Result<Envelope>::err(wrong_type(UNPROTECTED, "map", elements[UNPROTECTED]));
    }
    if (elements[PAYLOAD].is_null()) {
        return Result<Envelope>::err(envelope_error("detached payload is not supported"));
    }
    const Bytes* payload = elements[PAYLOAD].as_bytes();
    if (!payload) {
        return Result<Envelope>::err(wrong_type(PAYLOAD, "byte string", elements[PAYLOAD]));
    }
    const Bytes* signature = elements[SIGNATURE].as_bytes();
    if (!signature) {
        return Result<Envelope>::err(wrong_type(SIGNATURE, "byte string", elements[SIGNATURE]));
    }

    auto protected_header = parse_protected_header(*protected_bytes);
    if (protected_header.isErr()) {
        return Result<Envelope>::err(protected_header.error());
    }

    envelope.protected_bytes = *protected_bytes;
    envelope.protected_header = std::move(protected_header.value());
    envelope.unprotected_header = std::move(elements[UNPROTECTED]);
    envelope.payload = *payload;
    envelope.signature = *signature;

    auto kid = envelope.key_id();
    spdlog::debug("COSE_Sign1: alg={} kid={} payload={} bytes signature={} bytes",
                  cose_algorithm_to_string(envelope.protected_header.algorithm()),
                  kid ? bytes_to_hex(*kid) : std::string("<none>"),
                  envelope.payload.size(), envelope.signature.size());

    return Result<Envelope>::ok(std::move(envelope));
}

Bytes build_sig_structure(const Bytes& protected_bytes, const Bytes& payload) {
    Value::Array items;
    items.push_back(Value::text("Signature1"));
    items.push_back(Value::bytes(protected_bytes));
    items.push_back(Value::bytes({}));  // external_aad
    items.push_back(Value::bytes(payload));
    return encode_cbor(Value::array(std::move(items)));
}

} // namespace hcert
