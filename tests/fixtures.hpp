#pragma once

// Builders for synthetic HC1 tokens shared by the unit and integration tests.

#include <hcert/base45.hpp>
#include <hcert/cbor.hpp>
#include <hcert/certificate.hpp>
#include <hcert/compression.hpp>

#include <string>
#include <utility>
#include <vector>

namespace hcert::test {

// Map with text keys, in the given order
inline Value text_map(std::vector<std::pair<std::string, Value>> entries) {
    Value::Map m;
    for (auto& e : entries) {
        m.push_back(MapEntry{Value::text(e.first), std::move(e.second)});
    }
    return Value::map(std::move(m));
}

// Map with integer keys, in the given order
inline Value int_map(std::vector<std::pair<int64_t, Value>> entries) {
    Value::Map m;
    for (auto& e : entries) {
        m.push_back(MapEntry{Value::integer(e.first), std::move(e.second)});
    }
    return Value::map(std::move(m));
}

inline Value vaccination_entry() {
    return text_map({
        {"dn", Value::integer(1)},
        {"ma", Value::text("ORG-100030215")},
        {"vp", Value::text("1119349007")},
        {"dt", Value::text("2021-05-06")},
        {"co", Value::text("IE")},
        {"ci", Value::text("URN:UVCI:01:IE:52d0dc929c884cf8998a7987f0b9d863#2")},
        {"mp", Value::text("EU/1/20/1528")},
        {"is", Value::text("HSE")},
        {"sd", Value::integer(2)},
        {"tg", Value::text("840539006")},
    });
}

inline Value name_entry() {
    return text_map({
        {"fnt", Value::text("BLOGGS")},
        {"fn", Value::text("Bloggs")},
        {"gnt", Value::text("JANE")},
        {"gn", Value::text("Jane")},
    });
}

// EU DCC v1 map with a single event array under event_key
inline Value dcc(const std::string& event_key, Value event) {
    Value::Array events;
    events.push_back(std::move(event));
    return text_map({
        {event_key, Value::array(std::move(events))},
        {"nam", name_entry()},
        {"ver", Value::text("1.0.4")},
        {"dob", Value::text("1988-06-07")},
    });
}

// CWT claims shaped like the Irish sample certificate
inline Value claims(Value dcc_map) {
    return int_map({
        {CWT_CLAIM_EXPIRES_AT, Value::integer(1623661200)},
        {CWT_CLAIM_ISSUED_AT, Value::integer(1623051988)},
        {CWT_CLAIM_ISSUER, Value::text("IE")},
        {CWT_CLAIM_HCERT, int_map({{HCERT_EU_DCC_V1, std::move(dcc_map)}})},
    });
}

inline Value vaccination_claims() {
    return claims(dcc("v", vaccination_entry()));
}

inline Bytes protected_header(int64_t alg, const Bytes& kid) {
    return encode_cbor(int_map({
        {4, Value::bytes(kid)},
        {1, Value::integer(alg)},
    }));
}

// COSE_Sign1 array, optionally wrapped in tag 18
inline Bytes envelope(const Bytes& protected_bytes, const Bytes& payload, const Bytes& signature,
                      bool tagged = true) {
    Value::Array items;
    items.push_back(Value::bytes(protected_bytes));
    items.push_back(Value::map({}));
    items.push_back(Value::bytes(payload));
    items.push_back(Value::bytes(signature));
    Value arr = Value::array(std::move(items));
    return encode_cbor(tagged ? Value::tagged(CBOR_TAG_COSE_SIGN1, std::move(arr)) : arr);
}

// "HC1:" + base45(zlib(envelope)), compression optional
inline std::string token(const Bytes& envelope_bytes, bool compress = true) {
    Bytes body = envelope_bytes;
    if (compress) {
        body = zlib_deflate(envelope_bytes).value();
    }
    return "HC1:" + base45_encode(body);
}

inline std::string vaccination_token() {
    Bytes payload = encode_cbor(vaccination_claims());
    Bytes kid = {0x06, 0x51, 0x78, 0xb6, 0xcf, 0x28, 0x35, 0xc8};
    return token(envelope(protected_header(-7, kid), payload, Bytes(64, 0xAB)));
}

} // namespace hcert::test
