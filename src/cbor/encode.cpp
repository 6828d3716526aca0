#include "hcert/cbor.hpp"

#include <cstring>

namespace hcert {

namespace {

void write_head(Bytes& out, uint8_t major, uint64_t argument) {
    uint8_t mt = static_cast<uint8_t>(major << 5);
    if (argument < 24) {
        out.push_back(static_cast<uint8_t>(mt | argument));
    } else if (argument <= 0xFF) {
        out.push_back(mt | 24);
        out.push_back(static_cast<uint8_t>(argument));
    } else if (argument <= 0xFFFF) {
        out.push_back(mt | 25);
        out.push_back(static_cast<uint8_t>(argument >> 8));
        out.push_back(static_cast<uint8_t>(argument));
    } else if (argument <= 0xFFFFFFFFull) {
        out.push_back(mt | 26);
        for (int shift = 24; shift >= 0; shift -= 8) {
            out.push_back(static_cast<uint8_t>(argument >> shift));
        }
    } else {
        out.push_back(mt | 27);
        for (int shift = 56; shift >= 0; shift -= 8) {
            out.push_back(static_cast<uint8_t>(argument >> shift));
        }
    }
}

void write_integer(Bytes& out, int64_t v) {
    if (v >= 0) {
        write_head(out, CBOR_UNSIGNED, static_cast<uint64_t>(v));
    } else {
        // -1 - v without overflow for INT64_MIN
        write_head(out, CBOR_NEGATIVE, static_cast<uint64_t>(-(v + 1)));
    }
}

void write_value(Bytes& out, const Value& v) {
    switch (v.kind()) {
        case Value::Kind::Integer:
            write_integer(out, *v.as_integer());
            break;
        case Value::Kind::ByteString: {
            const Bytes& b = *v.as_bytes();
            write_head(out, CBOR_BYTES, b.size());
            out.insert(out.end(), b.begin(), b.end());
            break;
        }
        case Value::Kind::Text: {
            const std::string& s = *v.as_text();
            write_head(out, CBOR_TEXT, s.size());
            out.insert(out.end(), s.begin(), s.end());
            break;
        }
        case Value::Kind::Array:
            write_head(out, CBOR_ARRAY, v.as_array()->size());
            for (const auto& item : *v.as_array()) {
                write_value(out, item);
            }
            break;
        case Value::Kind::Map:
            write_head(out, CBOR_MAP, v.as_map()->size());
            for (const auto& entry : *v.as_map()) {
                write_value(out, entry.key);
                write_value(out, entry.value);
            }
            break;
        case Value::Kind::Tagged: {
            const Tagged* t = v.as_tagged();
            write_head(out, CBOR_TAG, t->tag);
            if (t->value) {
                write_value(out, *t->value);
            } else {
                out.push_back(0xF6); // null
            }
            break;
        }
        case Value::Kind::Date:
            write_head(out, CBOR_TAG, CBOR_TAG_EPOCH);
            write_integer(out, v.as_date()->epoch_seconds);
            break;
        case Value::Kind::Bool:
            out.push_back(*v.as_bool() ? 0xF5 : 0xF4);
            break;
        case Value::Kind::Null:
            out.push_back(0xF6);
            break;
        case Value::Kind::Undefined:
            out.push_back(0xF7);
            break;
        case Value::Kind::Simple: {
            uint8_t sv = v.as_simple()->value;
            if (sv < 24) {
                out.push_back(static_cast<uint8_t>(0xE0 | sv));
            } else {
                out.push_back(0xF8);
                out.push_back(sv);
            }
            break;
        }
        case Value::Kind::Float: {
            double d = *v.as_float();
            uint64_t bits;
            std::memcpy(&bits, &d, sizeof(bits));
            out.push_back(0xFB);
            for (int shift = 56; shift >= 0; shift -= 8) {
                out.push_back(static_cast<uint8_t>(bits >> shift));
            }
            break;
        }
    }
}

} // namespace

Bytes encode_cbor(const Value& value) {
    Bytes out;
    write_value(out, value);
    return out;
}

} // namespace hcert
