#include "hcert/cbor.hpp"

#include <cmath>
#include <cstring>
#include <limits>
#include <string>

namespace hcert {

namespace {

constexpr uint8_t ADDITIONAL_ONE_BYTE = 24;
constexpr uint8_t ADDITIONAL_TWO_BYTES = 25;
constexpr uint8_t ADDITIONAL_FOUR_BYTES = 26;
constexpr uint8_t ADDITIONAL_EIGHT_BYTES = 27;
constexpr uint8_t ADDITIONAL_INDEFINITE = 31;
constexpr uint8_t BREAK_BYTE = 0xFF;

constexpr uint8_t SIMPLE_FALSE = 20;
constexpr uint8_t SIMPLE_TRUE = 21;
constexpr uint8_t SIMPLE_NULL = 22;
constexpr uint8_t SIMPLE_UNDEFINED = 23;

struct Head {
    uint8_t major = 0;
    uint8_t additional = 0;
    uint64_t argument = 0;   // value, length or count when definite
    bool indefinite = false;
    size_t offset = 0;       // where the header byte was read
};

Error decode_error(const std::string& message, size_t offset) {
    return make_error(ErrorCode::DECODE_ERROR, message + " at offset " + std::to_string(offset));
}

uint64_t read_be(const Bytes& data, size_t pos, size_t n) {
    uint64_t v = 0;
    for (size_t i = 0; i < n; ++i) {
        v = (v << 8) | data[pos + i];
    }
    return v;
}

double half_to_double(uint16_t half) {
    int exponent = (half >> 10) & 0x1F;
    int mantissa = half & 0x3FF;
    double value;
    if (exponent == 0) {
        value = std::ldexp(static_cast<double>(mantissa), -24);
    } else if (exponent != 31) {
        value = std::ldexp(static_cast<double>(mantissa + 1024), exponent - 25);
    } else {
        value = mantissa == 0 ? std::numeric_limits<double>::infinity()
                              : std::numeric_limits<double>::quiet_NaN();
    }
    return (half & 0x8000) ? -value : value;
}

// Well-formed UTF-8 per RFC 3629 (no overlongs, no surrogates)
bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        size_t len;
        uint32_t cp;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > s.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
            return false;
        }
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

/**
 * Recursive-descent decoder over a byte buffer. Depth is bounded by
 * MAX_CBOR_DEPTH; every declared length is checked against the remaining
 * input before anything is allocated.
 */
class Decoder {
public:
    Decoder(const Bytes& data, size_t offset) : data_(data), pos_(offset) {}

    size_t position() const { return pos_; }

    Result<Head> read_head() {
        Head h;
        h.offset = pos_;
        if (pos_ >= data_.size()) {
            return Result<Head>::err(decode_error("unexpected end of input", pos_));
        }
        uint8_t initial = data_[pos_++];
        h.major = initial >> 5;
        h.additional = initial & 0x1F;

        if (h.additional < ADDITIONAL_ONE_BYTE) {
            h.argument = h.additional;
        } else if (h.additional <= ADDITIONAL_EIGHT_BYTES) {
            size_t n = size_t{1} << (h.additional - ADDITIONAL_ONE_BYTE);
            if (data_.size() - pos_ < n) {
                return Result<Head>::err(decode_error("truncated header argument", h.offset));
            }
            h.argument = read_be(data_, pos_, n);
            pos_ += n;
        } else if (h.additional == ADDITIONAL_INDEFINITE) {
            if (h.major == CBOR_UNSIGNED || h.major == CBOR_NEGATIVE || h.major == CBOR_TAG) {
                return Result<Head>::err(
                    decode_error("indefinite length not allowed for major type " +
                                     std::to_string(h.major), h.offset));
            }
            h.indefinite = true;
        } else {
            return Result<Head>::err(decode_error(
                "reserved additional info " + std::to_string(h.additional), h.offset));
        }
        return Result<Head>::ok(h);
    }

    bool at_break() const {
        return pos_ < data_.size() && data_[pos_] == BREAK_BYTE;
    }

    Result<Value> read_value(size_t depth) {
        if (depth > MAX_CBOR_DEPTH) {
            return Result<Value>::err(decode_error(
                "nesting deeper than " + std::to_string(MAX_CBOR_DEPTH) + " levels", pos_));
        }

        auto head = read_head();
        if (head.isErr()) {
            return Result<Value>::err(head.error());
        }
        const Head& h = head.value();

        switch (h.major) {
            case CBOR_UNSIGNED:
                if (h.argument > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                    return Result<Value>::err(decode_error("unsigned integer out of range", h.offset));
                }
                return Result<Value>::ok(Value::integer(static_cast<int64_t>(h.argument)));

            case CBOR_NEGATIVE:
                if (h.argument > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                    return Result<Value>::err(decode_error("negative integer out of range", h.offset));
                }
                // -(argument + 1), computed without overflow
                return Result<Value>::ok(Value::integer(-1 - static_cast<int64_t>(h.argument)));

            case CBOR_BYTES: {
                auto bytes = read_string_body(h);
                if (bytes.isErr()) return Result<Value>::err(bytes.error());
                return Result<Value>::ok(Value::bytes(std::move(bytes.value())));
            }

            case CBOR_TEXT: {
                auto bytes = read_string_body(h);
                if (bytes.isErr()) return Result<Value>::err(bytes.error());
                std::string text(bytes.value().begin(), bytes.value().end());
                if (!is_valid_utf8(text)) {
                    return Result<Value>::err(decode_error("text string is not valid UTF-8", h.offset));
                }
                return Result<Value>::ok(Value::text(std::move(text)));
            }

            case CBOR_ARRAY:
                return read_array(h, depth);

            case CBOR_MAP:
                return read_map(h, depth);

            case CBOR_TAG:
                return read_tagged(h, depth);

            case CBOR_SIMPLE:
                return read_simple(h);

            default:
                return Result<Value>::err(decode_error("unknown major type", h.offset));
        }
    }

private:
    Result<Bytes> read_definite_chunk(uint64_t length, size_t header_offset) {
        if (length > data_.size() - pos_) {
            return Result<Bytes>::err(decode_error(
                "declared length " + std::to_string(length) + " exceeds remaining " +
                    std::to_string(data_.size() - pos_) + " bytes",
                header_offset));
        }
        Bytes out(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + length));
        pos_ += static_cast<size_t>(length);
        return Result<Bytes>::ok(std::move(out));
    }

    // Definite string, or indefinite: definite chunks of the same major
    // type until a break
    Result<Bytes> read_string_body(const Head& h) {
        if (!h.indefinite) {
            return read_definite_chunk(h.argument, h.offset);
        }
        Bytes out;
        while (true) {
            if (pos_ >= data_.size()) {
                return Result<Bytes>::err(decode_error("unterminated indefinite string", h.offset));
            }
            if (at_break()) {
                ++pos_;
                return Result<Bytes>::ok(std::move(out));
            }
            auto chunk_head = read_head();
            if (chunk_head.isErr()) return Result<Bytes>::err(chunk_head.error());
            const Head& ch = chunk_head.value();
            if (ch.major != h.major || ch.indefinite) {
                return Result<Bytes>::err(
                    decode_error("invalid chunk in indefinite string", ch.offset));
            }
            auto chunk = read_definite_chunk(ch.argument, ch.offset);
            if (chunk.isErr()) return chunk;
            // Each text chunk must be well-formed UTF-8 on its own
            if (h.major == CBOR_TEXT &&
                !is_valid_utf8(std::string(chunk.value().begin(), chunk.value().end()))) {
                return Result<Bytes>::err(
                    decode_error("text string chunk is not valid UTF-8", ch.offset));
            }
            out.insert(out.end(), chunk.value().begin(), chunk.value().end());
        }
    }

    Result<Value> read_array(const Head& h, size_t depth) {
        Value::Array items;
        if (h.indefinite) {
            while (true) {
                if (pos_ >= data_.size()) {
                    return Result<Value>::err(decode_error("unterminated indefinite array", h.offset));
                }
                if (at_break()) {
                    ++pos_;
                    break;
                }
                auto item = read_value(depth + 1);
                if (item.isErr()) return item;
                items.push_back(std::move(item.value()));
            }
            return Result<Value>::ok(Value::array(std::move(items)));
        }

        // Every element takes at least one byte
        if (h.argument > data_.size() - pos_) {
            return Result<Value>::err(decode_error(
                "array of " + std::to_string(h.argument) + " elements exceeds remaining input",
                h.offset));
        }
        items.reserve(static_cast<size_t>(h.argument));
        for (uint64_t i = 0; i < h.argument; ++i) {
            auto item = read_value(depth + 1);
            if (item.isErr()) return item;
            items.push_back(std::move(item.value()));
        }
        return Result<Value>::ok(Value::array(std::move(items)));
    }

    Result<Value> read_map(const Head& h, size_t depth) {
        Value::Map entries;
        if (h.indefinite) {
            while (true) {
                if (pos_ >= data_.size()) {
                    return Result<Value>::err(decode_error("unterminated indefinite map", h.offset));
                }
                if (at_break()) {
                    ++pos_;
                    break;
                }
                auto entry = read_entry(depth);
                if (entry.isErr()) return Result<Value>::err(entry.error());
                entries.push_back(std::move(entry.value()));
            }
            return Result<Value>::ok(Value::map(std::move(entries)));
        }

        // Every pair takes at least two bytes
        if (h.argument > (data_.size() - pos_) / 2) {
            return Result<Value>::err(decode_error(
                "map of " + std::to_string(h.argument) + " pairs exceeds remaining input",
                h.offset));
        }
        entries.reserve(static_cast<size_t>(h.argument));
        for (uint64_t i = 0; i < h.argument; ++i) {
            auto entry = read_entry(depth);
            if (entry.isErr()) return Result<Value>::err(entry.error());
            entries.push_back(std::move(entry.value()));
        }
        return Result<Value>::ok(Value::map(std::move(entries)));
    }

    Result<MapEntry> read_entry(size_t depth) {
        auto key = read_value(depth + 1);
        if (key.isErr()) return Result<MapEntry>::err(key.error());
        if (pos_ >= data_.size() || at_break()) {
            return Result<MapEntry>::err(decode_error("map key without value", pos_));
        }
        auto value = read_value(depth + 1);
        if (value.isErr()) return Result<MapEntry>::err(value.error());
        return Result<MapEntry>::ok(MapEntry{std::move(key.value()), std::move(value.value())});
    }

    Result<Value> read_tagged(const Head& h, size_t depth) {
        auto inner = read_value(depth + 1);
        if (inner.isErr()) return inner;
        Value& v = inner.value();

        if (h.argument == CBOR_TAG_DATE_TIME) {
            const std::string* text = v.as_text();
            if (!text) {
                return Result<Value>::err(decode_error("tag 0 requires a text string", h.offset));
            }
            auto ts = parse_rfc3339(*text);
            if (!ts) {
                return Result<Value>::err(decode_error("tag 0 holds malformed date-time '" + *text + "'", h.offset));
            }
            return Result<Value>::ok(Value::date(*ts));
        }

        if (h.argument == CBOR_TAG_EPOCH) {
            if (const int64_t* secs = v.as_integer()) {
                return Result<Value>::ok(Value::date(Timestamp{*secs}));
            }
            if (const double* secs = v.as_float()) {
                if (!std::isfinite(*secs) || std::fabs(*secs) > 9.2e18) {
                    return Result<Value>::err(decode_error("tag 1 epoch out of range", h.offset));
                }
                return Result<Value>::ok(Value::date(Timestamp{static_cast<int64_t>(std::floor(*secs))}));
            }
            return Result<Value>::err(decode_error("tag 1 requires a numeric epoch", h.offset));
        }

        return Result<Value>::ok(Value::tagged(h.argument, std::move(v)));
    }

    Result<Value> read_simple(const Head& h) {
        if (h.indefinite) {
            // A break byte reached where an item was expected
            return Result<Value>::err(decode_error("unexpected break", h.offset));
        }
        switch (h.additional) {
            case SIMPLE_FALSE: return Result<Value>::ok(Value::boolean(false));
            case SIMPLE_TRUE: return Result<Value>::ok(Value::boolean(true));
            case SIMPLE_NULL: return Result<Value>::ok(Value::null());
            case SIMPLE_UNDEFINED: return Result<Value>::ok(Value::undefined());
            case ADDITIONAL_ONE_BYTE:
                if (h.argument < 32) {
                    return Result<Value>::err(decode_error("invalid two-byte simple value", h.offset));
                }
                return Result<Value>::ok(Value::simple(static_cast<uint8_t>(h.argument)));
            case ADDITIONAL_TWO_BYTES:
                return Result<Value>::ok(Value::floating(half_to_double(static_cast<uint16_t>(h.argument))));
            case ADDITIONAL_FOUR_BYTES: {
                uint32_t bits = static_cast<uint32_t>(h.argument);
                float f;
                std::memcpy(&f, &bits, sizeof(f));
                return Result<Value>::ok(Value::floating(static_cast<double>(f)));
            }
            case ADDITIONAL_EIGHT_BYTES: {
                uint64_t bits = h.argument;
                double d;
                std::memcpy(&d, &bits, sizeof(d));
                return Result<Value>::ok(Value::floating(d));
            }
            default:
                return Result<Value>::ok(Value::simple(h.additional));
        }
    }

    const Bytes& data_;
    size_t pos_;
};

} // namespace

Result<CborItem> decode_cbor_item(const Bytes& data, size_t offset) {
    if (offset > data.size()) {
        return Result<CborItem>::err(decode_error("offset past end of input", offset));
    }
    Decoder decoder(data, offset);
    auto value = decoder.read_value(0);
    if (value.isErr()) {
        return Result<CborItem>::err(value.error());
    }
    CborItem item;
    item.value = std::move(value.value());
    item.consumed = decoder.position() - offset;
    return Result<CborItem>::ok(std::move(item));
}

Result<Value> decode_cbor(const Bytes& data) {
    auto item = decode_cbor_item(data, 0);
    if (item.isErr()) {
        return Result<Value>::err(item.error());
    }
    if (item.value().consumed != data.size()) {
        return Result<Value>::err(decode_error(
            std::to_string(data.size() - item.value().consumed) + " trailing bytes after item",
            item.value().consumed));
    }
    return Result<Value>::ok(std::move(item.value().value));
}

// ============================================================================
// CborReader
// ============================================================================

std::optional<uint8_t> CborReader::peek_major_type() const {
    if (at_end()) return std::nullopt;
    return static_cast<uint8_t>(data_[offset_] >> 5);
}

bool CborReader::at_break() const {
    return !at_end() && data_[offset_] == BREAK_BYTE;
}

Result<void> CborReader::read_break() {
    if (!at_break()) {
        return Result<void>::err(decode_error("expected break", offset_));
    }
    ++offset_;
    return Result<void>::ok();
}

Result<uint64_t> CborReader::read_tag() {
    Decoder decoder(data_, offset_);
    auto head = decoder.read_head();
    if (head.isErr()) return Result<uint64_t>::err(head.error());
    if (head.value().major != CBOR_TAG) {
        return Result<uint64_t>::err(decode_error("expected tag", offset_));
    }
    offset_ = decoder.position();
    return Result<uint64_t>::ok(head.value().argument);
}

namespace {

Result<ContainerHeader> read_container(const Bytes& data, size_t& offset, uint8_t major,
                                       const char* what) {
    Decoder decoder(data, offset);
    auto head = decoder.read_head();
    if (head.isErr()) return Result<ContainerHeader>::err(head.error());
    if (head.value().major != major) {
        return Result<ContainerHeader>::err(decode_error(std::string("expected ") + what, offset));
    }
    offset = decoder.position();
    ContainerHeader header;
    header.indefinite = head.value().indefinite;
    header.count = head.value().argument;
    return Result<ContainerHeader>::ok(header);
}

} // namespace

Result<ContainerHeader> CborReader::read_array_header() {
    return read_container(data_, offset_, CBOR_ARRAY, "array");
}

Result<ContainerHeader> CborReader::read_map_header() {
    return read_container(data_, offset_, CBOR_MAP, "map");
}

Result<Value> CborReader::read_value() {
    auto item = decode_cbor_item(data_, offset_);
    if (item.isErr()) return Result<Value>::err(item.error());
    offset_ += item.value().consumed;
    return Result<Value>::ok(std::move(item.value().value));
}

} // namespace hcert
