#pragma once

#include "hcert/cbor_value.hpp"
#include "hcert/result.hpp"
#include "hcert/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace hcert {

// ============================================================================
// CBOR Decoding (RFC 8949)
// ============================================================================

// Nesting limit for arrays, maps and tags. Deeper input is rejected
// rather than recursed into.
constexpr size_t MAX_CBOR_DEPTH = 64;

enum CborMajorType : uint8_t {
    CBOR_UNSIGNED = 0,
    CBOR_NEGATIVE = 1,
    CBOR_BYTES = 2,
    CBOR_TEXT = 3,
    CBOR_ARRAY = 4,
    CBOR_MAP = 5,
    CBOR_TAG = 6,
    CBOR_SIMPLE = 7,
};

constexpr uint64_t CBOR_TAG_DATE_TIME = 0;
constexpr uint64_t CBOR_TAG_EPOCH = 1;
constexpr uint64_t CBOR_TAG_COSE_SIGN1 = 18;

struct CborItem {
    Value value;
    size_t consumed = 0;  // bytes read starting at the requested offset
};

// Decode exactly one item starting at offset. Trailing bytes are left
// alone; consumed reports where the item ended.
Result<CborItem> decode_cbor_item(const Bytes& data, size_t offset = 0);

// Decode a buffer that must hold exactly one item.
Result<Value> decode_cbor(const Bytes& data);

struct ContainerHeader {
    bool indefinite = false;
    uint64_t count = 0;  // elements (arrays) or pairs (maps) when definite
};

/**
 * @brief Item-by-item reader over a CBOR buffer
 *
 * Lets callers walk a container whose elements have lengths that are not
 * known up front, e.g. the four members of a COSE_Sign1 array.
 *
 * @example
 * ```cpp
 * CborReader reader(bytes);
 * auto header = reader.read_array_header();
 * for (uint64_t i = 0; header.isOk() && i < header.value().count; ++i) {
 *     auto element = reader.read_value();
 * }
 * ```
 */
class CborReader {
public:
    explicit CborReader(const Bytes& data) : data_(data) {}

    size_t offset() const { return offset_; }
    bool at_end() const { return offset_ >= data_.size(); }

    // Major type of the next item without consuming it
    std::optional<uint8_t> peek_major_type() const;

    // True when the next byte is a break (0xFF)
    bool at_break() const;
    Result<void> read_break();

    Result<uint64_t> read_tag();
    Result<ContainerHeader> read_array_header();
    Result<ContainerHeader> read_map_header();

    // Decode one complete item
    Result<Value> read_value();

private:
    const Bytes& data_;
    size_t offset_ = 0;
};

// ============================================================================
// CBOR Encoding
// ============================================================================

// Definite-length encoding with the shortest argument form. Dates encode
// as tag 1 with an integer epoch, floats as double precision.
Bytes encode_cbor(const Value& value);

} // namespace hcert
