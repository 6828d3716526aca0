#pragma once

#include "hcert/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hcert {

// ============================================================================
// CBOR Value Tree
// ============================================================================

class Value;
struct MapEntry;

struct Null {
    bool operator==(const Null&) const { return true; }
};

struct Undefined {
    bool operator==(const Undefined&) const { return true; }
};

// Simple values other than false/true/null/undefined (major type 7)
struct SimpleValue {
    uint8_t value = 0;
    bool operator==(const SimpleValue& other) const { return value == other.value; }
};

// Any tag other than 0/1 (those become dates). The wrapped value is
// immutable and may be shared between copies of the tree.
struct Tagged {
    uint64_t tag = 0;
    std::shared_ptr<const Value> value;
};

/**
 * @brief One node of a decoded CBOR item
 *
 * Accessors never coerce: as_integer() on a Float returns nullptr. Callers
 * check the variant explicitly and decide what a mismatch means.
 */
class Value {
public:
    enum class Kind {
        Integer,
        ByteString,
        Text,
        Array,
        Map,
        Tagged,
        Date,
        Bool,
        Null,
        Undefined,
        Simple,
        Float,
    };

    using Array = std::vector<Value>;
    using Map = std::vector<MapEntry>;

    Value();

    static Value integer(int64_t v);
    static Value bytes(Bytes b);
    static Value text(std::string s);
    static Value array(Array items);
    static Value map(Map entries);
    static Value tagged(uint64_t tag, Value inner);
    static Value date(Timestamp ts);
    static Value boolean(bool b);
    static Value null();
    static Value undefined();
    static Value simple(uint8_t v);
    static Value floating(double d);

    Kind kind() const { return static_cast<Kind>(data_.index()); }

    bool is_integer() const { return kind() == Kind::Integer; }
    bool is_bytes() const { return kind() == Kind::ByteString; }
    bool is_text() const { return kind() == Kind::Text; }
    bool is_array() const { return kind() == Kind::Array; }
    bool is_map() const { return kind() == Kind::Map; }
    bool is_tagged() const { return kind() == Kind::Tagged; }
    bool is_date() const { return kind() == Kind::Date; }
    bool is_bool() const { return kind() == Kind::Bool; }
    bool is_null() const { return kind() == Kind::Null; }
    bool is_float() const { return kind() == Kind::Float; }

    // Checked accessors, nullptr when the node holds another variant
    const int64_t* as_integer() const { return std::get_if<int64_t>(&data_); }
    const Bytes* as_bytes() const { return std::get_if<Bytes>(&data_); }
    const std::string* as_text() const { return std::get_if<std::string>(&data_); }
    const Array* as_array() const { return std::get_if<Array>(&data_); }
    const Map* as_map() const { return std::get_if<Map>(&data_); }
    const Tagged* as_tagged() const { return std::get_if<Tagged>(&data_); }
    const Timestamp* as_date() const { return std::get_if<Timestamp>(&data_); }
    const bool* as_bool() const { return std::get_if<bool>(&data_); }
    const SimpleValue* as_simple() const { return std::get_if<SimpleValue>(&data_); }
    const double* as_float() const { return std::get_if<double>(&data_); }

    // Map lookup by integer or text key, first matching entry wins.
    // Returns nullptr when this is not a map or the key is absent.
    const Value* find(int64_t key) const;
    const Value* find(const std::string& key) const;

    // Element or pair count for arrays and maps, 0 otherwise
    size_t size() const;

    friend bool operator==(const Value& a, const Value& b);
    friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }

private:
    // Alternative order must match Kind
    using Storage = std::variant<int64_t, Bytes, std::string, Array, Map, Tagged, Timestamp,
                                 bool, Null, Undefined, SimpleValue, double>;

    explicit Value(Storage data);

    Storage data_;
};

struct MapEntry {
    Value key;
    Value value;
};

bool operator==(const MapEntry& a, const MapEntry& b);
bool operator==(const Tagged& a, const Tagged& b);

const char* kind_to_string(Value::Kind kind);

// RFC 8949 diagnostic notation, e.g. {1: "IE", 4: 1623661200}
std::string to_diagnostic(const Value& value);

} // namespace hcert
