#include "hcert/cbor_value.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace hcert {

// ============================================================================
// Construction
// ============================================================================

Value::Value() : data_(Null{}) {}

Value::Value(Storage data) : data_(std::move(data)) {}

Value Value::integer(int64_t v) {
    return Value(Storage(std::in_place_index<0>, v));
}

Value Value::bytes(Bytes b) {
    return Value(Storage(std::in_place_index<1>, std::move(b)));
}

Value Value::text(std::string s) {
    return Value(Storage(std::in_place_index<2>, std::move(s)));
}

Value Value::array(Array items) {
    return Value(Storage(std::in_place_index<3>, std::move(items)));
}

Value Value::map(Map entries) {
    return Value(Storage(std::in_place_index<4>, std::move(entries)));
}

Value Value::tagged(uint64_t tag, Value inner) {
    Tagged t;
    t.tag = tag;
    t.value = std::make_shared<const Value>(std::move(inner));
    return Value(Storage(std::in_place_index<5>, std::move(t)));
}

Value Value::date(Timestamp ts) {
    return Value(Storage(std::in_place_index<6>, ts));
}

Value Value::boolean(bool b) {
    return Value(Storage(std::in_place_index<7>, b));
}

Value Value::null() {
    return Value(Storage(std::in_place_index<8>, Null{}));
}

Value Value::undefined() {
    return Value(Storage(std::in_place_index<9>, Undefined{}));
}

Value Value::simple(uint8_t v) {
    return Value(Storage(std::in_place_index<10>, SimpleValue{v}));
}

Value Value::floating(double d) {
    return Value(Storage(std::in_place_index<11>, d));
}

// ============================================================================
// Lookup
// ============================================================================

const Value* Value::find(int64_t key) const {
    const Map* entries = as_map();
    if (!entries) return nullptr;
    for (const auto& entry : *entries) {
        const int64_t* k = entry.key.as_integer();
        if (k && *k == key) {
            return &entry.value;
        }
    }
    return nullptr;
}

const Value* Value::find(const std::string& key) const {
    const Map* entries = as_map();
    if (!entries) return nullptr;
    for (const auto& entry : *entries) {
        const std::string* k = entry.key.as_text();
        if (k && *k == key) {
            return &entry.value;
        }
    }
    return nullptr;
}

size_t Value::size() const {
    if (const Array* items = as_array()) return items->size();
    if (const Map* entries = as_map()) return entries->size();
    return 0;
}

// ============================================================================
// Equality
// ============================================================================

bool operator==(const Value& a, const Value& b) {
    return a.data_ == b.data_;
}

bool operator==(const MapEntry& a, const MapEntry& b) {
    return a.key == b.key && a.value == b.value;
}

bool operator==(const Tagged& a, const Tagged& b) {
    if (a.tag != b.tag) return false;
    if (!a.value || !b.value) return a.value == b.value;
    return *a.value == *b.value;
}

const char* kind_to_string(Value::Kind kind) {
    switch (kind) {
        case Value::Kind::Integer: return "integer";
        case Value::Kind::ByteString: return "byte string";
        case Value::Kind::Text: return "text";
        case Value::Kind::Array: return "array";
        case Value::Kind::Map: return "map";
        case Value::Kind::Tagged: return "tagged value";
        case Value::Kind::Date: return "date";
        case Value::Kind::Bool: return "bool";
        case Value::Kind::Null: return "null";
        case Value::Kind::Undefined: return "undefined";
        case Value::Kind::Simple: return "simple value";
        case Value::Kind::Float: return "float";
        default: return "unknown";
    }
}

// ============================================================================
// Diagnostic Notation
// ============================================================================

namespace {

void write_text(std::ostringstream& out, const std::string& s) {
    out << '"';
    for (char c : s) {
        auto u = static_cast<unsigned char>(c);
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (u < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", u);
                    out << buf;
                } else {
                    out << c;
                }
        }
    }
    out << '"';
}

void write_float(std::ostringstream& out, double d) {
    if (std::isnan(d)) {
        out << "NaN";
    } else if (std::isinf(d)) {
        out << (d > 0 ? "Infinity" : "-Infinity");
    } else {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.17g", d);
        std::string s = buf;
        if (s.find_first_of(".eE") == std::string::npos) {
            s += ".0";
        }
        out << s;
    }
}

void write_value(std::ostringstream& out, const Value& v) {
    switch (v.kind()) {
        case Value::Kind::Integer:
            out << *v.as_integer();
            break;
        case Value::Kind::ByteString:
            out << "h'" << bytes_to_hex(*v.as_bytes()) << "'";
            break;
        case Value::Kind::Text:
            write_text(out, *v.as_text());
            break;
        case Value::Kind::Array: {
            out << '[';
            bool first = true;
            for (const auto& item : *v.as_array()) {
                if (!first) out << ", ";
                first = false;
                write_value(out, item);
            }
            out << ']';
            break;
        }
        case Value::Kind::Map: {
            out << '{';
            bool first = true;
            for (const auto& entry : *v.as_map()) {
                if (!first) out << ", ";
                first = false;
                write_value(out, entry.key);
                out << ": ";
                write_value(out, entry.value);
            }
            out << '}';
            break;
        }
        case Value::Kind::Tagged: {
            const Tagged* t = v.as_tagged();
            out << t->tag << '(';
            if (t->value) write_value(out, *t->value);
            out << ')';
            break;
        }
        case Value::Kind::Date:
            out << "1(" << v.as_date()->epoch_seconds << ")";
            break;
        case Value::Kind::Bool:
            out << (*v.as_bool() ? "true" : "false");
            break;
        case Value::Kind::Null:
            out << "null";
            break;
        case Value::Kind::Undefined:
            out << "undefined";
            break;
        case Value::Kind::Simple:
            out << "simple(" << static_cast<int>(v.as_simple()->value) << ")";
            break;
        case Value::Kind::Float:
            write_float(out, *v.as_float());
            break;
    }
}

} // namespace

std::string to_diagnostic(const Value& value) {
    std::ostringstream out;
    write_value(out, value);
    return out.str();
}

} // namespace hcert
