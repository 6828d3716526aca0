#pragma once

#include "hcert/result.hpp"

#include <map>
#include <string>
#include <vector>

namespace hcert {

// ============================================================================
// Value Sets (code -> display name)
// ============================================================================

enum class ValueSetKind {
    Manufacturer,   // ma
    Product,        // mp
    Prophylaxis,    // vp
    Disease,        // tg
    TestType,       // tt
    TestResult,     // tr
};

// JSON section name for a kind ("ma", "mp", "vp", "tg", "tt", "tr")
const char* value_set_key(ValueSetKind kind);

/**
 * @brief Immutable lookup tables for the opaque codes in a certificate
 *
 * Built once and passed explicitly to whoever renders a record. Safe to
 * share across threads after construction.
 */
class ValueSets {
public:
    ValueSets() = default;

    // Display name for code, or the code itself when unknown
    std::string display(ValueSetKind kind, const std::string& code) const;

    // True when the table for kind has an entry for code
    bool contains(ValueSetKind kind, const std::string& code) const;

    // Copy with entries added or replaced
    ValueSets with_entry(ValueSetKind kind, const std::string& code, const std::string& name) const;

    size_t size(ValueSetKind kind) const;

private:
    const std::map<std::string, std::string>& table(ValueSetKind kind) const;
    std::map<std::string, std::string>& table(ValueSetKind kind);

    std::map<std::string, std::string> manufacturers_;
    std::map<std::string, std::string> products_;
    std::map<std::string, std::string> prophylaxis_;
    std::map<std::string, std::string> diseases_;
    std::map<std::string, std::string> test_types_;
    std::map<std::string, std::string> test_results_;
};

// Tables shipped with hcert
ValueSets builtin_value_sets();

struct ValueSetsParseResult {
    bool ok = false;
    std::string error;
    ValueSets value_sets;
    std::vector<std::string> warnings;
};

// Parse a JSON override file on top of base:
// {"ma": {"ORG-100030215": "Biontech Manufacturing GmbH"}, "mp": {...}}
// Unknown sections and non-string entries are skipped with a warning.
ValueSetsParseResult parse_value_sets(const std::string& json_str, const ValueSets& base);

// Read and parse a value-set file, CONFIG_ERROR when unreadable or invalid
Result<ValueSets> load_value_sets(const std::string& path, const ValueSets& base);

} // namespace hcert
