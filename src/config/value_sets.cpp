#include "hcert/value_sets.hpp"
#include "hcert/file_io.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace hcert {

namespace {

constexpr ValueSetKind ALL_KINDS[] = {
    ValueSetKind::Manufacturer,
    ValueSetKind::Product,
    ValueSetKind::Prophylaxis,
    ValueSetKind::Disease,
    ValueSetKind::TestType,
    ValueSetKind::TestResult,
};

std::optional<ValueSetKind> kind_from_key(const std::string& key) {
    for (ValueSetKind kind : ALL_KINDS) {
        if (key == value_set_key(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

struct BuiltinEntry {
    ValueSetKind kind;
    const char* code;
    const char* name;
};

const BuiltinEntry BUILTIN_ENTRIES[] = {
    // Marketing authorisation holders
    {ValueSetKind::Manufacturer, "Bharat-Biotech", "Bharat Biotech"},
    {ValueSetKind::Manufacturer, "Gamaleya-Research-Institute", "Gamaleya Research Institute"},
    {ValueSetKind::Manufacturer, "ORG-100001417", "Janssen-Cilag International"},
    {ValueSetKind::Manufacturer, "ORG-100001699", "AstraZeneca AB"},
    {ValueSetKind::Manufacturer, "ORG-100006270", "Curevac AG"},
    {ValueSetKind::Manufacturer, "ORG-100010771",
     "Sinopharm Weiqida Europe Pharmaceutical s.r.o. - Prague location"},
    {ValueSetKind::Manufacturer, "ORG-100013793", "CanSino Biologics"},
    {ValueSetKind::Manufacturer, "ORG-100020693",
     "China Sinopharm International Corp. - Beijing location"},
    {ValueSetKind::Manufacturer, "ORG-100024420",
     "Sinopharm Zhijun (Shenzhen) Pharmaceutical Co. Ltd. - Shenzhen location"},
    {ValueSetKind::Manufacturer, "ORG-100030215", "Biontech Manufacturing GmbH"},
    {ValueSetKind::Manufacturer, "ORG-100031184", "Moderna Biotech Spain S.L."},
    {ValueSetKind::Manufacturer, "ORG-100032020", "Novavax CZ AS"},
    {ValueSetKind::Manufacturer, "Sinovac-Biotech", "Sinovac Biotech"},
    {ValueSetKind::Manufacturer, "Vector-Institute", "Vector Institute"},

    // Medicinal products
    {ValueSetKind::Product, "BBIBP-CorV", "BBIBP-CorV"},
    {ValueSetKind::Product, "CVnCoV", "CVnCoV"},
    {ValueSetKind::Product, "Convidecia", "Convidecia"},
    {ValueSetKind::Product, "CoronaVac", "CoronaVac"},
    {ValueSetKind::Product, "Covaxin", "Covaxin (also known as BBV152 A, B, C)"},
    {ValueSetKind::Product, "EU/1/20/1507", "COVID-19 Vaccine Moderna"},
    {ValueSetKind::Product, "EU/1/20/1525", "COVID-19 Vaccine Janssen"},
    {ValueSetKind::Product, "EU/1/20/1528", "Comirnaty"},
    {ValueSetKind::Product, "EU/1/21/1529", "Vaxzevria"},
    {ValueSetKind::Product, "EpiVacCorona", "EpiVacCorona"},
    {ValueSetKind::Product, "Inactivated-SARS-CoV-2-Vero-Cell", "Inactivated SARS-CoV-2 (Vero Cell)"},
    {ValueSetKind::Product, "Sputnik-V", "Sputnik-V"},

    // Vaccine or prophylaxis
    {ValueSetKind::Prophylaxis, "1119349007", "SARS-CoV-2 mRNA vaccine"},
    {ValueSetKind::Prophylaxis, "1119305005", "SARS-CoV-2 antigen vaccine"},
    {ValueSetKind::Prophylaxis, "J07BX03", "covid-19 vaccines"},

    // Disease or agent targeted
    {ValueSetKind::Disease, "840539006", "COVID-19"},

    // Test type and result
    {ValueSetKind::TestType, "LP6464-4", "Nucleic acid amplification with probe detection"},
    {ValueSetKind::TestType, "LP217198-3", "Rapid immunoassay"},
    {ValueSetKind::TestResult, "260415000", "Not detected"},
    {ValueSetKind::TestResult, "260373001", "Detected"},
};

} // namespace

const char* value_set_key(ValueSetKind kind) {
    switch (kind) {
        case ValueSetKind::Manufacturer: return "ma";
        case ValueSetKind::Product: return "mp";
        case ValueSetKind::Prophylaxis: return "vp";
        case ValueSetKind::Disease: return "tg";
        case ValueSetKind::TestType: return "tt";
        case ValueSetKind::TestResult: return "tr";
        default: return "unknown";
    }
}

const std::map<std::string, std::string>& ValueSets::table(ValueSetKind kind) const {
    switch (kind) {
        case ValueSetKind::Manufacturer: return manufacturers_;
        case ValueSetKind::Product: return products_;
        case ValueSetKind::Prophylaxis: return prophylaxis_;
        case ValueSetKind::Disease: return diseases_;
        case ValueSetKind::TestType: return test_types_;
        case ValueSetKind::TestResult: return test_results_;
    }
    return manufacturers_;
}

std::map<std::string, std::string>& ValueSets::table(ValueSetKind kind) {
    return const_cast<std::map<std::string, std::string>&>(
        static_cast<const ValueSets*>(this)->table(kind));
}

std::string ValueSets::display(ValueSetKind kind, const std::string& code) const {
    const auto& t = table(kind);
    auto it = t.find(code);
    return it == t.end() ? code : it->second;
}

bool ValueSets::contains(ValueSetKind kind, const std::string& code) const {
    return table(kind).count(code) != 0;
}

ValueSets ValueSets::with_entry(ValueSetKind kind, const std::string& code,
                                const std::string& name) const {
    ValueSets copy = *this;
    copy.table(kind)[code] = name;
    return copy;
}

size_t ValueSets::size(ValueSetKind kind) const {
    return table(kind).size();
}

ValueSets builtin_value_sets() {
    ValueSets sets;
    for (const auto& entry : BUILTIN_ENTRIES) {
        sets = sets.with_entry(entry.kind, entry.code, entry.name);
    }
    return sets;
}

ValueSetsParseResult parse_value_sets(const std::string& json_str, const ValueSets& base) {
    ValueSetsParseResult result;
    result.value_sets = base;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        for (auto it = j.begin(); it != j.end(); ++it) {
            auto kind = kind_from_key(it.key());
            if (!kind) {
                result.warnings.push_back("unknown value set: " + it.key());
                continue;
            }
            if (!it.value().is_object()) {
                result.warnings.push_back("value set " + it.key() + " is not an object");
                continue;
            }
            for (auto entry = it.value().begin(); entry != it.value().end(); ++entry) {
                if (!entry.value().is_string()) {
                    result.warnings.push_back("value set " + it.key() + ": entry " + entry.key() +
                                              " is not a string");
                    continue;
                }
                result.value_sets = result.value_sets.with_entry(
                    *kind, entry.key(), entry.value().get<std::string>());
            }
        }

        result.ok = true;
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }

    return result;
}

Result<ValueSets> load_value_sets(const std::string& path, const ValueSets& base) {
    auto content = fs::read_file(path);
    if (!content) {
        return Result<ValueSets>::err(
            make_error(ErrorCode::CONFIG_ERROR, "cannot read value sets: " + path));
    }

    auto parsed = parse_value_sets(*content, base);
    if (!parsed.ok) {
        return Result<ValueSets>::err(make_error(ErrorCode::CONFIG_ERROR, path + ": " + parsed.error));
    }
    for (const auto& warning : parsed.warnings) {
        spdlog::warn("{}: {}", path, warning);
    }
    return Result<ValueSets>::ok(std::move(parsed.value_sets));
}

} // namespace hcert
