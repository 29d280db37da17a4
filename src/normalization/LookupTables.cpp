#include "LookupTables.hpp"
#include "Diagnostics.hpp"
#include "TextUtils.hpp"
#include "../utils/ErrorReporter.hpp"

#include <algorithm>
#include <plog/Log.h>

namespace normalization
{

namespace
{

std::vector<std::string> keys_longest_first(std::vector<std::string> keys)
{
    std::sort(keys.begin(), keys.end(),
              [](const std::string& a, const std::string& b)
              {
                  if (a.size() != b.size())
                      return a.size() > b.size();
                  return a < b;
              });
    return keys;
}

void report_bad_entry(const std::string& table, const std::string& key, const std::string& reason)
{
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                        "Ignored lookup table entry in [normalization.tables." + table + "]",
                                        "'" + key + "': " + reason);
}

std::optional<AbbreviationGate> parse_gate(std::string_view name)
{
    if (name == "always")
        return AbbreviationGate::Always;
    if (name == "before_capital")
        return AbbreviationGate::BeforeCapital;
    if (name == "not_before_capital")
        return AbbreviationGate::NotBeforeCapital;
    return std::nullopt;
}

} // anonymous namespace

std::string default_plural(const std::string& singular)
{
    if (singular.empty())
        return singular;
    if (singular == "foot")
        return "feet";
    if (singular == "hertz" || singular == "yen" || singular == "sen" || singular == "pence")
        return singular;

    auto ends_with = [&](std::string_view suffix)
    {
        return singular.size() >= suffix.size() &&
               singular.compare(singular.size() - suffix.size(), suffix.size(), suffix) == 0;
    };

    if (ends_with("s") || ends_with("x") || ends_with("z") || ends_with("ch") || ends_with("sh"))
        return singular + "es";
    if (singular.size() > 1 && singular.back() == 'y')
    {
        const char before = singular[singular.size() - 2];
        if (std::string_view("aeiou").find(before) == std::string_view::npos)
            return singular.substr(0, singular.size() - 1) + "ies";
    }
    return singular + "s";
}

std::string plural_unit_phrase(const std::string& singular, bool is_rate)
{
    if (is_rate)
    {
        const std::size_t per = singular.find(" per ");
        if (per != std::string::npos)
            return default_plural(singular.substr(0, per)) + singular.substr(per);
    }

    const std::size_t last_space = singular.find_last_of(' ');
    if (last_space == std::string::npos)
        return default_plural(singular);
    return singular.substr(0, last_space + 1) + default_plural(singular.substr(last_space + 1));
}

std::shared_ptr<const LookupTables> LookupTables::defaults()
{
    static const std::shared_ptr<const LookupTables> instance = []
    {
        std::shared_ptr<LookupTables> tables(new LookupTables());
        tables->loadDefaults();
        return std::shared_ptr<const LookupTables>(std::move(tables));
    }();
    return instance;
}

std::shared_ptr<const LookupTables> LookupTables::withOverrides(const toml::table& tables)
{
    std::shared_ptr<LookupTables> result(new LookupTables());
    result->loadDefaults();
    result->applyOverrides(tables);
    return result;
}

void LookupTables::loadDefaults()
{
    struct UnitRow
    {
        const char* key;
        const char* singular;
        const char* plural;
        bool is_rate;
        bool attached_only;
        bool data_unit;
    };

    static constexpr UnitRow kUnits[] = {
        // length
        { "m", "meter", "meters", false, true, false },
        { "cm", "centimeter", "centimeters", false, false, false },
        { "mm", "millimeter", "millimeters", false, false, false },
        { "km", "kilometer", "kilometers", false, false, false },
        { "in", "inch", "inches", false, true, false },
        { "ft", "foot", "feet", false, false, false },
        { "yd", "yard", "yards", false, false, false },
        { "mi", "mile", "miles", false, false, false },
        // mass
        { "g", "gram", "grams", false, true, false },
        { "kg", "kilogram", "kilograms", false, false, false },
        { "mg", "milligram", "milligrams", false, false, false },
        { "lb", "pound", "pounds", false, false, false },
        { "lbs", "pound", "pounds", false, false, false },
        { "oz", "ounce", "ounces", false, false, false },
        // time
        { "s", "second", "seconds", false, true, false },
        { "ms", "millisecond", "milliseconds", false, false, false },
        { "min", "minute", "minutes", false, true, false },
        { "h", "hour", "hours", false, true, false },
        { "hr", "hour", "hours", false, false, false },
        { "hrs", "hour", "hours", false, false, false },
        // volume
        { "l", "liter", "liters", false, true, false },
        { "ml", "milliliter", "milliliters", false, false, false },
        // data, bit/byte resolved per match
        { "kb", "kilobit", "kilobits", false, false, true },
        { "mb", "megabit", "megabits", false, false, true },
        { "gb", "gigabit", "gigabits", false, false, true },
        { "tb", "terabit", "terabits", false, false, true },
        { "pb", "petabit", "petabits", false, false, true },
        { "kbps", "kilobit per second", "kilobits per second", true, false, true },
        { "mbps", "megabit per second", "megabits per second", true, false, true },
        { "gbps", "gigabit per second", "gigabits per second", true, false, true },
        // speed
        { "mph", "mile per hour", "miles per hour", true, false, false },
        { "mi/h", "mile per hour", "miles per hour", true, false, false },
        { "kph", "kilometer per hour", "kilometers per hour", true, false, false },
        { "km/h", "kilometer per hour", "kilometers per hour", true, false, false },
        { "m/s", "meter per second", "meters per second", true, false, false },
        { "ft/s", "foot per second", "feet per second", true, false, false },
        // temperature
        { "°c", "degree Celsius", "degrees Celsius", false, false, false },
        { "°f", "degree Fahrenheit", "degrees Fahrenheit", false, false, false },
        // frequency
        { "hz", "hertz", "hertz", false, false, false },
        { "khz", "kilohertz", "kilohertz", false, false, false },
        { "mhz", "megahertz", "megahertz", false, false, false },
        { "ghz", "gigahertz", "gigahertz", false, false, false },
        { "px", "pixel", "pixels", false, false, false },
    };

    for (const auto& row : kUnits)
        units_[row.key] = UnitEntry{ row.singular, row.plural, row.is_rate, row.attached_only, row.data_unit };

    currencies_["$"] = CurrencyEntry{ "dollar", "dollars", "cent", "cents" };
    currencies_["£"] = CurrencyEntry{ "pound", "pounds", "penny", "pence" };
    currencies_["€"] = CurrencyEntry{ "euro", "euros", "cent", "cents" };
    currencies_["¥"] = CurrencyEntry{ "yen", "yen", "sen", "sen" };

    symbols_ = {
        { "~", " " },        { "@", " at " },    { "#", " number " }, { "$", " dollar " }, { "%", " percent " },
        { "^", " " },        { "&", " and " },   { "*", " " },        { "_", " " },        { "|", " " },
        { "\\", " " },       { "/", " slash " }, { "=", " equals " }, { "+", " plus " },
    };

    cjk_ = {
        { "、", "," }, // ideographic comma
        { "。", "." }, // ideographic full stop
        { "！", "!" }, { "，", "," }, { "：", ":" },
        { "；", ";" }, { "？", "?" },
        { "–", "-" }, // en dash
    };

    abbreviations_ = {
        { "Mrs.", "Mrs", AbbreviationGate::Always, true },
        { "MRS.", "Mrs", AbbreviationGate::BeforeCapital, true },
        { "Mr.", "Mister", AbbreviationGate::Always, true },
        { "MR.", "Mister", AbbreviationGate::BeforeCapital, true },
        { "Ms.", "Miss", AbbreviationGate::Always, true },
        { "MS.", "Miss", AbbreviationGate::BeforeCapital, true },
        { "Dr.", "Doctor", AbbreviationGate::BeforeCapital, true },
        { "DR.", "Doctor", AbbreviationGate::BeforeCapital, true },
        { "etc.", "etc", AbbreviationGate::NotBeforeCapital, true },
    };

    tlds_ = { "com", "org", "net", "edu", "gov", "mil", "int", "biz", "info", "name", "pro",  "coop",
              "museum", "travel", "jobs", "mobi", "tel", "asia", "cat", "xxx", "aero", "arpa", "bg", "br",
              "ca", "cn", "de", "es", "eu", "fr", "in", "it", "jp", "mx", "nl", "ru", "uk", "us",
              "io", "co", "ai", "dev", "app" };
}

void LookupTables::applyOverrides(const toml::table& tables)
{
    if (auto currency = tables["currency"].as_table())
    {
        for (auto&& [key, node] : *currency)
        {
            const std::string symbol(key.str());
            const auto* entry = node.as_table();
            auto major = entry ? (*entry)["major"].value<std::string>() : std::nullopt;
            auto minor = entry ? (*entry)["minor"].value<std::string>() : std::nullopt;
            if (!major || !minor || symbol.empty())
            {
                report_bad_entry("currency", symbol, "expected { major = \"...\", minor = \"...\" }");
                continue;
            }
            CurrencyEntry currency_entry;
            currency_entry.major_singular = *major;
            currency_entry.minor_singular = *minor;
            currency_entry.major_plural = (*entry)["major_plural"].value_or(default_plural(*major));
            currency_entry.minor_plural = (*entry)["minor_plural"].value_or(default_plural(*minor));
            currencies_[symbol] = std::move(currency_entry);
        }
    }

    if (auto units = tables["units"].as_table())
    {
        for (auto&& [key, node] : *units)
        {
            const std::string abbreviation = toLowerAscii(key.str());
            const auto* entry = node.as_table();
            auto word = entry ? (*entry)["word"].value<std::string>() : std::nullopt;
            if (!word || abbreviation.empty())
            {
                report_bad_entry("units", abbreviation, "expected { word = \"...\" }");
                continue;
            }
            UnitEntry unit;
            unit.singular = *word;
            unit.is_rate = (*entry)["rate"].value_or(false);
            unit.attached_only = (*entry)["attached_only"].value_or(false);
            unit.data_unit = (*entry)["data"].value_or(false);
            unit.plural = (*entry)["plural"].value_or(plural_unit_phrase(unit.singular, unit.is_rate));
            units_[abbreviation] = std::move(unit);
        }
    }

    auto load_string_map = [](const toml::table& source, const char* name,
                              std::unordered_map<std::string, std::string>& target)
    {
        const auto* section = source[name].as_table();
        if (!section)
            return;
        for (auto&& [key, node] : *section)
        {
            const std::string mark(key.str());
            auto replacement = node.value<std::string>();
            if (!replacement || utf8ToUtf32(mark).size() != 1)
            {
                report_bad_entry(name, mark, "expected a single character mapped to a string");
                continue;
            }
            target[mark] = *replacement;
        }
    };
    load_string_map(tables, "symbols", symbols_);
    load_string_map(tables, "cjk_punctuation", cjk_);

    if (auto abbreviations = tables["abbreviations"].as_table())
    {
        for (auto&& [key, node] : *abbreviations)
        {
            const std::string abbreviation(key.str());
            const auto* entry = node.as_table();
            auto expansion = entry ? (*entry)["expansion"].value<std::string>() : std::nullopt;
            auto gate = parse_gate(entry ? (*entry)["gate"].value_or(std::string("always")) : std::string());
            if (!expansion || !gate || abbreviation.empty())
            {
                report_bad_entry("abbreviations", abbreviation,
                                 "expected { expansion = \"...\", gate = \"always|before_capital|not_before_capital\" }");
                continue;
            }

            auto existing = std::find_if(abbreviations_.begin(), abbreviations_.end(),
                                         [&](const AbbreviationEntry& e) { return e.abbreviation == abbreviation; });
            AbbreviationEntry replacement{ abbreviation, *expansion, *gate, true };
            if (existing != abbreviations_.end())
                *existing = std::move(replacement);
            else
                abbreviations_.push_back(std::move(replacement));
        }
    }

    PLOG_INFO_(Diagnostics::kLogInstance) << "[LookupTables] overrides applied: " << units_.size() << " units, "
                                          << currencies_.size() << " currencies, " << symbols_.size() << " symbols, "
                                          << abbreviations_.size() << " abbreviations";
}

const UnitEntry* LookupTables::findUnit(std::string_view abbreviation) const
{
    auto it = units_.find(toLowerAscii(abbreviation));
    return it == units_.end() ? nullptr : &it->second;
}

const CurrencyEntry* LookupTables::findCurrency(std::string_view symbol) const
{
    auto it = currencies_.find(std::string(symbol));
    return it == currencies_.end() ? nullptr : &it->second;
}

const std::string* LookupTables::findSymbol(std::string_view symbol) const
{
    auto it = symbols_.find(std::string(symbol));
    return it == symbols_.end() ? nullptr : &it->second;
}

const std::string* LookupTables::findCjkPunctuation(std::string_view mark) const
{
    auto it = cjk_.find(std::string(mark));
    return it == cjk_.end() ? nullptr : &it->second;
}

std::vector<std::string> LookupTables::unitKeysLongestFirst() const
{
    std::vector<std::string> keys;
    keys.reserve(units_.size());
    for (const auto& [key, entry] : units_)
        keys.push_back(key);
    return keys_longest_first(std::move(keys));
}

std::vector<std::string> LookupTables::currencyKeysLongestFirst() const
{
    std::vector<std::string> keys;
    keys.reserve(currencies_.size());
    for (const auto& [key, entry] : currencies_)
        keys.push_back(key);
    return keys_longest_first(std::move(keys));
}

} // namespace normalization
