#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <toml++/toml.h>

namespace normalization
{

struct UnitEntry
{
    std::string singular;        // "kilometer per hour"
    std::string plural;          // "kilometers per hour"
    bool is_rate = false;        // "per ..." tail never follows the numerator
    bool attached_only = false;  // "5m" yes, "5 m" no
    bool data_unit = false;      // bit/byte chosen from the case of the 'b'
};

struct CurrencyEntry
{
    std::string major_singular;
    std::string major_plural;
    std::string minor_singular;
    std::string minor_plural;
};

enum class AbbreviationGate
{
    Always,          // "Mr." anywhere
    BeforeCapital,   // "Dr." only before " Smith"
    NotBeforeCapital // "etc." unless it ends a sentence
};

struct AbbreviationEntry
{
    std::string abbreviation; // "Dr."
    std::string expansion;    // "Doctor"
    AbbreviationGate gate = AbbreviationGate::Always;
    bool case_sensitive = true;
};

/**
 * @brief Immutable, process-wide lookup tables shared by all passes
 *
 * Built once (defaults() or withOverrides()) and never mutated afterwards,
 * so any number of normalization calls may read them concurrently.
 * Keys of the unit table are stored lower-case; lookups fold ASCII case.
 */
class LookupTables
{
public:
    // Built-in tables, constructed on first use
    [[nodiscard]] static std::shared_ptr<const LookupTables> defaults();

    /**
     * @brief Defaults overlaid with the [normalization.tables] section
     *
     * Malformed entries are skipped and reported as Configuration warnings.
     */
    [[nodiscard]] static std::shared_ptr<const LookupTables> withOverrides(const toml::table& tables);

    [[nodiscard]] const UnitEntry* findUnit(std::string_view abbreviation) const;
    [[nodiscard]] const CurrencyEntry* findCurrency(std::string_view symbol) const;
    [[nodiscard]] const std::string* findSymbol(std::string_view symbol) const;
    [[nodiscard]] const std::string* findCjkPunctuation(std::string_view mark) const;

    [[nodiscard]] const std::unordered_map<std::string, UnitEntry>& units() const noexcept { return units_; }
    [[nodiscard]] const std::unordered_map<std::string, CurrencyEntry>& currencies() const noexcept { return currencies_; }
    [[nodiscard]] const std::unordered_map<std::string, std::string>& symbols() const noexcept { return symbols_; }
    [[nodiscard]] const std::unordered_map<std::string, std::string>& cjkPunctuation() const noexcept { return cjk_; }
    [[nodiscard]] const std::vector<AbbreviationEntry>& abbreviations() const noexcept { return abbreviations_; }
    [[nodiscard]] const std::vector<std::string>& topLevelDomains() const noexcept { return tlds_; }

    // Keys sorted longest first, ready to be joined into a regex alternation
    [[nodiscard]] std::vector<std::string> unitKeysLongestFirst() const;
    [[nodiscard]] std::vector<std::string> currencyKeysLongestFirst() const;

private:
    LookupTables() = default;

    void loadDefaults();
    void applyOverrides(const toml::table& tables);

    std::unordered_map<std::string, UnitEntry> units_;
    std::unordered_map<std::string, CurrencyEntry> currencies_;
    std::unordered_map<std::string, std::string> symbols_;
    std::unordered_map<std::string, std::string> cjk_;
    std::vector<AbbreviationEntry> abbreviations_;
    std::vector<std::string> tlds_;
};

// Regular English plural for table entries without an explicit one
[[nodiscard]] std::string default_plural(const std::string& singular);

// Plural of a unit phrase: only the head word inflects for rate units
[[nodiscard]] std::string plural_unit_phrase(const std::string& singular, bool is_rate);

} // namespace normalization
