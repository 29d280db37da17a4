#pragma once

#include "LookupTables.hpp"
#include "NormalizationOptions.hpp"

#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace normalization
{

enum class PassKind
{
    Url,
    Email,
    Phone,
    Time,
    Money,
    Unit,
    OptionalPlural,
    Number,
    Symbol,
    Quote,
    Cjk,
    Abbreviation,
    Whitespace
};

// The one execution order. Format-specific passes precede Number so that
// their digits are consumed before the generic reading sees them.
inline constexpr std::array<PassKind, 13> kPassOrder = {
    PassKind::Url,    PassKind::Email,          PassKind::Phone,  PassKind::Time,   PassKind::Money,
    PassKind::Unit,   PassKind::OptionalPlural, PassKind::Number, PassKind::Symbol, PassKind::Quote,
    PassKind::Cjk,    PassKind::Abbreviation,   PassKind::Whitespace,
};

[[nodiscard]] constexpr std::size_t passIndex(PassKind kind)
{
    for (std::size_t i = 0; i < kPassOrder.size(); ++i)
    {
        if (kPassOrder[i] == kind)
            return i;
    }
    return kPassOrder.size();
}

// Successor in kPassOrder; nullopt after Whitespace
[[nodiscard]] constexpr std::optional<PassKind> nextPass(PassKind kind)
{
    const std::size_t index = passIndex(kind);
    if (index + 1 >= kPassOrder.size())
        return std::nullopt;
    return kPassOrder[index + 1];
}

[[nodiscard]] const char* passName(PassKind kind) noexcept;

enum class LanguageScope
{
    English, // rule grammars are English-specific
    Any      // character mapping only
};

struct PassDefinition
{
    PassKind kind;
    const char* name;
    LanguageScope scope;
    bool (*gate)(const NormalizationOptions&);
    std::function<std::string(const std::string&)> apply;

    // Empty unless the pattern failed to compile; such a pass never runs
    std::string unavailable_reason;

    [[nodiscard]] bool enabled(const NormalizationOptions& options) const
    {
        if (!unavailable_reason.empty())
            return false;
        if (scope == LanguageScope::English && !options.isEnglish())
            return false;
        return gate(options);
    }
};

/**
 * @brief Compiled passes bound to one set of lookup tables
 *
 * Built once, read-only afterwards; process() calls from several threads may
 * share a registry.
 */
class PassRegistry
{
public:
    explicit PassRegistry(std::shared_ptr<const LookupTables> tables);

    // One definition per kPassOrder entry, in that order
    [[nodiscard]] const std::vector<PassDefinition>& passes() const noexcept { return passes_; }
    [[nodiscard]] const PassDefinition& find(PassKind kind) const { return passes_[passIndex(kind)]; }
    [[nodiscard]] const LookupTables& tables() const noexcept { return *tables_; }

private:
    std::shared_ptr<const LookupTables> tables_;
    std::vector<PassDefinition> passes_;
};

} // namespace normalization
