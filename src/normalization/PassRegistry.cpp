#include "PassRegistry.hpp"
#include "CharacterSanitizer.hpp"
#include "Diagnostics.hpp"
#include "DomainHandlers.hpp"
#include "RegexRewrite.hpp"
#include "../utils/ErrorReporter.hpp"

#include <iterator>
#include <regex>
#include <plog/Log.h>

namespace normalization
{

namespace
{

bool always(const NormalizationOptions&) { return true; }
bool urls(const NormalizationOptions& o) { return o.url_normalization; }
bool emails(const NormalizationOptions& o) { return o.email_normalization; }
bool phones(const NormalizationOptions& o) { return o.phone_normalization; }
bool units(const NormalizationOptions& o) { return o.unit_normalization; }
bool plurals(const NormalizationOptions& o) { return o.optional_pluralization_normalization; }
bool symbols(const NormalizationOptions& o) { return o.replace_remaining_symbols; }

struct PassDesc
{
    PassKind kind;
    const char* name;
    LanguageScope scope;
    bool (*gate)(const NormalizationOptions&);
};

constexpr PassDesc kPasses[] = {
    { PassKind::Url, "url", LanguageScope::English, &urls },
    { PassKind::Email, "email", LanguageScope::English, &emails },
    { PassKind::Phone, "phone", LanguageScope::English, &phones },
    { PassKind::Time, "time", LanguageScope::English, &always },
    { PassKind::Money, "money", LanguageScope::English, &always },
    { PassKind::Unit, "unit", LanguageScope::English, &units },
    { PassKind::OptionalPlural, "optional_plural", LanguageScope::English, &plurals },
    { PassKind::Number, "number", LanguageScope::English, &always },
    { PassKind::Symbol, "symbol", LanguageScope::English, &symbols },
    { PassKind::Quote, "quote", LanguageScope::Any, &always },
    { PassKind::Cjk, "cjk_punctuation", LanguageScope::Any, &always },
    { PassKind::Abbreviation, "abbreviation", LanguageScope::English, &always },
    { PassKind::Whitespace, "whitespace", LanguageScope::Any, &always },
};

constexpr bool matches_pass_order()
{
    if (std::size(kPasses) != kPassOrder.size())
        return false;
    for (std::size_t i = 0; i < kPassOrder.size(); ++i)
    {
        if (kPasses[i].kind != kPassOrder[i])
            return false;
    }
    return true;
}

static_assert(matches_pass_order(), "kPasses must list every pass in kPassOrder order");

using Transform = std::function<std::string(const std::string&)>;

// One compiled pattern plus its handler. Throws std::regex_error on a bad pattern.
Transform regex_pass(const std::string& pattern, std::regex::flag_type flags, SpanHandler handler, const char* name)
{
    auto compiled = std::make_shared<const std::regex>(pattern, flags | std::regex::ECMAScript | std::regex::optimize);
    return [compiled, handler = std::move(handler), name](const std::string& text)
    {
        return rewrite_matches(text, *compiled, handler, name);
    };
}

Transform build_transform(PassKind kind, const std::shared_ptr<const LookupTables>& tables, const char* name)
{
    const LookupTables& t = *tables;
    const auto icase = std::regex::icase;
    const std::regex::flag_type none{};

    switch (kind)
    {
    case PassKind::Url:
        return regex_pass(url_pattern(t), icase, &handle_url, name);
    case PassKind::Email:
        return regex_pass(email_pattern(), none, &handle_email, name);
    case PassKind::Phone:
        return regex_pass(phone_pattern(), none, &handle_phone, name);
    case PassKind::Time:
        return regex_pass(time_pattern(), none, &handle_time, name);
    case PassKind::Money:
        return regex_pass(money_pattern(t), none,
                          [tables](const MatchSpan& span) { return handle_money(span, *tables); }, name);
    case PassKind::Unit:
        return regex_pass(unit_pattern(t), icase,
                          [tables](const MatchSpan& span) { return handle_unit(span, *tables); }, name);
    case PassKind::OptionalPlural:
        return regex_pass(optional_plural_pattern(), none, &handle_optional_plural, name);
    case PassKind::Number:
        return regex_pass(number_pattern(), none, &handle_number, name);
    case PassKind::Symbol:
        return [tables](const std::string& text) { return replace_symbols(text, *tables); };
    case PassKind::Quote:
        return [](const std::string& text) { return normalize_quotes(text); };
    case PassKind::Cjk:
        return [tables](const std::string& text) { return replace_cjk_punctuation(text, *tables); };
    case PassKind::Abbreviation:
    {
        Transform titles = regex_pass(abbreviation_pattern(t), none,
                                      [tables](const MatchSpan& span) { return handle_abbreviation(span, *tables); },
                                      name);
        Transform acronyms = regex_pass(acronym_pattern(), none, &handle_acronym, name);
        return [titles, acronyms](const std::string& text) { return acronyms(titles(text)); };
    }
    case PassKind::Whitespace:
        return [](const std::string& text) { return collapse_whitespace(text); };
    }
    return [](const std::string& text) { return text; };
}

} // anonymous namespace

const char* passName(PassKind kind) noexcept
{
    const std::size_t index = passIndex(kind);
    return index < std::size(kPasses) ? kPasses[index].name : "unknown";
}

PassRegistry::PassRegistry(std::shared_ptr<const LookupTables> tables)
    : tables_(tables ? std::move(tables) : LookupTables::defaults())
{
    passes_.reserve(std::size(kPasses));
    for (const auto& desc : kPasses)
    {
        PassDefinition definition{ desc.kind, desc.name, desc.scope, desc.gate, {}, {} };
        try
        {
            definition.apply = build_transform(desc.kind, tables_, desc.name);
        }
        catch (const std::regex_error& ex)
        {
            definition.unavailable_reason = ex.what();
            definition.apply = [](const std::string& text) { return text; };
            PLOG_ERROR_(Diagnostics::kLogInstance) << "[PassRegistry] pass=" << desc.name
                                                   << " pattern rejected: " << ex.what();
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization,
                                              "A normalization pass is disabled",
                                              std::string(desc.name) + ": " + ex.what());
        }
        passes_.push_back(std::move(definition));
    }

    PLOG_DEBUG_(Diagnostics::kLogInstance) << "[PassRegistry] " << passes_.size() << " passes ready";
}

} // namespace normalization
