#pragma once

#include "LookupTables.hpp"
#include "RegexRewrite.hpp"

#include <optional>
#include <string>

// Pattern sources and span handlers for the format-specific passes.
// Each pattern_* string is compiled once by the PassRegistry (ECMAScript
// grammar); its handler reads the capture groups of that pattern only.
// Handlers return nullopt to leave a span as it is.

namespace normalization
{

// scheme:// or www. or bare host.tld, optional :port and path/query
[[nodiscard]] std::string url_pattern(const LookupTables& tables);
[[nodiscard]] std::optional<std::string> handle_url(const MatchSpan& span);

// local@domain.tld: domain dots spoken, local part verbatim
[[nodiscard]] std::string email_pattern();
[[nodiscard]] std::optional<std::string> handle_email(const MatchSpan& span);

// [+cc] (ddd) ddd-dddd in its common separator variants
[[nodiscard]] std::string phone_pattern();
[[nodiscard]] std::optional<std::string> handle_phone(const MatchSpan& span);

// H:MM[:SS] [am|pm]
[[nodiscard]] std::string time_pattern();
[[nodiscard]] std::optional<std::string> handle_time(const MatchSpan& span);

// [-]<symbol><amount>[k|m|b|t|thousand|...]; symbols come from the currency table
[[nodiscard]] std::string money_pattern(const LookupTables& tables);
[[nodiscard]] std::optional<std::string> handle_money(const MatchSpan& span, const LookupTables& tables);

// <amount>[ ]<unit>; abbreviations come from the unit table
[[nodiscard]] std::string unit_pattern(const LookupTables& tables);
[[nodiscard]] std::optional<std::string> handle_unit(const MatchSpan& span, const LookupTables& tables);

// word(s) -> words
[[nodiscard]] std::string optional_plural_pattern();
[[nodiscard]] std::optional<std::string> handle_optional_plural(const MatchSpan& span);

// Any remaining numeral, with ordinal or multiplier suffix and range dash
[[nodiscard]] std::string number_pattern();
[[nodiscard]] std::optional<std::string> handle_number(const MatchSpan& span);

} // namespace normalization
