#pragma once

#include "LookupTables.hpp"
#include "RegexRewrite.hpp"

#include <optional>
#include <string>

namespace normalization
{

// Symbol table characters (~ @ # $ % ...) -> spoken words or a space
[[nodiscard]] std::string replace_symbols(const std::string& text, const LookupTables& tables);

// Typographic quotes, guillemets and full-width brackets -> ASCII
[[nodiscard]] std::string normalize_quotes(const std::string& text);

// 、。！ ... -> ",.!" followed by a space
[[nodiscard]] std::string replace_cjk_punctuation(const std::string& text, const LookupTables& tables);

/**
 * @brief Title abbreviations from the abbreviation table
 *
 * Each entry carries a gate on what follows it: "Dr." expands only before a
 * capitalised word, "etc." only when no capitalised word follows.
 */
[[nodiscard]] std::string abbreviation_pattern(const LookupTables& tables);
[[nodiscard]] std::optional<std::string> handle_abbreviation(const MatchSpan& span, const LookupTables& tables);

// Dotted acronyms: U.S.A. -> U-S-A
[[nodiscard]] std::string acronym_pattern();
[[nodiscard]] std::optional<std::string> handle_acronym(const MatchSpan& span);

/**
 * @brief Final whitespace cleanup
 *
 * Unicode space separators, tabs and form feeds become spaces, whitespace-only
 * lines are dropped, remaining line breaks become spaces, runs collapse to one
 * space and the result is trimmed.
 */
[[nodiscard]] std::string collapse_whitespace(const std::string& text);

} // namespace normalization
