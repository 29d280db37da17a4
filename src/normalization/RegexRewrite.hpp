#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace normalization
{

/**
 * @brief One match of a pass pattern in the current text
 *
 * Only valid for the duration of the handler call: prefix and suffix view
 * the text the pass is scanning.
 */
struct MatchSpan
{
    std::size_t start = 0;
    std::size_t end = 0;
    std::vector<std::optional<std::string>> groups; // [0] is the whole match
    std::string_view prefix;                        // text before the match
    std::string_view suffix;                        // text after the match

    [[nodiscard]] const std::string& text() const { return *groups[0]; }

    [[nodiscard]] bool has(std::size_t index) const
    {
        return index < groups.size() && groups[index].has_value() && !groups[index]->empty();
    }

    // Empty string for an unmatched group
    [[nodiscard]] std::string group(std::size_t index) const
    {
        return has(index) ? *groups[index] : std::string();
    }

    // '\0' at the text boundaries
    [[nodiscard]] char before() const noexcept { return prefix.empty() ? '\0' : prefix.back(); }
    [[nodiscard]] char after() const noexcept { return suffix.empty() ? '\0' : suffix.front(); }
};

// Longest whitespace-free run a pattern pass will scan. std::regex recurses
// per character, so longer runs are copied through untouched.
constexpr std::size_t kMaxTokenBytes = 4096;

// [begin, end) byte ranges of runs without ASCII whitespace longer than kMaxTokenBytes
[[nodiscard]] std::vector<std::pair<std::size_t, std::size_t>> overlong_tokens(std::string_view text);

// nullopt keeps the span verbatim
using SpanHandler = std::function<std::optional<std::string>(const MatchSpan&)>;

/**
 * @brief Replace every non-overlapping match of pattern, left to right
 *
 * Single rewrite over text: replacements are never rescanned. A handler that
 * throws std::exception leaves its span unchanged and the scan continues.
 * Runs reported by overlong_tokens() are never scanned.
 */
[[nodiscard]] std::string rewrite_matches(const std::string& text, const std::regex& pattern,
                                          const SpanHandler& handler, std::string_view pass_name);

} // namespace normalization
