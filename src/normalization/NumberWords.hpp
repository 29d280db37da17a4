#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace normalization
{

// How the integer part of a numeral is read
enum class Grouping
{
    Magnitude,  // cardinal reading: "one hundred and twenty-three"
    DigitGroups // digit by digit: "one two three"
};

// A validated numeral split into its digit strings. Kept as text so that
// large magnitudes and long fractions never go through floating point.
struct Numeral
{
    bool negative = false;
    std::string integer_digits;  // no sign, no separators; "0" when the text was ".5"
    std::string fraction_digits; // empty for integers
    bool bare_fraction = false;  // written without an integer part: ".5"

    [[nodiscard]] bool hasFraction() const noexcept { return !fraction_digits.empty(); }

    // |value| == 1 exactly (1, 1.0, 01.00)
    [[nodiscard]] bool isOne() const noexcept;

    // value == 0 exactly
    [[nodiscard]] bool isZero() const noexcept;
};

/**
 * @brief Parse "[+-]?(d{1,3}(,ddd)+|d+)?(.d+)?" into a Numeral
 *
 * Thousands separators must come in groups of three. Returns nullopt for
 * anything else, including an empty string and a lone sign or point.
 */
[[nodiscard]] std::optional<Numeral> parse_numeral(std::string_view text);

/**
 * @brief Cardinal reading of an unsigned digit string
 *
 * Base-1000 groups with thousand/million/billion/trillion scales, zero groups
 * omitted, "and" inside a group after "hundred" and before a final group
 * below one hundred: 1035 -> "one thousand and thirty-five".
 * Returns nullopt for non-digits or magnitudes of 10^15 and above.
 */
[[nodiscard]] std::optional<std::string> integer_to_words(std::string_view digits);

/**
 * @brief Four-digit year reading, or nullopt when the year rule does not apply
 *
 * Applies to 1501..9999 except exact thousands plus 0..9 (2000..2009 read as
 * cardinals). 1998 -> "nineteen ninety-eight", 1900 -> "nineteen hundred",
 * 1905 -> "nineteen oh five".
 */
[[nodiscard]] std::optional<std::string> year_to_words(std::string_view digits);

// Every digit read on its own: "0451" -> "zero four five one"
[[nodiscard]] std::string digits_to_words(std::string_view digits);

// Digit-group reading joined with comma pauses: {"555","123"} -> "five five five, one two three"
[[nodiscard]] std::string digit_groups_to_words(const std::vector<std::string>& groups);

/**
 * @brief Full reading of a numeral
 *
 * Sign -> leading "minus"; integer part per grouping (year rule only when
 * allow_year and the numeral is a plain integer); fraction digit by digit
 * after "point" (".5" -> "point five"). nullopt when the integer part is out
 * of range.
 */
[[nodiscard]] std::optional<std::string> numeral_to_words(const Numeral& numeral,
                                                          Grouping grouping = Grouping::Magnitude,
                                                          bool allow_year = true);

// k/m/b/t and thousand/million/billion/trillion (any case) -> scale word
[[nodiscard]] std::optional<std::string> multiplier_word(std::string_view suffix);

// 1 -> "first", 22 -> "twenty-second", 103 -> "one hundred and third"
[[nodiscard]] std::optional<std::string> ordinal_words(std::string_view digits);

} // namespace normalization
