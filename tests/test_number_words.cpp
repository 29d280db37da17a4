#include <catch2/catch_test_macros.hpp>

#include "normalization/NumberWords.hpp"

using namespace normalization;

namespace
{

std::string read(const std::string& text, bool allow_year = true)
{
    auto numeral = parse_numeral(text);
    REQUIRE(numeral.has_value());
    auto words = numeral_to_words(*numeral, Grouping::Magnitude, allow_year);
    REQUIRE(words.has_value());
    return *words;
}

} // namespace

TEST_CASE("Cardinals group by thousands with and before the tail", "[number_words]")
{
    REQUIRE(integer_to_words("0") == "zero");
    REQUIRE(integer_to_words("7") == "seven");
    REQUIRE(integer_to_words("19") == "nineteen");
    REQUIRE(integer_to_words("40") == "forty");
    REQUIRE(integer_to_words("123") == "one hundred and twenty-three");
    REQUIRE(integer_to_words("500") == "five hundred");
    REQUIRE(integer_to_words("1035") == "one thousand and thirty-five");
    REQUIRE(integer_to_words("1200") == "one thousand two hundred");
    REQUIRE(integer_to_words("1000000") == "one million");
    REQUIRE(integer_to_words("2000005") == "two million and five");
    REQUIRE(integer_to_words("007") == "seven");
}

TEST_CASE("Magnitudes beyond trillions are rejected", "[number_words]")
{
    REQUIRE(integer_to_words("999999999999999").has_value());
    REQUIRE_FALSE(integer_to_words("1000000000000000").has_value());
    REQUIRE_FALSE(integer_to_words("12a").has_value());
    REQUIRE_FALSE(integer_to_words("").has_value());
}

TEST_CASE("Four digit years read as two pairs", "[number_words]")
{
    REQUIRE(year_to_words("1998") == "nineteen ninety-eight");
    REQUIRE(year_to_words("2024") == "twenty twenty-four");
    REQUIRE(year_to_words("1900") == "nineteen hundred");
    REQUIRE(year_to_words("1905") == "nineteen oh five");
    REQUIRE(year_to_words("1501") == "fifteen oh one");

    SECTION("outside the window the cardinal reading applies")
    {
        REQUIRE_FALSE(year_to_words("1500").has_value());
        REQUIRE_FALSE(year_to_words("999").has_value());
        REQUIRE_FALSE(year_to_words("12345").has_value());
        REQUIRE(read("1035") == "one thousand and thirty-five");
        REQUIRE(read("1500") == "one thousand five hundred");
    }

    SECTION("exact thousands plus a single digit stay cardinal")
    {
        REQUIRE_FALSE(year_to_words("2000").has_value());
        REQUIRE(read("2005") == "two thousand and five");
        REQUIRE(read("2010") == "twenty ten");
    }

    SECTION("the rule can be switched off")
    {
        REQUIRE(read("1998", false) == "one thousand nine hundred and ninety-eight");
    }
}

TEST_CASE("Decimals read the fraction digit by digit", "[number_words]")
{
    REQUIRE(read("56.789") == "fifty-six point seven eight nine");
    REQUIRE(read("0.05") == "zero point zero five");
    REQUIRE(read(".5") == "point five");
    REQUIRE(read("1998.5") == "one thousand nine hundred and ninety-eight point five");
    REQUIRE(read("-42") == "minus forty-two");
    REQUIRE(read("-3.5") == "minus three point five");
}

TEST_CASE("Numerals accept thousands separators in groups of three", "[number_words]")
{
    auto grouped = parse_numeral("1,234,567");
    REQUIRE(grouped.has_value());
    REQUIRE(grouped->integer_digits == "1234567");

    REQUIRE(read("1,234") == "one thousand two hundred and thirty-four");

    REQUIRE_FALSE(parse_numeral("1,23").has_value());
    REQUIRE_FALSE(parse_numeral("1234,567").has_value());
    REQUIRE_FALSE(parse_numeral("").has_value());
    REQUIRE_FALSE(parse_numeral("-").has_value());
    REQUIRE_FALSE(parse_numeral(".").has_value());
    REQUIRE_FALSE(parse_numeral("1.2.3").has_value());
}

TEST_CASE("Numeral value checks", "[number_words]")
{
    REQUIRE(parse_numeral("1")->isOne());
    REQUIRE(parse_numeral("1.00")->isOne());
    REQUIRE(parse_numeral("-1")->isOne());
    REQUIRE_FALSE(parse_numeral("1.5")->isOne());
    REQUIRE_FALSE(parse_numeral("11")->isOne());
    REQUIRE(parse_numeral("0.00")->isZero());
    REQUIRE_FALSE(parse_numeral("0.01")->isZero());
}

TEST_CASE("Digit group reading keeps every digit", "[number_words]")
{
    REQUIRE(digits_to_words("0451") == "zero four five one");
    REQUIRE(digit_groups_to_words({ "555", "123", "4567" }) == "five five five, one two three, four five six seven");

    auto numeral = parse_numeral("007");
    REQUIRE(numeral_to_words(*numeral, Grouping::DigitGroups) == "zero zero seven");
}

TEST_CASE("Multiplier suffixes map to scale words", "[number_words]")
{
    REQUIRE(multiplier_word("k") == "thousand");
    REQUIRE(multiplier_word("K") == "thousand");
    REQUIRE(multiplier_word("m") == "million");
    REQUIRE(multiplier_word("B") == "billion");
    REQUIRE(multiplier_word("t") == "trillion");
    REQUIRE(multiplier_word("Million") == "million");
    REQUIRE_FALSE(multiplier_word("x").has_value());
}

TEST_CASE("Ordinals change only the last word", "[number_words]")
{
    REQUIRE(ordinal_words("1") == "first");
    REQUIRE(ordinal_words("2") == "second");
    REQUIRE(ordinal_words("3") == "third");
    REQUIRE(ordinal_words("4") == "fourth");
    REQUIRE(ordinal_words("12") == "twelfth");
    REQUIRE(ordinal_words("20") == "twentieth");
    REQUIRE(ordinal_words("22") == "twenty-second");
    REQUIRE(ordinal_words("103") == "one hundred and third");
}
