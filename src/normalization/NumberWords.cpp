#include "NumberWords.hpp"
#include "TextUtils.hpp"

#include <array>
#include <cstdint>

namespace normalization
{

namespace
{

constexpr std::array<const char*, 20> kOnes = {
    "zero",    "one",     "two",       "three",    "four",     "five",    "six",
    "seven",   "eight",   "nine",      "ten",      "eleven",   "twelve",  "thirteen",
    "fourteen", "fifteen", "sixteen",  "seventeen", "eighteen", "nineteen"
};

constexpr std::array<const char*, 10> kTens = {
    "", "", "twenty", "thirty", "forty", "fifty", "sixty", "seventy", "eighty", "ninety"
};

// Index = base-1000 group position
constexpr std::array<const char*, 5> kScales = { "", "thousand", "million", "billion", "trillion" };

std::string below_hundred(int value)
{
    if (value < 20)
        return kOnes[static_cast<std::size_t>(value)];
    std::string out = kTens[static_cast<std::size_t>(value / 10)];
    if (value % 10 != 0)
    {
        out += '-';
        out += kOnes[static_cast<std::size_t>(value % 10)];
    }
    return out;
}

std::string below_thousand(int value)
{
    const int hundreds = value / 100;
    const int rest = value % 100;
    std::string out;
    if (hundreds > 0)
    {
        out = kOnes[static_cast<std::size_t>(hundreds)];
        out += " hundred";
        if (rest > 0)
            out += " and ";
    }
    if (rest > 0 || hundreds == 0)
        out += below_hundred(rest);
    return out;
}

bool all_digits(std::string_view text)
{
    if (text.empty())
        return false;
    for (char c : text)
    {
        if (!isAsciiDigit(c))
            return false;
    }
    return true;
}

std::string_view strip_leading_zeros(std::string_view digits)
{
    auto first = digits.find_first_not_of('0');
    if (first == std::string_view::npos)
        return digits.empty() ? digits : digits.substr(digits.size() - 1);
    return digits.substr(first);
}

bool all_zero(std::string_view digits)
{
    return digits.find_first_not_of('0') == std::string_view::npos;
}

std::string ordinal_of_word(const std::string& word)
{
    struct Irregular
    {
        const char* cardinal;
        const char* ordinal;
    };
    static constexpr std::array<Irregular, 8> kIrregular = { {
        { "one", "first" },
        { "two", "second" },
        { "three", "third" },
        { "five", "fifth" },
        { "eight", "eighth" },
        { "nine", "ninth" },
        { "twelve", "twelfth" },
        { "zero", "zeroth" },
    } };

    for (const auto& entry : kIrregular)
    {
        if (word == entry.cardinal)
            return entry.ordinal;
    }
    if (!word.empty() && word.back() == 'y')
        return word.substr(0, word.size() - 1) + "ieth";
    return word + "th";
}

} // anonymous namespace

bool Numeral::isOne() const noexcept
{
    return strip_leading_zeros(integer_digits) == "1" && all_zero(fraction_digits);
}

bool Numeral::isZero() const noexcept
{
    return all_zero(integer_digits) && all_zero(fraction_digits);
}

std::optional<Numeral> parse_numeral(std::string_view text)
{
    Numeral numeral;
    std::size_t pos = 0;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+'))
    {
        numeral.negative = text[pos] == '-';
        ++pos;
    }

    const std::size_t point = text.find('.', pos);
    std::string_view integer_text = text.substr(pos, point == std::string_view::npos ? std::string_view::npos
                                                                                   : point - pos);
    std::string_view fraction_text;
    if (point != std::string_view::npos)
    {
        fraction_text = text.substr(point + 1);
        if (!all_digits(fraction_text))
            return std::nullopt;
    }

    if (integer_text.empty())
    {
        if (fraction_text.empty())
            return std::nullopt;
        numeral.integer_digits = "0";
        numeral.bare_fraction = true;
    }
    else if (integer_text.find(',') != std::string_view::npos)
    {
        // 1,234,567: leading group of 1-3 digits, then exact triplets
        std::size_t start = 0;
        bool first = true;
        while (start <= integer_text.size())
        {
            std::size_t comma = integer_text.find(',', start);
            std::string_view group = integer_text.substr(start, comma == std::string_view::npos ? std::string_view::npos
                                                                                             : comma - start);
            if (!all_digits(group))
                return std::nullopt;
            if (first ? group.size() > 3 : group.size() != 3)
                return std::nullopt;
            numeral.integer_digits.append(group);
            first = false;
            if (comma == std::string_view::npos)
                break;
            start = comma + 1;
        }
    }
    else
    {
        if (!all_digits(integer_text))
            return std::nullopt;
        numeral.integer_digits.assign(integer_text);
    }

    numeral.fraction_digits.assign(fraction_text);
    return numeral;
}

std::optional<std::string> integer_to_words(std::string_view digits)
{
    if (!all_digits(digits))
        return std::nullopt;

    digits = strip_leading_zeros(digits);
    if (digits.size() > kScales.size() * 3)
        return std::nullopt;
    if (digits == "0")
        return std::string(kOnes[0]);

    // Split into base-1000 groups, lowest first
    std::vector<int> groups;
    for (std::size_t end = digits.size(); end > 0;)
    {
        std::size_t begin = end >= 3 ? end - 3 : 0;
        int value = 0;
        for (std::size_t i = begin; i < end; ++i)
            value = value * 10 + (digits[i] - '0');
        groups.push_back(value);
        end = begin;
    }

    std::vector<std::string> parts;
    for (std::size_t index = groups.size(); index-- > 0;)
    {
        const int value = groups[index];
        if (value == 0)
            continue;
        std::string words = below_thousand(value);
        if (index > 0)
        {
            words += ' ';
            words += kScales[index];
        }
        else if (value < 100 && groups.size() > 1)
        {
            words = "and " + words;
        }
        parts.push_back(std::move(words));
    }

    std::string out;
    for (const auto& part : parts)
    {
        if (!out.empty())
            out += ' ';
        out += part;
    }
    return out;
}

std::optional<std::string> year_to_words(std::string_view digits)
{
    if (digits.size() != 4 || !all_digits(digits) || digits[0] == '0')
        return std::nullopt;

    const int value = (digits[0] - '0') * 1000 + (digits[1] - '0') * 100 + (digits[2] - '0') * 10 + (digits[3] - '0');
    if (value <= 1500 || value % 1000 < 10)
        return std::nullopt;

    const int high = value / 100;
    const int low = value % 100;
    std::string out = below_hundred(high);
    if (low == 0)
        out += " hundred";
    else if (low < 10)
        out += std::string(" oh ") + kOnes[static_cast<std::size_t>(low)];
    else
        out += ' ' + below_hundred(low);
    return out;
}

std::string digits_to_words(std::string_view digits)
{
    std::string out;
    for (char c : digits)
    {
        if (!isAsciiDigit(c))
            continue;
        if (!out.empty())
            out += ' ';
        out += kOnes[static_cast<std::size_t>(c - '0')];
    }
    return out;
}

std::string digit_groups_to_words(const std::vector<std::string>& groups)
{
    std::string out;
    for (const auto& group : groups)
    {
        std::string words = digits_to_words(group);
        if (words.empty())
            continue;
        if (!out.empty())
            out += ", ";
        out += words;
    }
    return out;
}

std::optional<std::string> numeral_to_words(const Numeral& numeral, Grouping grouping, bool allow_year)
{
    std::string integer_words;
    if (grouping == Grouping::DigitGroups)
    {
        integer_words = digits_to_words(numeral.integer_digits);
        if (integer_words.empty())
            return std::nullopt;
    }
    else
    {
        std::optional<std::string> year;
        if (allow_year && !numeral.hasFraction())
            year = year_to_words(numeral.integer_digits);

        auto cardinal = year ? year : integer_to_words(numeral.integer_digits);
        if (!cardinal)
            return std::nullopt;
        integer_words = std::move(*cardinal);
    }

    std::string out;
    if (numeral.negative)
        out = "minus ";
    if (!numeral.bare_fraction || !numeral.hasFraction())
        out += integer_words;
    if (numeral.hasFraction())
    {
        if (!out.empty() && out.back() != ' ')
            out += ' ';
        out += "point ";
        out += digits_to_words(numeral.fraction_digits);
    }
    return out;
}

std::optional<std::string> multiplier_word(std::string_view suffix)
{
    const std::string key = toLowerAscii(trimWhitespace(suffix));
    if (key == "k" || key == "thousand")
        return std::string("thousand");
    if (key == "m" || key == "million")
        return std::string("million");
    if (key == "b" || key == "billion")
        return std::string("billion");
    if (key == "t" || key == "trillion")
        return std::string("trillion");
    return std::nullopt;
}

std::optional<std::string> ordinal_words(std::string_view digits)
{
    auto cardinal = integer_to_words(digits);
    if (!cardinal)
        return std::nullopt;

    // Only the last word changes: "twenty-two" -> "twenty-second"
    const std::size_t split = cardinal->find_last_of(" -");
    if (split == std::string::npos)
        return ordinal_of_word(*cardinal);
    return cardinal->substr(0, split + 1) + ordinal_of_word(cardinal->substr(split + 1));
}

} // namespace normalization
