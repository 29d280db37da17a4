#include "DomainHandlers.hpp"
#include "NumberWords.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace normalization
{

namespace
{

// Unsigned numeral: 1,234,567.89 | 1234.5 | .5
constexpr const char* kAmount = R"((?:\d{1,3}(?:,\d{3})+|\d+)(?:\.\d+)?|\.\d+)";

// phone_pattern groups
constexpr std::size_t kPhoneCountry = 1;
constexpr std::size_t kPhoneArea = 2;
constexpr std::size_t kPhoneExchange = 3;
constexpr std::size_t kPhoneLine = 4;

// time_pattern groups
constexpr std::size_t kTimeHour = 1;
constexpr std::size_t kTimeMinute = 2;
constexpr std::size_t kTimeSecond = 3;
constexpr std::size_t kTimeMeridiem = 4;
constexpr std::size_t kTimeInnerDot = 5;
constexpr std::size_t kTimeTrailingDot = 6;

// money_pattern groups
constexpr std::size_t kMoneySign = 1;
constexpr std::size_t kMoneySymbol = 2;
constexpr std::size_t kMoneyAmount = 3;
constexpr std::size_t kMoneyLongScale = 4;
constexpr std::size_t kMoneyShortScale = 5;

// unit_pattern groups
constexpr std::size_t kUnitAmount = 1;
constexpr std::size_t kUnitGap = 2;
constexpr std::size_t kUnitName = 3;

// number_pattern groups
constexpr std::size_t kNumberDash = 1;
constexpr std::size_t kNumberAmount = 2;
constexpr std::size_t kNumberOrdinal = 3;
constexpr std::size_t kNumberLongScale = 4;
constexpr std::size_t kNumberShortScale = 5;

std::string only_digits(const std::string& text)
{
    std::string out;
    for (char c : text)
    {
        if (isAsciiDigit(c))
            out.push_back(c);
    }
    return out;
}

int small_value(const std::string& digits)
{
    int value = 0;
    for (char c : digits)
        value = value * 10 + (c - '0');
    return value;
}

std::string join_alternation(const std::vector<std::string>& keys)
{
    std::string out;
    for (const auto& key : keys)
    {
        if (!out.empty())
            out += '|';
        out += escapeRegex(key);
    }
    return out;
}

// A dotted "p.m." swallows the sentence period; give it back at a sentence end
bool ends_sentence(std::string_view suffix)
{
    std::size_t i = 0;
    while (i < suffix.size() && (suffix[i] == ' ' || suffix[i] == '\t'))
        ++i;
    if (i == suffix.size())
        return true;
    return i > 0 && (isAsciiUpper(suffix[i]) || suffix[i] == '\n' || suffix[i] == '\r');
}

} // anonymous namespace

std::string phone_pattern()
{
    return R"((\+?\d{1,3}[ .-]?)?(\(\d{3}\)|\d{3})[ .-]?(\d{3})[ .-](\d{4})(?!\d))";
}

std::optional<std::string> handle_phone(const MatchSpan& span)
{
    const char before = span.before();
    if (isAsciiAlnum(before) || before == '.' || before == ',' || before == '$')
        return std::nullopt;

    std::vector<std::string> groups;
    if (span.has(kPhoneCountry))
        groups.push_back(only_digits(span.group(kPhoneCountry)));
    groups.push_back(only_digits(span.group(kPhoneArea)));
    groups.push_back(span.group(kPhoneExchange));
    groups.push_back(span.group(kPhoneLine));
    return digit_groups_to_words(groups);
}

std::string time_pattern()
{
    return R"((\d{1,2}):(\d{2})(?::(\d{2}))?(?!\d)(?:\s?([AaPp])(\.?)[Mm](\.?)(?![A-Za-z]))?)";
}

std::optional<std::string> handle_time(const MatchSpan& span)
{
    if (isAsciiDigit(span.before()) || span.before() == ':' || span.after() == ':')
        return std::nullopt;

    const int hour = small_value(span.group(kTimeHour));
    const int minute = small_value(span.group(kTimeMinute));
    if (hour > 24 || minute > 59)
        return std::nullopt;

    std::string out = *integer_to_words(span.group(kTimeHour));
    const bool has_meridiem = span.has(kTimeMeridiem);

    if (minute == 0)
    {
        if (!has_meridiem)
            out += " o'clock";
    }
    else if (minute < 10)
    {
        out += " oh ";
        out += digits_to_words(span.group(kTimeMinute).substr(1));
    }
    else
    {
        out += ' ';
        out += *integer_to_words(span.group(kTimeMinute));
    }

    if (span.has(kTimeSecond))
    {
        const int second = small_value(span.group(kTimeSecond));
        if (second > 59)
            return std::nullopt;
        out += " and ";
        out += *integer_to_words(span.group(kTimeSecond));
        out += second == 1 ? " second" : " seconds";
    }

    if (has_meridiem)
    {
        const char letter = static_cast<char>(std::tolower(static_cast<unsigned char>(span.group(kTimeMeridiem)[0])));
        out += letter == 'a' ? " am" : " pm";

        // "pm." closes a sentence; "p.m." only when nothing continues it
        if (span.has(kTimeTrailingDot) && (!span.has(kTimeInnerDot) || ends_sentence(span.suffix)))
            out += '.';
    }
    return out;
}

std::string money_pattern(const LookupTables& tables)
{
    return std::string(R"((-)?()") + join_alternation(tables.currencyKeysLongestFirst()) + R"()\s?()" + kAmount +
           R"()(?:\s?(thousand|million|billion|trillion)(?![A-Za-z])|([kKmMbBtT])(?![A-Za-z]))?(?![A-Za-z0-9]|[.,]\d))";
}

std::optional<std::string> handle_money(const MatchSpan& span, const LookupTables& tables)
{
    const CurrencyEntry* currency = tables.findCurrency(span.group(kMoneySymbol));
    if (!currency)
        return std::nullopt;

    auto numeral = parse_numeral(span.group(kMoneyAmount));
    if (!numeral)
        return std::nullopt;

    // "a-$5" keeps its hyphen; only a free-standing sign is spoken
    std::string lead;
    if (span.has(kMoneySign))
        lead = isAsciiAlnum(span.before()) ? "-" : "minus ";

    const std::string scale_text =
        span.has(kMoneyLongScale) ? span.group(kMoneyLongScale) : span.group(kMoneyShortScale);
    if (!scale_text.empty())
    {
        // Scaled amounts skip the cents reading and are always plural
        auto scale = multiplier_word(scale_text);
        auto words = numeral_to_words(*numeral, Grouping::Magnitude, false);
        if (!scale || !words)
            return std::nullopt;
        return lead + *words + " " + *scale + " " + currency->major_plural;
    }

    const std::string& fraction = numeral->fraction_digits;
    const bool zero_cents = fraction.find_first_not_of('0') == std::string::npos;

    if (fraction.size() > 2 && !zero_cents)
    {
        auto words = numeral_to_words(*numeral, Grouping::Magnitude, false);
        if (!words)
            return std::nullopt;
        return lead + *words + " " + currency->major_plural;
    }

    auto whole = integer_to_words(numeral->integer_digits);
    if (!whole)
        return std::nullopt;

    const std::size_t significant = numeral->integer_digits.find_first_not_of('0');
    const bool whole_is_one =
        significant != std::string::npos && numeral->integer_digits.compare(significant, std::string::npos, "1") == 0;
    std::string major = *whole + " " + (whole_is_one ? currency->major_singular : currency->major_plural);

    if (zero_cents)
        return lead + major;

    std::string cents = fraction;
    if (cents.size() == 1)
        cents += '0';
    const int cent_value = small_value(cents);
    std::string minor = *integer_to_words(cents) + " " +
                        (cent_value == 1 ? currency->minor_singular : currency->minor_plural);

    if (numeral->integer_digits.find_first_not_of('0') == std::string::npos)
        return lead + minor;
    return lead + major + " and " + minor;
}

std::string unit_pattern(const LookupTables& tables)
{
    return std::string("(-?(?:") + kAmount + "))(\\s?)(" + join_alternation(tables.unitKeysLongestFirst()) +
           ")(?![A-Za-z0-9])";
}

std::optional<std::string> handle_unit(const MatchSpan& span, const LookupTables& tables)
{
    const char before = span.before();
    if (isAsciiAlpha(before) || isAsciiDigit(before) || before == '.' || before == ',')
        return std::nullopt;

    const std::string name = span.group(kUnitName);
    const UnitEntry* unit = tables.findUnit(name);
    if (!unit)
        return std::nullopt;
    if (unit->attached_only && span.has(kUnitGap))
        return std::nullopt;
    // 5M is a magnitude, 5S not a unit; only liters keep the capital
    if (unit->attached_only && name.size() == 1 && isAsciiUpper(name[0]) && name != "L")
        return std::nullopt;

    const std::string amount = span.group(kUnitAmount);
    // Decades: 1990s
    if (name == "s" && amount.size() == 4 &&
        std::all_of(amount.begin(), amount.end(), [](char c) { return isAsciiDigit(c); }))
        return std::nullopt;

    auto numeral = parse_numeral(amount);
    if (!numeral)
        return std::nullopt;
    auto words = numeral_to_words(*numeral, Grouping::Magnitude, false);
    if (!words)
        return std::nullopt;

    std::string singular = unit->singular;
    std::string plural = unit->plural;
    if (unit->data_unit && name.size() > 1 && name[1] == 'B')
    {
        replaceAll(singular, "bit", "byte");
        replaceAll(plural, "bit", "byte");
    }

    return *words + " " + (numeral->isOne() ? singular : plural);
}

std::string optional_plural_pattern()
{
    return R"(([A-Za-z])\(s\))";
}

std::optional<std::string> handle_optional_plural(const MatchSpan& span)
{
    return span.group(1) + "s";
}

std::string number_pattern()
{
    return std::string("(-?)(") + kAmount +
           R"()(?:(st|nd|rd|th)|\s?(thousand|million|billion|trillion)(?![A-Za-z])|([kKmMbBtT])(?![A-Za-z]))?)";
}

std::optional<std::string> handle_number(const MatchSpan& span)
{
    const char before = span.before();
    const char after = span.after();
    const bool dashed = span.has(kNumberDash);

    // Glued to a word or another numeral: mp3, 3D, 10:30
    if (isAsciiAlpha(after) || isAsciiDigit(after))
        return std::nullopt;
    if (!dashed && (isAsciiAlnum(before) || before == ':' || before == '.'))
        return std::nullopt;
    // Dotted or colon-joined run: 1.2.3, 3:2
    if ((after == '.' || after == ':') && span.suffix.size() > 1 && isAsciiDigit(span.suffix[1]))
        return std::nullopt;

    const std::string amount = span.group(kNumberAmount);
    auto numeral = parse_numeral(amount);
    if (!numeral)
        return std::nullopt;

    std::string lead;
    if (dashed)
    {
        if (isAsciiDigit(before))
            lead = " to ";
        else if (isAsciiAlpha(before))
            lead = "-";
        else
            lead = "minus ";
    }

    if (span.has(kNumberOrdinal))
    {
        if (numeral->hasFraction() || amount.find(',') != std::string::npos)
            return std::nullopt;
        auto words = ordinal_words(numeral->integer_digits);
        if (!words)
            return std::nullopt;
        return lead + *words;
    }

    const std::string scale_text =
        span.has(kNumberLongScale) ? span.group(kNumberLongScale) : span.group(kNumberShortScale);
    if (!scale_text.empty())
    {
        auto scale = multiplier_word(scale_text);
        auto words = numeral_to_words(*numeral, Grouping::Magnitude, false);
        if (!scale || !words)
            return std::nullopt;
        return lead + *words + " " + *scale;
    }

    // "1,998" is a quantity, never a year
    const bool allow_year = amount.find(',') == std::string::npos;
    auto words = numeral_to_words(*numeral, Grouping::Magnitude, allow_year);
    if (!words)
        return std::nullopt;
    return lead + *words;
}

} // namespace normalization
