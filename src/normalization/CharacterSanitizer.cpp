#include "CharacterSanitizer.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <cctype>

namespace normalization
{

namespace
{

// Replace every codepoint for which map_cp yields a value; malformed bytes pass through
template<typename MapFn>
std::string map_codepoints(const std::string& text, MapFn&& map_cp)
{
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size())
    {
        char32_t cp = 0;
        const std::size_t len = decodeCodepoint(text, pos, cp);
        const std::string_view bytes(text.data() + pos, len);
        if (auto replacement = map_cp(cp, bytes))
            out += *replacement;
        else
            out.append(bytes);
        pos += len;
    }
    return out;
}

std::optional<std::string_view> ascii_quote(char32_t cp)
{
    switch (cp)
    {
    case U'“': case U'”': case U'„': case U'‟':
    case U'«': case U'»': case U'″': case U'〝':
    case U'〞': case U'＂':
    case U'「': case U'」': case U'『': case U'』':
        return std::string_view("\"");
    case U'‘': case U'’': case U'‚': case U'‛':
    case U'′': case U'‹': case U'›': case U'＇':
        return std::string_view("'");
    case U'（': return std::string_view("(");
    case U'）': return std::string_view(")");
    case U'［': case U'【': return std::string_view("[");
    case U'］': case U'】': return std::string_view("]");
    case U'｛': return std::string_view("{");
    case U'｝': return std::string_view("}");
    default: return std::nullopt;
    }
}

bool equals_ignore_case(std::string_view a, std::string_view b)
{
    return a.size() == b.size() && toLowerAscii(a) == toLowerAscii(b);
}

// "Dr." -> "[Dd][Rr]\."
std::string case_folded_pattern(std::string_view literal)
{
    std::string out;
    for (char c : literal)
    {
        if (isAsciiAlpha(c))
        {
            out += '[';
            out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            out += ']';
        }
        else
        {
            out += escapeRegex(std::string_view(&c, 1));
        }
    }
    return out;
}

bool is_line_break(char32_t cp)
{
    return cp == U'\n' || cp == U'\r' || cp == U'\u0085' || cp == U'\u2028' || cp == U'\u2029';
}

bool is_inline_space(char32_t cp)
{
    return cp == U' ' || cp == U'\t' || cp == U'\v' || cp == U'\f' || isSpaceSeparator(cp);
}

} // anonymous namespace

std::string replace_symbols(const std::string& text, const LookupTables& tables)
{
    return map_codepoints(text,
                          [&](char32_t, std::string_view bytes) -> std::optional<std::string>
                          {
                              if (const std::string* word = tables.findSymbol(bytes))
                                  return *word;
                              return std::nullopt;
                          });
}

std::string normalize_quotes(const std::string& text)
{
    return map_codepoints(text,
                          [](char32_t cp, std::string_view) -> std::optional<std::string>
                          {
                              if (auto ascii = ascii_quote(cp))
                                  return std::string(*ascii);
                              return std::nullopt;
                          });
}

std::string replace_cjk_punctuation(const std::string& text, const LookupTables& tables)
{
    return map_codepoints(text,
                          [&](char32_t cp, std::string_view bytes) -> std::optional<std::string>
                          {
                              if (cp < 0x80)
                                  return std::nullopt;
                              if (const std::string* western = tables.findCjkPunctuation(bytes))
                                  return *western + " ";
                              return std::nullopt;
                          });
}

std::string abbreviation_pattern(const LookupTables& tables)
{
    std::vector<const AbbreviationEntry*> entries;
    for (const auto& entry : tables.abbreviations())
        entries.push_back(&entry);
    std::stable_sort(entries.begin(), entries.end(),
                     [](const AbbreviationEntry* a, const AbbreviationEntry* b)
                     { return a->abbreviation.size() > b->abbreviation.size(); });

    std::string alternation;
    for (const auto* entry : entries)
    {
        if (!alternation.empty())
            alternation += '|';
        alternation += entry->case_sensitive ? escapeRegex(entry->abbreviation)
                                             : case_folded_pattern(entry->abbreviation);
    }
    return "(" + alternation + ")";
}

std::optional<std::string> handle_abbreviation(const MatchSpan& span, const LookupTables& tables)
{
    if (isAsciiAlnum(span.before()) || span.before() == '.')
        return std::nullopt;

    const std::string& matched = span.text();
    const AbbreviationEntry* found = nullptr;
    for (const auto& entry : tables.abbreviations())
    {
        if (entry.case_sensitive ? entry.abbreviation == matched : equals_ignore_case(entry.abbreviation, matched))
        {
            found = &entry;
            break;
        }
    }
    if (!found)
        return std::nullopt;

    const bool capital_follows = span.suffix.size() >= 2 && span.suffix[0] == ' ' && isAsciiUpper(span.suffix[1]);
    switch (found->gate)
    {
    case AbbreviationGate::BeforeCapital:
        if (!capital_follows)
            return std::nullopt;
        break;
    case AbbreviationGate::NotBeforeCapital:
        if (capital_follows)
            return std::nullopt;
        break;
    case AbbreviationGate::Always:
        break;
    }
    return found->expansion;
}

std::string acronym_pattern()
{
    return R"(((?:[A-Za-z]\.){2,}))";
}

std::optional<std::string> handle_acronym(const MatchSpan& span)
{
    if (isAsciiAlnum(span.before()) || span.before() == '.' || isAsciiAlpha(span.after()))
        return std::nullopt;

    const std::string& matched = span.text();
    std::string out;
    for (std::size_t i = 0; i < matched.size(); i += 2)
    {
        if (!out.empty())
            out += '-';
        out += matched[i];
    }

    // The final period survives unless a lowercase word continues the sentence
    const bool lowercase_follows = span.suffix.size() >= 2 && span.suffix[0] == ' ' && isAsciiLower(span.suffix[1]);
    if (!lowercase_follows)
        out += '.';
    return out;
}

std::string collapse_whitespace(const std::string& text)
{
    std::vector<std::string> lines(1);
    std::size_t pos = 0;
    while (pos < text.size())
    {
        char32_t cp = 0;
        const std::size_t len = decodeCodepoint(text, pos, cp);
        std::string& line = lines.back();
        if (is_line_break(cp))
        {
            // \r\n counts once
            if (cp == U'\r' && pos + 1 < text.size() && text[pos + 1] == '\n')
                ++pos;
            lines.emplace_back();
        }
        else if (is_inline_space(cp))
        {
            if (!line.empty() && line.back() != ' ')
                line.push_back(' ');
        }
        else
        {
            line.append(text, pos, len);
        }
        pos += len;
    }

    std::string out;
    out.reserve(text.size());
    for (auto& line : lines)
    {
        while (!line.empty() && line.back() == ' ')
            line.pop_back();
        if (line.empty())
            continue;
        if (!out.empty())
            out.push_back(' ');
        out += line;
    }
    return out;
}

} // namespace normalization
