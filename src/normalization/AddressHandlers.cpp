#include "DomainHandlers.hpp"
#include "NumberWords.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <string_view>

namespace normalization
{

namespace
{

// url_pattern groups
constexpr std::size_t kUrlScheme = 1;
constexpr std::size_t kUrlHost = 2;
constexpr std::size_t kUrlPort = 3;
constexpr std::size_t kUrlPath = 4;

// email_pattern groups
constexpr std::size_t kEmailLocal = 1;
constexpr std::size_t kEmailDomain = 2;

// Characters that make a candidate part of a larger token
bool continues_token(char c)
{
    return isAsciiAlnum(c) || c == '.' || c == '@' || c == '-' || c == '_' || c == '/' || c == ':';
}

std::string collapse_spaces(const std::string& text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        if (c == ' ' && (out.empty() || out.back() == ' '))
            continue;
        out.push_back(c);
    }
    while (!out.empty() && out.back() == ' ')
        out.pop_back();
    return out;
}

std::string spell_dots(const std::string& host)
{
    std::string out = host;
    replaceAll(out, ".", " dot ");
    return out;
}

std::string spell_path(const std::string& path)
{
    std::string out;
    out.reserve(path.size() * 2);
    for (char c : path)
    {
        switch (c)
        {
        case '/': out += " slash "; break;
        case '?': out += " question-mark "; break;
        case '=': out += " equals "; break;
        case '&': out += " ampersand "; break;
        case '#': out += " hash "; break;
        case '.': out += " dot "; break;
        default: out.push_back(c); break;
        }
    }
    return out;
}

} // anonymous namespace

std::string url_pattern(const LookupTables& tables)
{
    std::vector<std::string> tlds = tables.topLevelDomains();
    std::sort(tlds.begin(), tlds.end(),
              [](const std::string& a, const std::string& b) { return a.size() > b.size(); });

    std::string alternation;
    for (const auto& tld : tlds)
    {
        if (!alternation.empty())
            alternation += '|';
        alternation += escapeRegex(tld);
    }

    return R"((https?://|www\.)?)"
           R"((localhost|(?:[a-z0-9](?:[a-z0-9-]*[a-z0-9])?\.)+(?:)" + alternation + R"()|\d{1,3}(?:\.\d{1,3}){3}))"
           R"((?![a-z0-9-]))"
           R"((:\d{1,5})?)"
           R"(([/?#][^\s]*)?)";
}

std::optional<std::string> handle_url(const MatchSpan& span)
{
    // Neighbouring '@' belongs to an address, which the email pass reads
    if (continues_token(span.before()) || span.after() == '@')
        return std::nullopt;

    std::string path = span.group(kUrlPath);
    if (path.find('@') != std::string::npos)
        return std::nullopt;

    // Sentence punctuation after a path stays outside the rewrite
    std::string tail;
    while (!path.empty() && std::string_view(".,;:!?)]}'\"").find(path.back()) != std::string_view::npos)
    {
        tail.insert(tail.begin(), path.back());
        path.pop_back();
    }

    const std::string scheme = toLowerAscii(span.group(kUrlScheme));
    std::string out;
    if (scheme == "https://")
        out = "https ";
    else if (scheme == "http://")
        out = "http ";
    else if (scheme == "www.")
        out = "www dot ";

    out += spell_dots(span.group(kUrlHost));

    if (span.has(kUrlPort))
    {
        out += " colon ";
        out += digits_to_words(span.group(kUrlPort));
    }

    out += spell_path(path);
    return collapse_spaces(out) + tail;
}

std::string email_pattern()
{
    return R"(([A-Za-z0-9._%+-]+)@((?:[A-Za-z0-9-]+\.)+[A-Za-z]{2,})(?![A-Za-z0-9-]))";
}

std::optional<std::string> handle_email(const MatchSpan& span)
{
    const std::string local = span.group(kEmailLocal);
    if (local.empty() || local.front() == '.' || local.back() == '.')
        return std::nullopt;

    return local + " at " + spell_dots(span.group(kEmailDomain));
}

} // namespace normalization
