#include "TextUtils.hpp"
#include <utf8proc.h>

namespace normalization
{

std::u32string utf8ToUtf32(const std::string& utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.c_str());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
            break;
        result.push_back(static_cast<char32_t>(codepoint));
        pos += bytes;
    }
    return result;
}

std::string encodeCodepoint(char32_t cp)
{
    utf8proc_uint8_t buffer[4];
    utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
    if (bytes <= 0)
        return {};
    return std::string(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
}

std::size_t decodeCodepoint(std::string_view text, std::size_t pos, char32_t& cp)
{
    if (pos >= text.size())
    {
        cp = 0;
        return 0;
    }

    utf8proc_int32_t codepoint = -1;
    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data() + pos);
    utf8proc_ssize_t bytes = utf8proc_iterate(str, static_cast<utf8proc_ssize_t>(text.size() - pos), &codepoint);
    if (bytes <= 0 || codepoint < 0)
    {
        cp = U'\uFFFD';
        return 1;
    }
    cp = static_cast<char32_t>(codepoint);
    return static_cast<std::size_t>(bytes);
}

bool isSpaceSeparator(char32_t cp)
{
    return utf8proc_category(static_cast<utf8proc_int32_t>(cp)) == UTF8PROC_CATEGORY_ZS;
}

std::string toLowerAscii(std::string_view text)
{
    std::string out(text);
    for (char& c : out)
    {
        if (isAsciiUpper(c))
            c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

std::string trimWhitespace(std::string_view text)
{
    const char* ws = " \t\r\n\f\v";
    auto first = text.find_first_not_of(ws);
    if (first == std::string_view::npos)
        return {};
    auto last = text.find_last_not_of(ws);
    return std::string(text.substr(first, last - first + 1));
}

void replaceAll(std::string& text, std::string_view from, std::string_view to)
{
    if (from.empty())
        return;
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos)
    {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string escapeRegex(std::string_view literal)
{
    static const std::string_view special = R"(\.^$|()[]*+?{}-/)";
    std::string out;
    out.reserve(literal.size() * 2);
    for (char c : literal)
    {
        if (special.find(c) != std::string_view::npos)
            out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

} // namespace normalization
