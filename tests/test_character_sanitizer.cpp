#include <catch2/catch_test_macros.hpp>

#include "normalization/CharacterSanitizer.hpp"
#include "normalization/LookupTables.hpp"
#include "normalization/PassRegistry.hpp"

using namespace normalization;

namespace
{

std::string abbreviations(const std::string& text)
{
    static const PassRegistry registry(LookupTables::defaults());
    return registry.find(PassKind::Abbreviation).apply(text);
}

} // namespace

TEST_CASE("Typographic quotes become ASCII", "[sanitizer]")
{
    REQUIRE(normalize_quotes("“Hi” ‘there’ «x»") == "\"Hi\" 'there' \"x\"");
    REQUIRE(normalize_quotes("「引用」（注）") == "\"引用\"(注)");
    REQUIRE(normalize_quotes("plain \"ascii\" text") == "plain \"ascii\" text");
}

TEST_CASE("CJK punctuation gets a Western mark and a space", "[sanitizer]")
{
    const auto tables = LookupTables::defaults();
    REQUIRE(replace_cjk_punctuation("你好，世界。", *tables) == "你好, 世界. ");
    REQUIRE(replace_cjk_punctuation("本当？はい！", *tables) == "本当? はい! ");
    REQUIRE(replace_cjk_punctuation("a–b", *tables) == "a- b");
}

TEST_CASE("Leftover symbols are spoken or dropped", "[sanitizer]")
{
    const auto tables = LookupTables::defaults();
    REQUIRE(collapse_whitespace(replace_symbols("50% & more", *tables)) == "50 percent and more");
    REQUIRE(collapse_whitespace(replace_symbols("a/b = c + d", *tables)) == "a slash b equals c plus d");
    REQUIRE(collapse_whitespace(replace_symbols("~*hello*~", *tables)) == "hello");
    REQUIRE(replace_symbols("no symbols", *tables) == "no symbols");
}

TEST_CASE("Title abbreviations follow their capitalisation gate", "[sanitizer]")
{
    REQUIRE(abbreviations("Dr. Smith is in") == "Doctor Smith is in");
    REQUIRE(abbreviations("ask the Dr. about it") == "ask the Dr. about it");
    REQUIRE(abbreviations("Mr. and Mrs. Jones") == "Mister and Mrs Jones");
    REQUIRE(abbreviations("Ms. Lee") == "Miss Lee");
    REQUIRE(abbreviations("MR. SMITH") == "Mister SMITH");
    REQUIRE(abbreviations("apples, pears, etc. and more") == "apples, pears, etc and more");
    REQUIRE(abbreviations("apples, pears, etc. The end") == "apples, pears, etc. The end");
}

TEST_CASE("Dotted acronyms become hyphenated", "[sanitizer]")
{
    REQUIRE(abbreviations("the U.S.A. is big") == "the U-S-A is big");
    REQUIRE(abbreviations("born in the U.S.A.") == "born in the U-S-A.");
    REQUIRE(abbreviations("No. 5") == "No. 5");
}

TEST_CASE("Whitespace collapses and blank lines disappear", "[sanitizer]")
{
    REQUIRE(collapse_whitespace("  a \t b\n\n   \n c  ") == "a b c");
    REQUIRE(collapse_whitespace("line one\r\nline two") == "line one line two");
    REQUIRE(collapse_whitespace("a\u00A0\u00A0b") == "a b");
    REQUIRE(collapse_whitespace("全角\u3000スペース") == "全角 スペース");
    REQUIRE(collapse_whitespace("") == "");
    REQUIRE(collapse_whitespace(" \n\t ") == "");
}
