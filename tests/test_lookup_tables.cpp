#include <catch2/catch_test_macros.hpp>

#include <string>

#include <toml++/toml.h>

#include "normalization/LookupTables.hpp"
#include "normalization/TextPipeline.hpp"
#include "utils/ErrorReporter.hpp"

using namespace normalization;

TEST_CASE("Default tables cover the common units and currencies", "[lookup_tables]")
{
    const auto tables = LookupTables::defaults();
    REQUIRE(tables == LookupTables::defaults());

    const UnitEntry* km = tables->findUnit("KM");
    REQUIRE(km != nullptr);
    REQUIRE(km->singular == "kilometer");
    REQUIRE(km->plural == "kilometers");

    const UnitEntry* mph = tables->findUnit("mph");
    REQUIRE(mph != nullptr);
    REQUIRE(mph->is_rate);

    REQUIRE(tables->findUnit("m")->attached_only);
    REQUIRE(tables->findUnit("gb")->data_unit);
    REQUIRE(tables->findUnit("furlong") == nullptr);

    const CurrencyEntry* pound = tables->findCurrency("£");
    REQUIRE(pound != nullptr);
    REQUIRE(pound->minor_plural == "pence");
    REQUIRE(tables->findCurrency("₹") == nullptr);

    REQUIRE(*tables->findSymbol("%") == " percent ");
    REQUIRE(*tables->findCjkPunctuation("。") == ".");
}

TEST_CASE("Alternation keys come longest first", "[lookup_tables]")
{
    const auto keys = LookupTables::defaults()->unitKeysLongestFirst();
    REQUIRE_FALSE(keys.empty());
    for (std::size_t i = 1; i < keys.size(); ++i)
        REQUIRE(keys[i - 1].size() >= keys[i].size());
}

TEST_CASE("Regular plurals for table entries", "[lookup_tables]")
{
    REQUIRE(default_plural("meter") == "meters");
    REQUIRE(default_plural("inch") == "inches");
    REQUIRE(default_plural("foot") == "feet");
    REQUIRE(default_plural("penny") == "pennies");
    REQUIRE(default_plural("day") == "days");
    REQUIRE(default_plural("hertz") == "hertz");

    REQUIRE(plural_unit_phrase("nautical mile", false) == "nautical miles");
    REQUIRE(plural_unit_phrase("foot per second", true) == "feet per second");
}

TEST_CASE("Overrides extend the defaults and skip bad entries", "[lookup_tables]")
{
    utils::ErrorReporter::ClearErrors();

    const toml::table overrides = toml::parse(R"(
        [currency."₹"]
        major = "rupee"
        minor = "paisa"
        minor_plural = "paise"

        [units.nmi]
        word = "nautical mile"

        [units.broken]
        plural = "no singular given"

        [symbols]
        "§" = " section "
        "too long" = " nope "

        [abbreviations."Prof."]
        expansion = "Professor"
        gate = "before_capital"
    )");

    const auto tables = LookupTables::withOverrides(overrides);

    const CurrencyEntry* rupee = tables->findCurrency("₹");
    REQUIRE(rupee != nullptr);
    REQUIRE(rupee->major_plural == "rupees");
    REQUIRE(rupee->minor_plural == "paise");

    REQUIRE(tables->findUnit("NMI")->plural == "nautical miles");
    REQUIRE(tables->findUnit("broken") == nullptr);
    REQUIRE(tables->findUnit("kg") != nullptr);

    REQUIRE(*tables->findSymbol("§") == " section ");
    REQUIRE(tables->findSymbol("too long") == nullptr);

    const auto warnings = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(warnings.size() == 2);
    for (const auto& warning : warnings)
        REQUIRE(warning.category == utils::ErrorCategory::Configuration);

    REQUIRE(LookupTables::defaults()->findCurrency("₹") == nullptr);
}

TEST_CASE("A pipeline built on overridden tables uses them", "[lookup_tables]")
{
    const toml::table overrides = toml::parse(R"(
        [currency."₹"]
        major = "rupee"
        minor = "paisa"
        minor_plural = "paise"

        [units.nmi]
        word = "nautical mile"

        [abbreviations."Prof."]
        expansion = "Professor"
        gate = "before_capital"
    )");

    const TextPipeline pipeline(LookupTables::withOverrides(overrides));
    NormalizationOptions options;
    options.unit_normalization = true;

    REQUIRE(pipeline.process("₹5", options) == "five rupees");
    REQUIRE(pipeline.process("₹1.50", options) == "one rupee and fifty paise");
    REQUIRE(pipeline.process("10nmi", options) == "ten nautical miles");
    REQUIRE(pipeline.process("Prof. Xavier", options) == "Professor Xavier");
}
