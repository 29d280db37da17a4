#include <catch2/catch_test_macros.hpp>

#include <string>

#include "normalization/Diagnostics.hpp"

using normalization::Diagnostics;

TEST_CASE("Previews escape line breaks and control bytes", "[diagnostics]")
{
    Diagnostics::SetMaxPreview(160);
    REQUIRE(Diagnostics::Preview("a\nb\tc\r") == "a\\nb\\tc\\r");
    REQUIRE(Diagnostics::Preview(std::string("x\x01y")) == "x\\x01y");
    REQUIRE(Diagnostics::Preview("") == "");
}

TEST_CASE("Long previews are cut and report their size", "[diagnostics]")
{
    Diagnostics::SetMaxPreview(4);
    REQUIRE(Diagnostics::Preview("abcdefgh") == "abcd... (8 bytes)");
    REQUIRE(Diagnostics::Preview("abcd") == "abcd");

    SECTION("a multi-byte character is never split")
    {
        // "ab" + U+20AC (3 bytes) + "c"
        REQUIRE(Diagnostics::Preview("ab€c") == "ab... (6 bytes)");
        Diagnostics::SetMaxPreview(5);
        REQUIRE(Diagnostics::Preview("ab€c") == "ab€... (6 bytes)");
    }

    Diagnostics::SetMaxPreview(0);
    REQUIRE(Diagnostics::MaxPreview() == 1);
    Diagnostics::SetMaxPreview(160);
}

TEST_CASE("Verbose switch", "[diagnostics]")
{
    Diagnostics::SetVerbose(true);
    REQUIRE(Diagnostics::IsVerbose());
    Diagnostics::SetVerbose(false);
    REQUIRE_FALSE(Diagnostics::IsVerbose());
}
