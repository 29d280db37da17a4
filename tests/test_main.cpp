// Catch2WithMain provides main(); this file only holds the build smoke test

#include <catch2/catch_test_macros.hpp>

#include "normalization/PassRegistry.hpp"

TEST_CASE("Pass order is declared once and complete", "[smoke]") {
    using normalization::PassKind;

    REQUIRE(normalization::kPassOrder.front() == PassKind::Url);
    REQUIRE(normalization::kPassOrder.back() == PassKind::Whitespace);
    REQUIRE_FALSE(normalization::nextPass(PassKind::Whitespace).has_value());
}
