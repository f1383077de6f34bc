#include <catch2/catch_test_macros.hpp>
#include "rounding.hpp"

using namespace hashcalc;

TEST_CASE("Contract precision helpers", "[rounding]") {
    REQUIRE(round_usd(1234.5678) == 1234.57);
    REQUIRE(round_btc(0.123456789) == 0.12345679);
    REQUIRE(round_ratio(0.98766) == 0.9877);
    REQUIRE(round_to(1234.5, 0) == 1235.0);
}

TEST_CASE("Fixed-point message text", "[rounding]") {
    REQUIRE(format_fixed(0.0065753, 6) == "0.006575");
    REQUIRE(format_fixed(12.345, 1) == "12.3");
    REQUIRE(format_fixed(-3.0, 2) == "-3.00");
    REQUIRE(format_fixed(42.0, 0) == "42");
}
