#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "price_curve.hpp"
#include "errors.hpp"
#include <cmath>

using namespace hashcalc;
using Catch::Matchers::WithinAbs;

namespace {

PriceCurveParams two_anchor_params(InterpolationMode mode) {
    PriceCurveParams params;
    params.start_price = 97000.33;
    params.months = 24;
    params.anchors[1] = 112345.67;
    params.mode = mode;
    return params;
}

} // anonymous namespace

// ============================================================================
// Anchors
// ============================================================================

TEST_CASE("Month anchors default month 0 to the start price", "[price][anchors]") {
    AnchorSet anchors{{1, 120000.0}, {2, 150000.0}};
    auto month_anchors = build_month_anchors(100000.0, 36, anchors);

    REQUIRE(month_anchors.size() == 3);
    REQUIRE(month_anchors.at(0) == 100000.0);
    REQUIRE(month_anchors.at(12) == 120000.0);
    REQUIRE(month_anchors.at(24) == 150000.0);
}

TEST_CASE("Year 0 anchor overrides the start price", "[price][anchors]") {
    auto month_anchors = build_month_anchors(100000.0, 36, AnchorSet{{0, 90000.0}});
    REQUIRE(month_anchors.at(0) == 90000.0);
}

TEST_CASE("Anchor on the horizon is pinned to the last month", "[price][anchors]") {
    auto month_anchors = build_month_anchors(100000.0, 24, AnchorSet{{2, 200000.0}, {3, 300000.0}});

    REQUIRE(month_anchors.size() == 2);
    REQUIRE(month_anchors.at(23) == 200000.0);
    REQUIRE(month_anchors.find(24) == month_anchors.end());
    REQUIRE(month_anchors.find(36) == month_anchors.end());
}

// ============================================================================
// Interpolation
// ============================================================================

TEST_CASE("Linear interpolation is the cent-rounded midpoint at month 6", "[price][linear]") {
    auto prices = generate_price_curve(two_anchor_params(InterpolationMode::LINEAR));

    REQUIRE(prices.size() == 24);
    REQUIRE(prices[0] == 97000.33);
    REQUIRE(prices[12] == 112345.67);
    double expected = std::round((97000.33 + 0.5 * (112345.67 - 97000.33)) * 100.0) / 100.0;
    REQUIRE_THAT(prices[6], WithinAbs(expected, 1e-9));
    REQUIRE_THAT(prices[6], WithinAbs(104673.0, 1e-9));
}

TEST_CASE("Linear interpolation holds the last anchor afterwards", "[price][linear]") {
    auto prices = generate_price_curve(two_anchor_params(InterpolationMode::LINEAR));
    for (size_t m = 12; m < prices.size(); ++m) {
        REQUIRE(prices[m] == 112345.67);
    }
}

TEST_CASE("Linear curve is monotone between rising anchors", "[price][linear]") {
    auto prices = generate_price_curve(two_anchor_params(InterpolationMode::LINEAR));
    for (size_t m = 1; m <= 12; ++m) {
        REQUIRE(prices[m] >= prices[m - 1]);
    }
}

TEST_CASE("Step interpolation is flat between anchors", "[price][step]") {
    auto prices = generate_price_curve(two_anchor_params(InterpolationMode::STEP));

    for (size_t m = 0; m < 12; ++m) {
        REQUIRE(prices[m] == 97000.33);
    }
    for (size_t m = 12; m < 24; ++m) {
        REQUIRE(prices[m] == 112345.67);
    }
}

TEST_CASE("Custom curve is truncated or padded to the horizon", "[price][custom]") {
    PriceCurveParams params;
    params.start_price = 50000.0;
    params.months = 4;
    params.mode = InterpolationMode::CUSTOM;

    SECTION("longer series is truncated") {
        params.custom_prices = {1.0, 2.0, 3.0, 4.0, 5.0, 6.0};
        auto prices = generate_price_curve(params);
        REQUIRE(prices == std::vector<double>{1.0, 2.0, 3.0, 4.0});
    }

    SECTION("shorter series repeats its last value") {
        params.custom_prices = {60000.0, 61000.0};
        auto prices = generate_price_curve(params);
        REQUIRE(prices == std::vector<double>{60000.0, 61000.0, 61000.0, 61000.0});
    }

    SECTION("empty series falls back to the start price") {
        auto prices = generate_price_curve(params);
        REQUIRE(prices == std::vector<double>(4, 50000.0));
    }
}

// ============================================================================
// Noise
// ============================================================================

TEST_CASE("Deterministic noise stays within [-1, 1]", "[price][noise]") {
    for (uint64_t i = 0; i < 500; ++i) {
        double n = deterministic_noise(42, i);
        REQUIRE(n >= -1.0);
        REQUIRE(n <= 1.0);
    }
}

TEST_CASE("Noise is reproducible for a seed and changes with the seed", "[price][noise]") {
    PriceCurveParams params = two_anchor_params(InterpolationMode::LINEAR);
    params.noise_enabled = true;
    params.noise_seed = 7;

    auto first = generate_price_curve(params);
    auto second = generate_price_curve(params);
    REQUIRE(first == second);

    params.noise_seed = 8;
    auto other = generate_price_curve(params);
    REQUIRE(first != other);
}

TEST_CASE("Noise perturbs prices within the amplitude", "[price][noise]") {
    PriceCurveParams clean = two_anchor_params(InterpolationMode::LINEAR);
    PriceCurveParams noisy = clean;
    noisy.noise_enabled = true;
    noisy.noise_amplitude = 0.05;

    auto base = generate_price_curve(clean);
    auto perturbed = generate_price_curve(noisy);

    REQUIRE(perturbed.size() == base.size());
    for (size_t i = 0; i < base.size(); ++i) {
        REQUIRE(perturbed[i] >= base[i] * 0.95 - 0.01);
        REQUIRE(perturbed[i] <= base[i] * 1.05 + 0.01);
    }
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("Price curve rejects invalid parameters", "[price][error]") {
    PriceCurveParams params;
    params.start_price = 100000.0;

    SECTION("zero months") {
        params.months = 0;
        REQUIRE_THROWS_AS(generate_price_curve(params), ValidationError);
    }

    SECTION("negative start price") {
        params.start_price = -1.0;
        REQUIRE_THROWS_AS(generate_price_curve(params), ValidationError);
    }
}

TEST_CASE("Interpolation mode names", "[price][mode]") {
    REQUIRE(parse_interpolation_mode("linear") == InterpolationMode::LINEAR);
    REQUIRE(parse_interpolation_mode("step") == InterpolationMode::STEP);
    REQUIRE(parse_interpolation_mode("custom") == InterpolationMode::CUSTOM);
    REQUIRE(to_string(InterpolationMode::STEP) == "step");
    REQUIRE_THROWS_AS(parse_interpolation_mode("cubic"), ValidationError);
}
