// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "condor/option/option_spec.hpp"
#include <cmath>
#include <limits>

using namespace condor;

TEST(OptionSpecTest, IntrinsicValue) {
    EXPECT_DOUBLE_EQ(intrinsic_value(110.0, 100.0, OptionType::CALL), 10.0);
    EXPECT_DOUBLE_EQ(intrinsic_value(90.0, 100.0, OptionType::CALL), 0.0);
    EXPECT_DOUBLE_EQ(intrinsic_value(90.0, 100.0, OptionType::PUT), 10.0);
    EXPECT_DOUBLE_EQ(intrinsic_value(110.0, 100.0, OptionType::PUT), 0.0);
}

TEST(OptionSpecTest, LegDirection) {
    EXPECT_DOUBLE_EQ((OptionLeg{100.0, OptionType::CALL, PositionSide::SHORT}).direction(), 1.0);
    EXPECT_DOUBLE_EQ((OptionLeg{100.0, OptionType::PUT, PositionSide::LONG}).direction(), -1.0);
}

TEST(OptionSpecTest, ValidSpecPasses) {
    OptionSpec spec{100.0, 105.0, 0.25, 0.05, OptionType::PUT};
    EXPECT_TRUE(validate_option_spec(spec).has_value());
}

TEST(OptionSpecTest, ExpiredMaturityAccepted) {
    OptionSpec spec{100.0, 105.0, -0.1, 0.05, OptionType::CALL};
    EXPECT_TRUE(validate_option_spec(spec).has_value());
}

TEST(OptionSpecTest, RejectsNonPositiveSpot) {
    OptionSpec spec{0.0, 100.0, 1.0, 0.05, OptionType::CALL};
    auto result = validate_option_spec(spec);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidSpotPrice);
}

TEST(OptionSpecTest, RejectsNonPositiveStrike) {
    OptionSpec spec{100.0, -5.0, 1.0, 0.05, OptionType::CALL};
    auto result = validate_option_spec(spec);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidStrike);
    EXPECT_DOUBLE_EQ(result.error().value, -5.0);
}

TEST(OptionSpecTest, RejectsNonFiniteMaturity) {
    OptionSpec spec{100.0, 100.0, std::numeric_limits<double>::infinity(), 0.05, OptionType::CALL};
    auto result = validate_option_spec(spec);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidMaturity);
}

TEST(OptionSpecTest, RateBounds) {
    EXPECT_TRUE(validate_option_spec({100.0, 100.0, 1.0, 0.0, OptionType::CALL}).has_value());
    EXPECT_TRUE(validate_option_spec({100.0, 100.0, 1.0, kMaxRate, OptionType::CALL}).has_value());

    auto negative = validate_option_spec({100.0, 100.0, 1.0, -0.01, OptionType::CALL});
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error().code, ValidationErrorCode::InvalidRate);

    auto high = validate_option_spec({100.0, 100.0, 1.0, 0.25, OptionType::CALL});
    ASSERT_FALSE(high.has_value());
    EXPECT_EQ(high.error().code, ValidationErrorCode::InvalidRate);
}

TEST(PricingParamsTest, VolatilityBounds) {
    EXPECT_TRUE(validate_pricing_params(
        PricingParams(100.0, 100.0, 1.0, 0.05, OptionType::CALL, kMaxVolatility)).has_value());

    auto zero = validate_pricing_params(PricingParams(100.0, 100.0, 1.0, 0.05, OptionType::CALL, 0.0));
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().code, ValidationErrorCode::InvalidVolatility);

    auto high = validate_pricing_params(PricingParams(100.0, 100.0, 1.0, 0.05, OptionType::CALL, 2.01));
    ASSERT_FALSE(high.has_value());
    EXPECT_EQ(high.error().code, ValidationErrorCode::InvalidVolatility);
}

TEST(PricingParamsTest, SpecErrorsReportedFirst) {
    auto result = validate_pricing_params(PricingParams(-1.0, 100.0, 1.0, 0.05, OptionType::CALL, 5.0));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidSpotPrice);
}

TEST(PricingParamsTest, ConstructFromSpec) {
    OptionSpec spec{100.0, 95.0, 0.5, 0.02, OptionType::PUT};
    PricingParams params(spec, 0.3);
    EXPECT_DOUBLE_EQ(params.strike, 95.0);
    EXPECT_EQ(params.option_type, OptionType::PUT);
    EXPECT_DOUBLE_EQ(params.volatility, 0.3);
}
