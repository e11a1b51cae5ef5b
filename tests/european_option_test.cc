// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "condor/option/european_option.hpp"
#include <cmath>

namespace condor {
namespace {

// Test fixture for European option tests
class EuropeanOptionTest : public ::testing::Test {
protected:
    static constexpr double tolerance = 1e-6;

    static EuropeanOptionResult make(double S, double K, double T, double r, double sigma,
                                     OptionType type) {
        return EuropeanOptionResult(PricingParams(S, K, T, r, type, sigma));
    }
};

// ============================================================================
// Black-Scholes Pricing Tests
// ============================================================================

TEST_F(EuropeanOptionTest, ATMCallPricing) {
    auto call = make(100.0, 100.0, 1.0, 0.05, 0.2, OptionType::CALL);
    EXPECT_NEAR(call.value(), 10.4506, 0.001);
}

TEST_F(EuropeanOptionTest, ATMPutPricing) {
    auto put = make(100.0, 100.0, 1.0, 0.05, 0.2, OptionType::PUT);
    EXPECT_NEAR(put.value(), 5.5735, 0.001);
}

TEST_F(EuropeanOptionTest, ITMCallAboveIntrinsic) {
    auto call = make(110.0, 100.0, 1.0, 0.05, 0.2, OptionType::CALL);
    EXPECT_GT(call.value(), 10.0);
    EXPECT_NEAR(call.value(), 17.6630, 0.001);
}

TEST_F(EuropeanOptionTest, PutCallParityAtTheMoney) {
    // C - P = S - K e^(-rT) for S = K over a spread of rates, vols, maturities
    for (double r : {0.0, 0.05, 0.20}) {
        for (double sigma : {0.05, 0.2, 1.5}) {
            for (double T : {0.01, 30.0 / 365.0, 2.0}) {
                auto call = make(100.0, 100.0, T, r, sigma, OptionType::CALL);
                auto put = make(100.0, 100.0, T, r, sigma, OptionType::PUT);
                double rhs = 100.0 - 100.0 * std::exp(-r * T);
                EXPECT_NEAR(call.value() - put.value(), rhs, tolerance)
                    << "r=" << r << " sigma=" << sigma << " T=" << T;
            }
        }
    }
}

TEST_F(EuropeanOptionTest, PutCallParityOTM) {
    auto call = make(90.0, 100.0, 0.5, 0.03, 0.25, OptionType::CALL);
    auto put = make(90.0, 100.0, 0.5, 0.03, 0.25, OptionType::PUT);
    EXPECT_NEAR(call.value() - put.value(), 90.0 - 100.0 * std::exp(-0.03 * 0.5), tolerance);
}

// ============================================================================
// Expiry and degenerate inputs
// ============================================================================

TEST_F(EuropeanOptionTest, ZeroMaturityIsIntrinsic) {
    EXPECT_DOUBLE_EQ(make(110.0, 100.0, 0.0, 0.05, 0.2, OptionType::CALL).value(), 10.0);
    EXPECT_DOUBLE_EQ(make(90.0, 100.0, 0.0, 0.05, 0.2, OptionType::CALL).value(), 0.0);
    EXPECT_DOUBLE_EQ(make(90.0, 100.0, 0.0, 0.05, 0.2, OptionType::PUT).value(), 10.0);
    EXPECT_DOUBLE_EQ(make(90.0, 100.0, -0.5, 0.05, 0.2, OptionType::PUT).value(), 10.0);
}

TEST_F(EuropeanOptionTest, ShortMaturityConvergesToIntrinsic) {
    const double T = 1e-10;
    EXPECT_NEAR(make(105.0, 100.0, T, 0.05, 0.2, OptionType::CALL).value(), 5.0, 1e-6);
    EXPECT_NEAR(make(95.0, 100.0, T, 0.05, 0.2, OptionType::CALL).value(), 0.0, 1e-6);
    EXPECT_NEAR(make(95.0, 100.0, T, 0.05, 0.2, OptionType::PUT).value(), 5.0, 1e-6);
    EXPECT_NEAR(make(105.0, 100.0, T, 0.05, 0.2, OptionType::PUT).value(), 0.0, 1e-6);
}

TEST_F(EuropeanOptionTest, ExpiredGreeksAreZero) {
    auto call = make(100.0, 100.0, 0.0, 0.05, 0.2, OptionType::CALL);
    Greeks g = call.greeks();
    EXPECT_EQ(g.delta, 0.0);
    EXPECT_EQ(g.gamma, 0.0);
    EXPECT_EQ(g.theta, 0.0);
    EXPECT_EQ(g.vega, 0.0);
}

TEST_F(EuropeanOptionTest, ZeroVolatilityFallsBackWithoutNaN) {
    auto call = make(110.0, 100.0, 1.0, 0.05, 0.0, OptionType::CALL);
    EXPECT_NEAR(call.value(), 110.0 - 100.0 * std::exp(-0.05), 1e-12);
    EXPECT_EQ(call.gamma(), 0.0);
    EXPECT_FALSE(std::isnan(call.delta()));
}

// ============================================================================
// Greeks
// ============================================================================

TEST_F(EuropeanOptionTest, GreeksATM) {
    auto call = make(100.0, 100.0, 1.0, 0.05, 0.2, OptionType::CALL);
    auto put = make(100.0, 100.0, 1.0, 0.05, 0.2, OptionType::PUT);

    EXPECT_NEAR(call.delta(), 0.6368306511756191, 1e-9);
    EXPECT_NEAR(put.delta(), -0.3631693488243809, 1e-9);
    EXPECT_NEAR(call.gamma(), 0.018762017345846895, 1e-12);
    EXPECT_DOUBLE_EQ(call.gamma(), put.gamma());

    // Vega per vol point, theta per calendar day
    EXPECT_NEAR(call.vega(), 0.3752403469169379, 1e-9);
    EXPECT_NEAR(call.theta(), -0.01757267820941972, 1e-9);
    EXPECT_NEAR(put.theta(), -0.004542138147766099, 1e-9);
}

TEST_F(EuropeanOptionTest, DeltaCallPutDifferByOne) {
    auto call = make(4500.0, 4550.0, 30.0 / 365.0, 0.05, 0.2, OptionType::CALL);
    auto put = make(4500.0, 4550.0, 30.0 / 365.0, 0.05, 0.2, OptionType::PUT);
    EXPECT_NEAR(call.delta() - put.delta(), 1.0, 1e-12);
}

TEST_F(EuropeanOptionTest, VegaMatchesFiniteDifference) {
    const double S = 100.0, K = 105.0, T = 0.25, r = 0.03, sigma = 0.3, h = 1e-5;
    auto up = make(S, K, T, r, sigma + h, OptionType::CALL);
    auto down = make(S, K, T, r, sigma - h, OptionType::CALL);
    double fd_per_point = (up.value() - down.value()) / (2.0 * h) / 100.0;
    EXPECT_NEAR(make(S, K, T, r, sigma, OptionType::CALL).vega(), fd_per_point, 1e-6);
}

// ============================================================================
// Solver factory
// ============================================================================

TEST_F(EuropeanOptionTest, CreateRejectsOutOfRangeVolatility) {
    auto result = EuropeanOptionSolver::create(
        PricingParams(100.0, 100.0, 1.0, 0.05, OptionType::CALL, 2.5));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidVolatility);
}

TEST_F(EuropeanOptionTest, CreateAndSolve) {
    auto solver = EuropeanOptionSolver::create(
        PricingParams(100.0, 100.0, 1.0, 0.05, OptionType::PUT, 0.2));
    ASSERT_TRUE(solver.has_value());
    auto result = solver->solve();
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->value(), 5.5735, 0.001);
    EXPECT_EQ(result->option_type(), OptionType::PUT);
}

TEST_F(EuropeanOptionTest, ValueLegMatchesResult) {
    OptionLeg leg{4450.0, OptionType::PUT, PositionSide::SHORT};
    LegValuation v = value_leg(4500.0, leg, 30.0 / 365.0, 0.2, 0.05);
    auto direct = make(4500.0, 4450.0, 30.0 / 365.0, 0.05, 0.2, OptionType::PUT);
    EXPECT_DOUBLE_EQ(v.price, direct.value());
    EXPECT_DOUBLE_EQ(v.greeks.delta, direct.delta());
    EXPECT_NEAR(v.price, 71.6220320662801, 1e-8);
}

}  // namespace
}  // namespace condor
