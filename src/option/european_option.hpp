// SPDX-License-Identifier: MIT
/**
 * @file european_option.hpp
 * @brief European option pricing with closed-form Black-Scholes formulas
 *
 * Provides EuropeanOptionResult (satisfies OptionResultWithVega) and
 * EuropeanOptionSolver for pricing a single condor leg with its Greeks.
 */

#pragma once

#include "condor/math/normal_distribution.hpp"
#include "condor/option/greeks.hpp"
#include "condor/option/option_concepts.hpp"
#include "condor/option/option_spec.hpp"
#include <cmath>
#include <expected>
#include <utility>

namespace condor {

/// Calendar days used to express theta as per-day decay
inline constexpr double kDaysPerYear = 365.0;

/// Black-Scholes d1 = [ln(S/K) + (r + sigma^2/2)tau] / (sigma*sqrt(tau))
inline double bs_d1(double spot, double strike, double tau, double sigma, double rate) {
    double sigma_sqrt_tau = sigma * std::sqrt(tau);
    return (std::log(spot / strike) + (rate + 0.5 * sigma * sigma) * tau) / sigma_sqrt_tau;
}

/// Black-Scholes European option price
inline double bs_price(double spot, double strike, double tau, double sigma, double rate,
                       OptionType option_type) {
    // Edge cases: zero maturity -> intrinsic, zero vol -> discounted intrinsic
    if (tau <= 0.0 || sigma <= 0.0) {
        if (tau <= 0.0) return intrinsic_value(spot, strike, option_type);
        return intrinsic_value(spot, strike * std::exp(-rate * tau), option_type);
    }
    double d1 = bs_d1(spot, strike, tau, sigma, rate);
    double d2 = d1 - sigma * std::sqrt(tau);
    double exp_rt = std::exp(-rate * tau);
    if (option_type == OptionType::PUT) {
        return strike * exp_rt * norm_cdf(-d2) - spot * norm_cdf(-d1);
    } else {
        return spot * norm_cdf(d1) - strike * exp_rt * norm_cdf(d2);
    }
}

/**
 * @brief European option pricing result with closed-form Greeks
 *
 * Stores the pricing parameters and computes price/Greeks analytically.
 * With maturity <= 0 the price is intrinsic and every Greek is zero; a
 * non-positive volatility likewise has no time premium to be sensitive to.
 *
 * Thread-safety: All methods are const and thread-safe.
 */
class EuropeanOptionResult {
public:
    explicit EuropeanOptionResult(const PricingParams& params);

    /// Option value at current spot
    double value() const;

    /// Option value at arbitrary spot price
    double value_at(double S) const;

    /// Delta: N(d1) for calls, N(d1) - 1 for puts
    double delta() const;

    /// Gamma: n(d1) / (S sigma sqrt(T))
    double gamma() const;

    /// Vega per one volatility point (1%)
    double vega() const;

    /// Theta per calendar day
    double theta() const;

    /// All four Greeks at once
    Greeks greeks() const;

    // Parameter accessors
    double spot() const { return params_.spot; }
    double strike() const { return params_.strike; }
    double maturity() const { return params_.maturity; }
    double volatility() const { return params_.volatility; }
    OptionType option_type() const { return params_.option_type; }

private:
    /// True when there is no time premium left
    bool degenerate() const { return params_.maturity <= 0.0 || params_.volatility <= 0.0; }

    /// Compute d1, d2 for given spot price
    std::pair<double, double> compute_d1_d2(double S) const;

    PricingParams params_;
};

/**
 * @brief European option solver using closed-form Black-Scholes
 */
class EuropeanOptionSolver {
public:
    /// Construct solver from pricing parameters (no validation)
    explicit EuropeanOptionSolver(const PricingParams& params);

    /// Factory with validation via validate_pricing_params()
    static std::expected<EuropeanOptionSolver, ValidationError>
    create(const PricingParams& params) noexcept;

    /// Compute European option price and Greeks (always succeeds)
    std::expected<EuropeanOptionResult, ValidationError> solve() const;

private:
    PricingParams params_;
};

static_assert(OptionResultWithVega<EuropeanOptionResult>);
static_assert(OptionSolver<EuropeanOptionSolver>);

/// Price and Greeks of one leg, as used by the condor analytics
struct LegValuation {
    double price = 0.0;
    Greeks greeks;
};

/// Value a single leg (no validation; callers validate ranges first)
LegValuation value_leg(double spot, const OptionLeg& leg, double tau,
                       double sigma, double rate);

}  // namespace condor
