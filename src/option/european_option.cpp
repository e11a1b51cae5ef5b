// SPDX-License-Identifier: MIT
#include "condor/option/european_option.hpp"
#include <cmath>

namespace condor {

// ===========================================================================
// EuropeanOptionResult
// ===========================================================================

EuropeanOptionResult::EuropeanOptionResult(const PricingParams& params)
    : params_(params)
{}

std::pair<double, double> EuropeanOptionResult::compute_d1_d2(double S) const {
    double tau = params_.maturity;
    double sigma = params_.volatility;
    double d1 = bs_d1(S, params_.strike, tau, sigma, params_.rate);
    double d2 = d1 - sigma * std::sqrt(tau);
    return {d1, d2};
}

double EuropeanOptionResult::value() const {
    return value_at(params_.spot);
}

double EuropeanOptionResult::value_at(double S) const {
    return bs_price(S, params_.strike, params_.maturity, params_.volatility,
                    params_.rate, params_.option_type);
}

double EuropeanOptionResult::delta() const {
    if (degenerate()) {
        return 0.0;
    }

    auto [d1, d2] = compute_d1_d2(params_.spot);
    if (params_.option_type == OptionType::PUT) {
        return norm_cdf(d1) - 1.0;
    }
    return norm_cdf(d1);
}

double EuropeanOptionResult::gamma() const {
    if (degenerate()) {
        return 0.0;
    }

    double S = params_.spot;
    double sigma = params_.volatility;
    auto [d1, d2] = compute_d1_d2(S);
    return norm_pdf(d1) / (S * sigma * std::sqrt(params_.maturity));
}

double EuropeanOptionResult::vega() const {
    if (degenerate()) {
        return 0.0;
    }

    auto [d1, d2] = compute_d1_d2(params_.spot);
    return params_.spot * norm_pdf(d1) * std::sqrt(params_.maturity) / 100.0;
}

double EuropeanOptionResult::theta() const {
    if (degenerate()) {
        return 0.0;
    }

    double tau = params_.maturity;
    double sigma = params_.volatility;
    double S = params_.spot;
    double K = params_.strike;
    double r = params_.rate;

    auto [d1, d2] = compute_d1_d2(S);
    double exp_rt = std::exp(-r * tau);

    // Common term: -S·φ(d1)·σ/(2√τ)
    double common = -S * norm_pdf(d1) * sigma / (2.0 * std::sqrt(tau));

    if (params_.option_type == OptionType::PUT) {
        return (common + r * K * exp_rt * norm_cdf(-d2)) / kDaysPerYear;
    }
    return (common - r * K * exp_rt * norm_cdf(d2)) / kDaysPerYear;
}

Greeks EuropeanOptionResult::greeks() const {
    return Greeks{delta(), gamma(), theta(), vega()};
}

// ===========================================================================
// EuropeanOptionSolver
// ===========================================================================

EuropeanOptionSolver::EuropeanOptionSolver(const PricingParams& params)
    : params_(params)
{}

std::expected<EuropeanOptionSolver, ValidationError>
EuropeanOptionSolver::create(const PricingParams& params) noexcept {
    auto validation = validate_pricing_params(params);
    if (!validation.has_value()) {
        return std::unexpected(validation.error());
    }
    return EuropeanOptionSolver(params);
}

std::expected<EuropeanOptionResult, ValidationError> EuropeanOptionSolver::solve() const {
    return EuropeanOptionResult(params_);
}

// ===========================================================================
// Leg valuation
// ===========================================================================

LegValuation value_leg(double spot, const OptionLeg& leg, double tau,
                       double sigma, double rate) {
    EuropeanOptionResult result(PricingParams(spot, leg.strike, tau, rate,
                                              leg.option_type, sigma));
    return LegValuation{result.value(), result.greeks()};
}

}  // namespace condor
