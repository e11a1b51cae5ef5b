// SPDX-License-Identifier: MIT
/**
 * @file greeks_aggregator.hpp
 * @brief Position-level Greeks of an iron condor
 *
 * Legs are supplied as independent per-share Greek vectors (typically
 * priced elsewhere). Short legs count positively and long legs negatively,
 * each scaled by contracts * 100 shares. A field missing from a leg's
 * vector contributes zero rather than failing the aggregation.
 */

#pragma once

#include "condor/option/greeks.hpp"
#include "condor/strategy/iron_condor.hpp"
#include "condor/support/error_types.hpp"
#include <array>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace condor {

/// Greeks of one leg as supplied by the caller; any field may be absent
struct LegGreeksInput {
    std::optional<double> delta;
    std::optional<double> gamma;
    std::optional<double> theta;
    std::optional<double> vega;

    LegGreeksInput() = default;
    LegGreeksInput(const Greeks& g)  // NOLINT(google-explicit-constructor)
        : delta(g.delta), gamma(g.gamma), theta(g.theta), vega(g.vega) {}

    /// Missing fields resolved to 0
    Greeks resolved() const {
        return Greeks{delta.value_or(0.0), gamma.value_or(0.0),
                      theta.value_or(0.0), vega.value_or(0.0)};
    }
};

/// Four leg inputs in CondorLeg order
using CondorGreeksInput = std::array<LegGreeksInput, 4>;

enum class GammaRisk {
    Low,
    Moderate,
    High
};

std::string_view to_string(GammaRisk risk);

/// Qualitative reading of the portfolio Greeks
struct RiskProfile {
    bool delta_neutral = false;  ///< |delta| < 5
    bool positive_theta = false; ///< theta > 0
    bool negative_vega = false;  ///< vega < 0
    GammaRisk gamma_risk = GammaRisk::Low;  ///< |gamma| < 0.1 low, < 0.5 moderate
};

/// One-day P&L estimates in dollars
struct DailyEstimates {
    double theta_decay_pnl = 0.0;
    double pnl_if_underlying_up_1pct = 0.0;
    double pnl_if_underlying_down_1pct = 0.0;
};

/// Human-readable sentence per Greek
struct GreeksInterpretation {
    std::string delta;
    std::string theta;
    std::string vega;
    std::string gamma;
};

/// Aggregated Greeks of the whole position
struct PortfolioGreeksReport {
    Greeks portfolio;                 ///< Sum of the leg contributions
    std::array<Greeks, 4> legs;       ///< Signed, scaled contribution per CondorLeg
    RiskProfile risk_profile;
    DailyEstimates daily_estimates;
    GreeksInterpretation interpretation;
};

/// Aggregate caller-supplied leg Greeks
///
/// @param legs Per-share Greeks of each leg in CondorLeg order
/// @param contracts Number of condors, must be positive
/// @return Report, or InvalidContracts when contracts <= 0
std::expected<PortfolioGreeksReport, ValidationError>
aggregate_condor_greeks(const CondorGreeksInput& legs, int contracts);

/// Price each leg with Black-Scholes and aggregate the result
std::expected<PortfolioGreeksReport, ValidationError>
aggregate_condor_greeks(const CondorStrikes& strikes, double spot, double tau, double sigma,
                        double rate, int contracts);

}  // namespace condor
