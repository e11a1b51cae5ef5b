// SPDX-License-Identifier: MIT
#pragma once

#include "condor/strategy/strike_optimizer.hpp"
#include <cstddef>

namespace condor {

/// Volatility assumed when a request does not quote one
inline constexpr double kDefaultVolatility = 0.20;

/// Risk-free rate assumed when a request does not quote one
inline constexpr double kDefaultRate = 0.05;

/// Configuration for condor analysis
struct AnalyzerConfig {
    double days_per_year = 365.0;            ///< Day count converting days to years
    size_t payoff_samples = 20;              ///< Points on the payoff curve
    double payoff_lower_factor = 0.85;       ///< Curve starts at this fraction of spot
    double payoff_upper_factor = 1.15;       ///< Curve ends at this fraction of spot
    double recommendation_target = 0.70;     ///< Target probability for recommended strikes
    StrikeOptimizerConfig optimizer;         ///< Strike grid used by recommendations
};

}  // namespace condor
