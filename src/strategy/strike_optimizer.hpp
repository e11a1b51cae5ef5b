// SPDX-License-Identifier: MIT
/**
 * @file strike_optimizer.hpp
 * @brief Strike placement for a target probability of profit
 */

#pragma once

#include "condor/strategy/iron_condor.hpp"
#include "condor/support/error_types.hpp"
#include <expected>

namespace condor {

/// Bounds accepted for the target probability of profit
inline constexpr double kMinTargetProbability = 0.5;
inline constexpr double kMaxTargetProbability = 0.95;

/// Configuration for strike placement
struct StrikeOptimizerConfig {
    double strike_increment = 5.0;  ///< Listed strike granularity
};

/// Inputs of the strike search
struct StrikeTarget {
    double spot = 0.0;                 ///< Current underlying price
    double maturity = 0.0;             ///< Time to expiry in years
    double volatility = 0.0;           ///< Implied volatility
    double target_probability = 0.70;  ///< Probability of finishing between the shorts
    double wing_width = 5.0;           ///< Distance from each short strike to its wing
};

/// Strikes before and after snapping to the strike grid
struct StrikeSolution {
    CondorStrikes exact;    ///< Unrounded strikes, wings exactly wing_width away
    CondorStrikes strikes;  ///< Strikes rounded to the nearest increment
    double z_score = 0.0;   ///< N^-1((1 + p) / 2)
    double price_std = 0.0; ///< S sigma sqrt(T)
};

/// Round to the nearest multiple of increment, ties to the even multiple
/// (12.5 -> 10, 17.5 -> 20 for increment 5).
double round_to_increment(double value, double increment);

/// Place strikes so the shorts bound a symmetric interval of probability p
///
/// price_std = S sigma sqrt(T), z = N^-1((1 + p)/2),
/// short_call = S + z price_std, short_put = S - z price_std, wings
/// wing_width further out; every strike rounded by round_to_increment.
///
/// No validation: see solve_strikes for the checked entry point.
StrikeSolution place_strikes(const StrikeTarget& target,
                             const StrikeOptimizerConfig& config = {});

/// Validating wrapper around place_strikes
///
/// Rejects spot <= 0, maturity <= 0, volatility outside (0, 2],
/// target_probability outside [0.5, 0.95] and wing_width <= 0.
std::expected<StrikeSolution, ValidationError>
solve_strikes(const StrikeTarget& target, const StrikeOptimizerConfig& config = {});

}  // namespace condor
