// SPDX-License-Identifier: MIT
/**
 * @file probability.hpp
 * @brief Expiry probabilities under the Black-Scholes volatility assumption
 */

#pragma once

#include "condor/option/option_spec.hpp"

namespace condor {

/// Label reported alongside band probabilities
inline constexpr const char* kProbabilityMethod = "black_scholes_normal_distribution";

/// Probability that a leg finishes in-the-money at expiry
///
/// Uses the drift-free d2 = (ln(S/K) - sigma^2 T/2) / (sigma sqrt(T)) with
/// calls mapped to 1 - N(d2) and puts to N(d2). These are the values the
/// strategy score is calibrated against and are kept as is.
///
/// With T <= 0 the answer is 1.0 if the leg is already past its strike
/// (S > K for calls, S < K for puts) and 0.0 otherwise.
///
/// @param spot Underlying price (S > 0)
/// @param strike Strike price (K > 0)
/// @param tau Time to expiry in years
/// @param sigma Volatility
/// @param type CALL or PUT
/// @return Probability in [0, 1]
double probability_itm(double spot, double strike, double tau, double sigma, OptionType type);

/// Probability that the underlying finishes strictly between two prices
///
/// Normal approximation of the terminal price with standard deviation
/// S sigma sqrt(T): N((upper - S)/sd) - N((lower - S)/sd). This is not the
/// log-normal probability; see kProbabilityMethod.
///
/// With T <= 0 (or sigma <= 0) the answer is 1.0 if lower < S < upper.
/// An inverted band (upper < lower) yields a negative difference, not 0.
double probability_in_band(double spot, double lower, double upper, double tau, double sigma);

}  // namespace condor
