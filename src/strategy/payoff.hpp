// SPDX-License-Identifier: MIT
/**
 * @file payoff.hpp
 * @brief Expiry P&L of an iron condor
 */

#pragma once

#include "condor/strategy/iron_condor.hpp"
#include <cstddef>
#include <vector>

namespace condor {

/// One sample of the payoff curve
struct PayoffPoint {
    double price = 0.0;
    double pnl = 0.0;
};

/// Expiry P&L of the short call spread per share (<= 0)
double call_spread_pnl(double underlying, const CondorStrikes& strikes);

/// Expiry P&L of the short put spread per share (<= 0)
double put_spread_pnl(double underlying, const CondorStrikes& strikes);

/// Total expiry P&L in dollars at an underlying price
///
/// (call spread + put spread) * 100 + net_credit. The spread terms cover a
/// single contract; net_credit is taken as the caller scaled it.
///
/// Piecewise-linear and continuous with breakpoints at the four strikes.
double condor_payoff(double underlying, const CondorStrikes& strikes, double net_credit);

/// Sample condor_payoff at n evenly spaced prices over [lo, hi]
///
/// Both endpoints are included. n == 1 yields lo only, n == 0 nothing.
std::vector<PayoffPoint> payoff_profile(const CondorStrikes& strikes, double net_credit,
                                        double lo, double hi, size_t n);

}  // namespace condor
