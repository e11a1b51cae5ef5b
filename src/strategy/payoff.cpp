// SPDX-License-Identifier: MIT
#include "condor/strategy/payoff.hpp"

namespace condor {

double call_spread_pnl(double underlying, const CondorStrikes& strikes) {
    if (underlying <= strikes.short_call) {
        return 0.0;
    }
    if (underlying >= strikes.long_call) {
        return -(strikes.long_call - strikes.short_call);
    }
    return -(underlying - strikes.short_call);
}

double put_spread_pnl(double underlying, const CondorStrikes& strikes) {
    if (underlying >= strikes.short_put) {
        return 0.0;
    }
    if (underlying <= strikes.long_put) {
        return -(strikes.short_put - strikes.long_put);
    }
    return -(strikes.short_put - underlying);
}

double condor_payoff(double underlying, const CondorStrikes& strikes, double net_credit) {
    double per_share = call_spread_pnl(underlying, strikes) + put_spread_pnl(underlying, strikes);
    return per_share * kContractMultiplier + net_credit;
}

std::vector<PayoffPoint> payoff_profile(const CondorStrikes& strikes, double net_credit,
                                        double lo, double hi, size_t n) {
    std::vector<PayoffPoint> profile;
    profile.reserve(n);

    // Same spacing as linspace: step over n - 1 intervals
    const double step = (n > 1) ? (hi - lo) / static_cast<double>(n - 1) : 0.0;
    for (size_t i = 0; i < n; ++i) {
        double price = (i + 1 == n && n > 1) ? hi : lo + step * static_cast<double>(i);
        profile.push_back(PayoffPoint{price, condor_payoff(price, strikes, net_credit)});
    }
    return profile;
}

}  // namespace condor
