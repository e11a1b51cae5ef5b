// SPDX-License-Identifier: MIT
#include "condor/option/probability.hpp"
#include "condor/math/normal_distribution.hpp"
#include <cmath>

namespace condor {

double probability_itm(double spot, double strike, double tau, double sigma, OptionType type) {
    if (tau <= 0.0 || sigma <= 0.0) {
        bool in_the_money = (type == OptionType::CALL) ? spot > strike : spot < strike;
        return in_the_money ? 1.0 : 0.0;
    }

    double sigma_sqrt_tau = sigma * std::sqrt(tau);
    double d2 = (std::log(spot / strike) - 0.5 * sigma * sigma * tau) / sigma_sqrt_tau;

    if (type == OptionType::CALL) {
        return 1.0 - norm_cdf(d2);
    }
    return norm_cdf(d2);
}

double probability_in_band(double spot, double lower, double upper, double tau, double sigma) {
    if (tau <= 0.0 || sigma <= 0.0) {
        return (lower < spot && spot < upper) ? 1.0 : 0.0;
    }

    double price_std = spot * sigma * std::sqrt(tau);
    double z_upper = (upper - spot) / price_std;
    double z_lower = (lower - spot) / price_std;
    return norm_cdf(z_upper) - norm_cdf(z_lower);
}

}  // namespace condor
