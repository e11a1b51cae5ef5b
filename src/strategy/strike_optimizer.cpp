// SPDX-License-Identifier: MIT
#include "condor/strategy/strike_optimizer.hpp"
#include "condor/math/normal_distribution.hpp"
#include "condor/option/option_spec.hpp"
#include "condor/support/condor_trace.h"
#include <cmath>

namespace condor {

double round_to_increment(double value, double increment) {
    // nearbyint honours the default round-to-nearest-even mode
    return std::nearbyint(value / increment) * increment;
}

StrikeSolution place_strikes(const StrikeTarget& target, const StrikeOptimizerConfig& config) {
    StrikeSolution solution;
    solution.price_std = target.spot * target.volatility * std::sqrt(target.maturity);
    solution.z_score = norm_ppf((1.0 + target.target_probability) / 2.0);

    CONDOR_TRACE_OPTIMIZER_SOLVE(target.spot, target.target_probability,
                                 solution.z_score, target.wing_width);

    CondorStrikes& exact = solution.exact;
    exact.short_call = target.spot + solution.z_score * solution.price_std;
    exact.short_put = target.spot - solution.z_score * solution.price_std;
    exact.long_call = exact.short_call + target.wing_width;
    exact.long_put = exact.short_put - target.wing_width;

    const double inc = config.strike_increment;
    solution.strikes = CondorStrikes{
        round_to_increment(exact.long_call, inc),
        round_to_increment(exact.short_call, inc),
        round_to_increment(exact.short_put, inc),
        round_to_increment(exact.long_put, inc),
    };
    return solution;
}

std::expected<StrikeSolution, ValidationError>
solve_strikes(const StrikeTarget& target, const StrikeOptimizerConfig& config) {
    auto fail = [](ValidationErrorCode code, double value) {
        CONDOR_TRACE_VALIDATION_ERROR(CONDOR_MODULE_STRIKE_OPTIMIZER,
                                      static_cast<int>(code), value);
        return std::unexpected(ValidationError(code, value));
    };

    if (!(target.spot > 0.0) || !std::isfinite(target.spot)) {
        return fail(ValidationErrorCode::InvalidSpotPrice, target.spot);
    }
    if (!(target.maturity > 0.0) || !std::isfinite(target.maturity)) {
        return fail(ValidationErrorCode::InvalidMaturity, target.maturity);
    }
    if (!(target.volatility > 0.0 && target.volatility <= kMaxVolatility)) {
        return fail(ValidationErrorCode::InvalidVolatility, target.volatility);
    }
    if (!(target.target_probability >= kMinTargetProbability &&
          target.target_probability <= kMaxTargetProbability)) {
        return fail(ValidationErrorCode::InvalidTargetProbability, target.target_probability);
    }
    if (!(target.wing_width > 0.0) || !std::isfinite(target.wing_width)) {
        return fail(ValidationErrorCode::InvalidWingWidth, target.wing_width);
    }

    return place_strikes(target, config);
}

}  // namespace condor
