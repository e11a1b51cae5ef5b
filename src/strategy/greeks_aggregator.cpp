// SPDX-License-Identifier: MIT
#include "condor/strategy/greeks_aggregator.hpp"
#include "condor/option/european_option.hpp"
#include "condor/support/condor_trace.h"
#include <cmath>
#include <sstream>

namespace condor {

namespace {

constexpr double kDeltaNeutralBand = 5.0;
constexpr double kLowGammaBound = 0.1;
constexpr double kModerateGammaBound = 0.5;

RiskProfile classify(const Greeks& g) {
    RiskProfile profile;
    profile.delta_neutral = std::abs(g.delta) < kDeltaNeutralBand;
    profile.positive_theta = g.theta > 0.0;
    profile.negative_vega = g.vega < 0.0;

    double abs_gamma = std::abs(g.gamma);
    if (abs_gamma < kLowGammaBound) {
        profile.gamma_risk = GammaRisk::Low;
    } else if (abs_gamma < kModerateGammaBound) {
        profile.gamma_risk = GammaRisk::Moderate;
    } else {
        profile.gamma_risk = GammaRisk::High;
    }
    return profile;
}

GreeksInterpretation interpret(const Greeks& g, const RiskProfile& profile) {
    GreeksInterpretation text;

    if (profile.delta_neutral) {
        text.delta = "Position is delta-neutral";
    } else {
        std::ostringstream os;
        os << "Position has directional bias (delta: "
           << std::round(g.delta * 100.0) / 100.0 << ")";
        text.delta = os.str();
    }

    text.theta = profile.positive_theta ? "Position benefits from time decay"
                                        : "Position loses value over time";
    text.vega = profile.negative_vega ? "Position benefits from decreasing volatility"
                                      : "Position benefits from increasing volatility";
    text.gamma = "Gamma risk is " + std::string(to_string(profile.gamma_risk));
    return text;
}

}  // namespace

std::string_view to_string(GammaRisk risk) {
    switch (risk) {
        case GammaRisk::Low: return "low";
        case GammaRisk::Moderate: return "moderate";
        case GammaRisk::High: return "high";
    }
    return "low";
}

std::expected<PortfolioGreeksReport, ValidationError>
aggregate_condor_greeks(const CondorGreeksInput& legs, int contracts) {
    if (contracts <= 0) {
        CONDOR_TRACE_VALIDATION_ERROR(CONDOR_MODULE_GREEKS,
                                      static_cast<int>(ValidationErrorCode::InvalidContracts),
                                      static_cast<double>(contracts));
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidContracts,
                                               static_cast<double>(contracts)));
    }

    PortfolioGreeksReport report;
    const double scale = static_cast<double>(contracts) * kContractMultiplier;

    // Direction per leg comes from the canonical condor layout
    const auto layout = CondorStrikes{}.legs();
    for (size_t i = 0; i < legs.size(); ++i) {
        report.legs[i] = legs[i].resolved() * (layout[i].direction() * scale);
        report.portfolio += report.legs[i];
    }

    report.risk_profile = classify(report.portfolio);
    report.daily_estimates = DailyEstimates{
        report.portfolio.theta,
        report.portfolio.delta * 0.01,
        -report.portfolio.delta * 0.01,
    };
    report.interpretation = interpret(report.portfolio, report.risk_profile);
    return report;
}

std::expected<PortfolioGreeksReport, ValidationError>
aggregate_condor_greeks(const CondorStrikes& strikes, double spot, double tau, double sigma,
                        double rate, int contracts) {
    CondorGreeksInput inputs;
    const auto legs = strikes.legs();
    for (size_t i = 0; i < legs.size(); ++i) {
        inputs[i] = value_leg(spot, legs[i], tau, sigma, rate).greeks;
    }
    return aggregate_condor_greeks(inputs, contracts);
}

}  // namespace condor
