// SPDX-License-Identifier: MIT
#include "condor/analysis/condor_analyzer.hpp"
#include "condor/option/european_option.hpp"
#include "condor/option/probability.hpp"
#include "condor/support/condor_trace.h"
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace condor {

namespace {

std::expected<void, ValidationError> validate_parameters(const StrategyParameters& params) {
    auto strikes_ok = validate_strikes(params.strikes);
    if (!strikes_ok) {
        return strikes_ok;
    }

    if (params.contracts <= 0) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidContracts,
                                               static_cast<double>(params.contracts)));
    }

    if (params.current_price.has_value()) {
        double spot = *params.current_price;
        if (!(spot > 0.0) || !std::isfinite(spot)) {
            return std::unexpected(ValidationError(ValidationErrorCode::InvalidSpotPrice, spot));
        }
    }

    double sigma = params.implied_volatility;
    if (!(sigma > 0.0 && sigma <= kMaxVolatility)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidVolatility, sigma));
    }

    double rate = params.risk_free_rate;
    if (!(rate >= 0.0 && rate <= kMaxRate)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidRate, rate));
    }

    return {};
}

AnalysisError reject(const ValidationError& err) {
    CONDOR_TRACE_VALIDATION_ERROR(CONDOR_MODULE_ANALYZER, static_cast<int>(err.code), err.value);
    return AnalysisError::parameters(err);
}

std::string recommendation_reasoning(double target, double sigma) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(0)
       << "Strikes optimized for ~" << target * 100.0
       << "% probability of profit based on " << sigma * 100.0 << "% IV";
    return os.str();
}

}  // namespace

CondorAnalyzer::CondorAnalyzer(AnalyzerConfig config)
    : config_(std::move(config))
{}

std::expected<int, AnalysisError>
CondorAnalyzer::resolve_days(const std::string& expiration_date,
                             const Timestamp& valuation) const {
    auto expiry = Timestamp::parse(expiration_date);
    if (!expiry) {
        CONDOR_TRACE_VALIDATION_ERROR(CONDOR_MODULE_ANALYZER,
                                      static_cast<int>(AnalysisErrorCode::InvalidExpiration), 0.0);
        return std::unexpected(AnalysisError::expiration(expiry.error()));
    }
    const int days = days_to_expiration(valuation, *expiry);
    if (days <= 0) {
        CONDOR_TRACE_VALIDATION_ERROR(CONDOR_MODULE_ANALYZER,
                                      static_cast<int>(AnalysisErrorCode::InvalidExpiration),
                                      static_cast<double>(days));
        return std::unexpected(AnalysisError::expiration("Expiration date must be in the future"));
    }
    return days;
}

std::expected<AnalysisReport, AnalysisError>
CondorAnalyzer::analyze(const StrategyParameters& params, const Timestamp& valuation) const {
    auto days_result = resolve_days(params.expiration_date, valuation);
    if (!days_result) {
        return std::unexpected(days_result.error());
    }
    const int days = *days_result;

    auto validation = validate_parameters(params);
    if (!validation) {
        return std::unexpected(reject(validation.error()));
    }

    const CondorStrikes& strikes = params.strikes;
    const double spot = params.current_price.value_or(strikes.short_midpoint());
    const double sigma = params.implied_volatility;
    const double rate = params.risk_free_rate;
    const double tau = days / config_.days_per_year;
    const double contracts = static_cast<double>(params.contracts);

    CONDOR_TRACE_ANALYSIS_START(spot, days, sigma, params.contracts);

    AnalysisReport report;
    report.symbol = params.symbol;

    // Price the legs
    const auto legs = strikes.legs();
    for (size_t i = 0; i < legs.size(); ++i) {
        report.leg_prices[i] = value_leg(spot, legs[i], tau, sigma, rate).price;
    }
    const double long_call = report.leg_prices[static_cast<size_t>(CondorLeg::LongCall)];
    const double short_call = report.leg_prices[static_cast<size_t>(CondorLeg::ShortCall)];
    const double short_put = report.leg_prices[static_cast<size_t>(CondorLeg::ShortPut)];
    const double long_put = report.leg_prices[static_cast<size_t>(CondorLeg::LongPut)];

    // Risk / reward
    const double call_spread_credit = short_call - long_call;
    const double put_spread_credit = short_put - long_put;
    const double net_credit = (call_spread_credit + put_spread_credit) * contracts * kContractMultiplier;
    const double max_profit = net_credit;
    const double max_loss = strikes.max_spread_width() * contracts * kContractMultiplier - net_credit;

    RiskReward& rr = report.risk_reward;
    rr.net_credit = net_credit;
    rr.max_profit = max_profit;
    rr.max_loss = max_loss;
    rr.return_on_risk_percent = (max_loss > 0.0) ? max_profit / max_loss * 100.0 : 0.0;
    rr.risk_reward_ratio = (max_loss > 0.0) ? max_profit / max_loss : 0.0;

    // Breakevens
    const double credit_per_share = net_credit / (contracts * kContractMultiplier);
    Breakevens& be = report.breakevens;
    be.upper = strikes.short_call + credit_per_share;
    be.lower = strikes.short_put - credit_per_share;
    be.range = be.upper - be.lower;
    be.range_percent = be.range / spot * 100.0;

    // Probabilities
    ProbabilityAnalysis& prob = report.probability;
    prob.profit_percent = probability_in_band(spot, be.lower, be.upper, tau, sigma) * 100.0;
    prob.loss_percent = 100.0 - prob.profit_percent;
    prob.short_call_itm_percent =
        probability_itm(spot, strikes.short_call, tau, sigma, OptionType::CALL) * 100.0;
    prob.short_put_itm_percent =
        probability_itm(spot, strikes.short_put, tau, sigma, OptionType::PUT) * 100.0;
    prob.method = kProbabilityMethod;

    // Recommended strikes at the configured target and the current wing width
    StrikeTarget target;
    target.spot = spot;
    target.maturity = tau;
    target.volatility = sigma;
    target.target_probability = config_.recommendation_target;
    target.wing_width = strikes.max_spread_width();
    report.recommendations.optimal_strikes = place_strikes(target, config_.optimizer).strikes;
    report.recommendations.reasoning =
        recommendation_reasoning(config_.recommendation_target, sigma);

    // Sensitivity
    Sensitivity& sens = report.sensitivity;
    sens.upside_room_percent = (be.upper - spot) / spot * 100.0;
    sens.downside_room_percent = (spot - be.lower) / spot * 100.0;
    sens.days_to_expiration = days;
    sens.implied_volatility = sigma;
    sens.current_price = spot;

    report.quality = score_strategy(rr.return_on_risk_percent, prob.profit_percent, days);

    report.payoff_profile = payoff_profile(strikes, net_credit,
                                           spot * config_.payoff_lower_factor,
                                           spot * config_.payoff_upper_factor,
                                           config_.payoff_samples);

    CONDOR_TRACE_ANALYSIS_COMPLETE(net_credit, max_loss, prob.profit_percent, report.quality.score);
    return report;
}

std::expected<OptimizationResult, AnalysisError>
CondorAnalyzer::optimize(const OptimizationRequest& request, const Timestamp& valuation) const {
    auto days_result = resolve_days(request.expiration_date, valuation);
    if (!days_result) {
        return std::unexpected(days_result.error());
    }
    const int days = *days_result;

    StrikeTarget target;
    target.spot = request.current_price;
    target.maturity = days / config_.days_per_year;
    target.volatility = request.implied_volatility;
    target.target_probability = request.target_probability;
    target.wing_width = request.wing_width;

    auto solution = solve_strikes(target, config_.optimizer);
    if (!solution) {
        return std::unexpected(reject(solution.error()));
    }

    StrategyParameters params;
    params.symbol = request.symbol;
    params.expiration_date = request.expiration_date;
    params.strikes = solution->strikes;
    params.contracts = request.contracts;
    params.current_price = request.current_price;
    params.implied_volatility = request.implied_volatility;
    params.risk_free_rate = kDefaultRate;

    auto analysis = analyze(params, valuation);
    if (!analysis) {
        return std::unexpected(analysis.error());
    }

    return OptimizationResult{solution->strikes, std::move(*analysis), request, days};
}

}  // namespace condor
