// SPDX-License-Identifier: MIT
/**
 * @file analysis_report.hpp
 * @brief Inputs and outputs of a full condor analysis
 *
 * Plain value types. Monetary values are in dollars for the whole
 * position (contracts * 100 shares) unless noted; percentages are 0-100.
 * Values are not rounded except the score.
 */

#pragma once

#include "condor/analysis/analyzer_config.hpp"
#include "condor/strategy/iron_condor.hpp"
#include "condor/strategy/payoff.hpp"
#include "condor/strategy/strategy_scorer.hpp"
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace condor {

/// One condor as requested by a caller
struct StrategyParameters {
    std::string symbol;                  ///< Opaque label
    std::string expiration_date;         ///< "YYYY-MM-DD"
    CondorStrikes strikes;
    int contracts = 1;
    std::optional<double> current_price; ///< Defaults to the short strike midpoint
    double implied_volatility = kDefaultVolatility;
    double risk_free_rate = kDefaultRate;
};

struct RiskReward {
    double max_profit = 0.0;
    double max_loss = 0.0;
    double return_on_risk_percent = 0.0;  ///< 0 when max_loss <= 0
    double risk_reward_ratio = 0.0;       ///< max_profit / max_loss, 0 when max_loss <= 0
    double net_credit = 0.0;
};

struct Breakevens {
    double upper = 0.0;
    double lower = 0.0;
    double range = 0.0;
    double range_percent = 0.0;  ///< Range relative to the underlying price
};

struct ProbabilityAnalysis {
    double profit_percent = 0.0;
    double loss_percent = 0.0;
    double short_call_itm_percent = 0.0;
    double short_put_itm_percent = 0.0;
    std::string method;  ///< Always kProbabilityMethod
};

struct Sensitivity {
    double upside_room_percent = 0.0;
    double downside_room_percent = 0.0;
    int days_to_expiration = 0;
    double implied_volatility = 0.0;
    double current_price = 0.0;
};

struct Recommendations {
    CondorStrikes optimal_strikes;
    std::string reasoning;
};

/// Full analysis of one condor
struct AnalysisReport {
    std::string symbol;
    std::array<double, 4> leg_prices{};  ///< Per-share theoretical price, CondorLeg order
    RiskReward risk_reward;
    Breakevens breakevens;
    ProbabilityAnalysis probability;
    Sensitivity sensitivity;
    Recommendations recommendations;
    ScoreCard quality;
    std::vector<PayoffPoint> payoff_profile;
};

/// Request to derive strikes and analyze the resulting condor
struct OptimizationRequest {
    std::string symbol;
    std::string expiration_date;    ///< "YYYY-MM-DD"
    double current_price = 0.0;
    double implied_volatility = kDefaultVolatility;
    double target_probability = 0.70;
    double wing_width = 5.0;
    int contracts = 1;
};

/// Strikes found for a target probability and their analysis
struct OptimizationResult {
    CondorStrikes optimal_strikes;
    AnalysisReport expected_performance;
    OptimizationRequest parameters;  ///< Echo of the request
    int days_to_expiration = 0;
};

}  // namespace condor
