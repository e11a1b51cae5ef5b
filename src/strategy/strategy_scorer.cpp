// SPDX-License-Identifier: MIT
#include "condor/strategy/strategy_scorer.hpp"
#include <algorithm>
#include <cmath>

namespace condor {

namespace {

// Score weights
constexpr double kRorWeight = 0.3;
constexpr double kPopWeight = 0.5;
constexpr double kTimeWeight = 0.2;

// Preferred expiration window in days
constexpr int kOptimalMinDays = 30;
constexpr int kOptimalMaxDays = 45;

}  // namespace

std::string_view to_string(StrategyRating rating) {
    switch (rating) {
        case StrategyRating::Excellent: return "Excellent";
        case StrategyRating::Good: return "Good";
        case StrategyRating::Fair: return "Fair";
        case StrategyRating::Poor: return "Poor";
    }
    return "Poor";
}

std::string_view to_string(FactorGrade grade) {
    switch (grade) {
        case FactorGrade::Good: return "Good";
        case FactorGrade::Fair: return "Fair";
        case FactorGrade::Poor: return "Poor";
    }
    return "Poor";
}

std::string_view to_string(TimeGrade grade) {
    switch (grade) {
        case TimeGrade::Optimal: return "Optimal";
        case TimeGrade::Acceptable: return "Acceptable";
        case TimeGrade::Risky: return "Risky";
    }
    return "Risky";
}

double time_score(int days_to_expiration) {
    if (days_to_expiration >= kOptimalMinDays && days_to_expiration <= kOptimalMaxDays) {
        return 100.0;
    }
    if (days_to_expiration < kOptimalMinDays) {
        return std::max(0.0, static_cast<double>(days_to_expiration) / kOptimalMinDays * 100.0);
    }
    return std::max(0.0, 100.0 - (days_to_expiration - kOptimalMaxDays) * 2.0);
}

double strategy_score(double return_on_risk, double probability_of_profit,
                      int days_to_expiration) {
    double ror_score = std::min(100.0, return_on_risk * 2.0);  // 50% ROR = 100
    double pop_score = probability_of_profit;                  // already 0-100

    double total = ror_score * kRorWeight + pop_score * kPopWeight +
                   time_score(days_to_expiration) * kTimeWeight;
    return std::round(total * 100.0) / 100.0;
}

StrategyRating rating_for_composite(double composite) {
    if (composite >= 80.0) return StrategyRating::Excellent;
    if (composite >= 65.0) return StrategyRating::Good;
    if (composite >= 50.0) return StrategyRating::Fair;
    return StrategyRating::Poor;
}

StrategyRating strategy_rating(double return_on_risk, double probability_of_profit) {
    return rating_for_composite(return_on_risk * 2.0 * 0.4 + probability_of_profit * 0.6);
}

ScoreFactors score_factors(double return_on_risk, double probability_of_profit,
                           int days_to_expiration) {
    ScoreFactors factors;

    if (return_on_risk > 20.0) {
        factors.return_on_risk = FactorGrade::Good;
    } else if (return_on_risk > 10.0) {
        factors.return_on_risk = FactorGrade::Fair;
    }

    if (probability_of_profit > 65.0) {
        factors.probability_of_profit = FactorGrade::Good;
    } else if (probability_of_profit > 50.0) {
        factors.probability_of_profit = FactorGrade::Fair;
    }

    if (days_to_expiration >= kOptimalMinDays && days_to_expiration <= kOptimalMaxDays) {
        factors.time_to_expiration = TimeGrade::Optimal;
    } else if (days_to_expiration > 20) {
        factors.time_to_expiration = TimeGrade::Acceptable;
    }

    return factors;
}

ScoreCard score_strategy(double return_on_risk, double probability_of_profit,
                         int days_to_expiration) {
    return ScoreCard{
        strategy_score(return_on_risk, probability_of_profit, days_to_expiration),
        strategy_rating(return_on_risk, probability_of_profit),
        score_factors(return_on_risk, probability_of_profit, days_to_expiration),
    };
}

}  // namespace condor
