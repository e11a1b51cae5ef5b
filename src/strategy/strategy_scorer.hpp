// SPDX-License-Identifier: MIT
/**
 * @file strategy_scorer.hpp
 * @brief Quality score and qualitative ratings of a condor
 */

#pragma once

#include <string_view>

namespace condor {

/// Overall qualitative rating, ordered worst to best
enum class StrategyRating {
    Poor,
    Fair,
    Good,
    Excellent
};

/// Grade of a single score factor
enum class FactorGrade {
    Poor,
    Fair,
    Good
};

/// Grade of the time to expiration
enum class TimeGrade {
    Risky,
    Acceptable,
    Optimal
};

std::string_view to_string(StrategyRating rating);
std::string_view to_string(FactorGrade grade);
std::string_view to_string(TimeGrade grade);

/// Per-factor breakdown reported next to the score
struct ScoreFactors {
    FactorGrade return_on_risk = FactorGrade::Poor;
    FactorGrade probability_of_profit = FactorGrade::Poor;
    TimeGrade time_to_expiration = TimeGrade::Risky;
};

/// Score, rating and factor grades of one strategy
struct ScoreCard {
    double score = 0.0;
    StrategyRating rating = StrategyRating::Poor;
    ScoreFactors factors;
};

/// Time component of the score
///
/// 100 inside [30, 45] days, linear from 0 at day 0 below that, and
/// 2 points lost per day past 45 (floored at 0).
double time_score(int days_to_expiration);

/// Weighted 0-100 score, rounded to two decimals
///
/// 0.3 min(100, 2 ROR) + 0.5 POP + 0.2 time_score(days)
///
/// @param return_on_risk Return on risk in percent
/// @param probability_of_profit Probability of profit in percent
/// @param days_to_expiration Whole days to expiration
double strategy_score(double return_on_risk, double probability_of_profit,
                      int days_to_expiration);

/// Rating for a composite value: >= 80 Excellent, >= 65 Good, >= 50 Fair
StrategyRating rating_for_composite(double composite);

/// Rating from its own blend 2 ROR 0.4 + POP 0.6, independent of the score
StrategyRating strategy_rating(double return_on_risk, double probability_of_profit);

/// Grades of each score input
ScoreFactors score_factors(double return_on_risk, double probability_of_profit,
                           int days_to_expiration);

/// Score, rating and factors together
ScoreCard score_strategy(double return_on_risk, double probability_of_profit,
                         int days_to_expiration);

}  // namespace condor
