// SPDX-License-Identifier: MIT
/**
 * @file condor_analyzer.hpp
 * @brief Full iron condor analysis: pricing, risk, probability, score
 *
 * Composes the pricing, probability, payoff, optimizer and scoring
 * components into one report. Every call is a single pass over its
 * inputs: nothing is cached between calls and nothing is retried.
 *
 * Example:
 * @code
 * CondorAnalyzer analyzer;
 * StrategyParameters params;
 * params.expiration_date = "2026-12-18";
 * params.strikes = {4600.0, 4550.0, 4450.0, 4400.0};
 * params.current_price = 4500.0;
 * auto report = analyzer.analyze(params);
 * if (report) {
 *     double pop = report->probability.profit_percent;
 * }
 * @endcode
 */

#pragma once

#include "condor/analysis/analysis_report.hpp"
#include "condor/analysis/analyzer_config.hpp"
#include "condor/support/error_types.hpp"
#include "condor/support/timestamp.hpp"
#include <expected>

namespace condor {

/**
 * @brief Stateless condor analyzer
 *
 * Holds only its configuration; all methods are const and thread-safe.
 */
class CondorAnalyzer {
public:
    explicit CondorAnalyzer(AnalyzerConfig config = {});

    /// Analyze one condor as of a valuation time
    ///
    /// Fails with InvalidExpiration when the expiration date does not parse
    /// or is less than one whole day after the valuation time, and with
    /// InvalidParameters when strikes, contracts, price, volatility or rate
    /// are out of range. No partial report is produced on failure.
    std::expected<AnalysisReport, AnalysisError>
    analyze(const StrategyParameters& params,
            const Timestamp& valuation = Timestamp::now()) const;

    /// Derive strikes for a target probability, then analyze them
    ///
    /// The analysis uses the request's price and volatility and the default
    /// risk-free rate.
    std::expected<OptimizationResult, AnalysisError>
    optimize(const OptimizationRequest& request,
             const Timestamp& valuation = Timestamp::now()) const;

    const AnalyzerConfig& config() const { return config_; }

private:
    /// Parse the expiration and return whole days remaining (> 0)
    std::expected<int, AnalysisError> resolve_days(const std::string& expiration_date,
                                                   const Timestamp& valuation) const;

    AnalyzerConfig config_;
};

}  // namespace condor
