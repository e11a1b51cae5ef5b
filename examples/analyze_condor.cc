// SPDX-License-Identifier: MIT
/**
 * @file analyze_condor.cc
 * @brief Iron condor analysis example
 *
 * Demonstrates:
 * - Resolving the underlying price through a PriceSource
 * - Analyzing a hand-picked condor
 * - Aggregating position Greeks
 * - Letting the optimizer pick strikes for a target probability
 */

#include "condor/analysis/condor_analyzer.hpp"
#include "condor/market/price_source.hpp"
#include "condor/strategy/greeks_aggregator.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>

using namespace condor;

namespace {

void print_strikes(const CondorStrikes& s) {
    std::cout << "  " << s.long_put << " / " << s.short_put << " | "
              << s.short_call << " / " << s.long_call << "\n";
}

void print_report(const AnalysisReport& report) {
    const auto& rr = report.risk_reward;
    const auto& be = report.breakevens;
    const auto& prob = report.probability;

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "\n" << report.symbol << " iron condor\n";
    std::cout << std::string(50, '=') << "\n";
    std::cout << "  Net credit:      $" << rr.net_credit << "\n";
    std::cout << "  Max loss:        $" << rr.max_loss << "\n";
    std::cout << "  Return on risk:  " << rr.return_on_risk_percent << "%\n";
    std::cout << "  Breakevens:      " << be.lower << " - " << be.upper
              << " (" << be.range_percent << "% wide)\n";
    std::cout << "  P(profit):       " << prob.profit_percent << "%\n";
    std::cout << "  Short call ITM:  " << prob.short_call_itm_percent << "%\n";
    std::cout << "  Short put ITM:   " << prob.short_put_itm_percent << "%\n";
    std::cout << "  Score:           " << report.quality.score
              << " (" << to_string(report.quality.rating) << ")\n";
    std::cout << "  Recommended strikes:\n";
    print_strikes(report.recommendations.optimal_strikes);
    std::cout << "  " << report.recommendations.reasoning << "\n";

    std::cout << "\n" << std::setw(12) << "Underlying" << std::setw(14) << "P&L" << "\n";
    std::cout << std::string(50, '-') << "\n";
    for (const auto& point : report.payoff_profile) {
        std::cout << std::setw(12) << point.price << std::setw(14) << point.pnl << "\n";
    }
}

}  // namespace

int main() {
    StaticPriceSource prices({{"SPX", 4500.0}});

    auto spot = prices.current_price("SPX");
    if (!spot.has_value()) {
        std::cerr << "Price lookup failed: " << spot.error() << "\n";
        return 1;
    }

    // Expire 35 days from now
    std::string expiration =
        Timestamp{Timestamp::now().time_point() + std::chrono::days{35}}.date();

    StrategyParameters params;
    params.symbol = "SPX";
    params.expiration_date = expiration;
    params.strikes = CondorStrikes{4600.0, 4550.0, 4450.0, 4400.0};
    params.current_price = *spot;

    CondorAnalyzer analyzer;
    auto report = analyzer.analyze(params);
    if (!report.has_value()) {
        std::cerr << "Analysis failed: " << report.error() << "\n";
        return 1;
    }
    print_report(*report);

    const double tau = report->sensitivity.days_to_expiration / analyzer.config().days_per_year;
    auto greeks = aggregate_condor_greeks(params.strikes, *spot, tau,
                                          params.implied_volatility, params.risk_free_rate,
                                          params.contracts);
    if (!greeks.has_value()) {
        std::cerr << "Greeks aggregation failed: " << greeks.error() << "\n";
        return 1;
    }
    std::cout << "\nPosition Greeks\n";
    std::cout << std::string(50, '=') << "\n";
    std::cout << std::setprecision(4);
    std::cout << "  Delta: " << greeks->portfolio.delta << "  " << greeks->interpretation.delta << "\n";
    std::cout << "  Gamma: " << greeks->portfolio.gamma << "  " << greeks->interpretation.gamma << "\n";
    std::cout << "  Theta: " << greeks->portfolio.theta << "  " << greeks->interpretation.theta << "\n";
    std::cout << "  Vega:  " << greeks->portfolio.vega << "  " << greeks->interpretation.vega << "\n";

    OptimizationRequest request;
    request.symbol = "SPX";
    request.expiration_date = expiration;
    request.current_price = *spot;
    request.target_probability = 0.80;
    request.wing_width = 50.0;

    auto optimized = analyzer.optimize(request);
    if (!optimized.has_value()) {
        std::cerr << "Optimization failed: " << optimized.error() << "\n";
        return 1;
    }
    std::cout << "\nStrikes for 80% target:\n";
    print_strikes(optimized->optimal_strikes);
    std::cout << std::setprecision(2)
              << "  P(profit): " << optimized->expected_performance.probability.profit_percent << "%\n";

    return 0;
}
