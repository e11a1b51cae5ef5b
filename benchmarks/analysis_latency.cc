// SPDX-License-Identifier: MIT
/// @file analysis_latency.cc
/// @brief Latency benchmark: leg pricing, strike placement and full analysis
///
/// Reports ns/call for each layer of a single SPX-sized condor.

#include "condor/analysis/condor_analyzer.hpp"
#include "condor/option/european_option.hpp"
#include "condor/option/probability.hpp"
#include "condor/strategy/greeks_aggregator.hpp"
#include "condor/strategy/strike_optimizer.hpp"
#include <benchmark/benchmark.h>
#include <chrono>

using namespace condor;

namespace {

constexpr double S = 4500.0, tau = 30.0 / 365.0, sigma = 0.20, rate = 0.05;

const CondorStrikes kStrikes{4600.0, 4550.0, 4450.0, 4400.0};

StrategyParameters MakeParams() {
    StrategyParameters params;
    params.symbol = "SPX";
    params.expiration_date = "2026-01-31";
    params.strikes = kStrikes;
    params.current_price = S;
    return params;
}

}  // namespace

static void BM_ValueLeg(benchmark::State& state) {
    OptionLeg leg{4550.0, OptionType::CALL, PositionSide::SHORT};
    for (auto _ : state) {
        auto v = value_leg(S, leg, tau, sigma, rate);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_ValueLeg);

static void BM_ProbabilityInBand(benchmark::State& state) {
    for (auto _ : state) {
        double p = probability_in_band(S, 4411.57, 4588.43, tau, sigma);
        benchmark::DoNotOptimize(p);
    }
}
BENCHMARK(BM_ProbabilityInBand);

static void BM_PlaceStrikes(benchmark::State& state) {
    StrikeTarget target;
    target.spot = S;
    target.maturity = tau;
    target.volatility = sigma;
    target.wing_width = 50.0;
    for (auto _ : state) {
        auto solution = place_strikes(target);
        benchmark::DoNotOptimize(solution);
    }
}
BENCHMARK(BM_PlaceStrikes);

static void BM_AggregateGreeks(benchmark::State& state) {
    for (auto _ : state) {
        auto report = aggregate_condor_greeks(kStrikes, S, tau, sigma, rate, 1);
        benchmark::DoNotOptimize(report);
    }
}
BENCHMARK(BM_AggregateGreeks);

static void BM_FullAnalysis(benchmark::State& state) {
    CondorAnalyzer analyzer;
    const auto params = MakeParams();
    const Timestamp valuation{std::chrono::sys_days{std::chrono::year{2026} / 1 / 1}};
    for (auto _ : state) {
        auto report = analyzer.analyze(params, valuation);
        if (!report.has_value()) {
            state.SkipWithError("analysis failed");
            break;
        }
        benchmark::DoNotOptimize(report);
    }
}
BENCHMARK(BM_FullAnalysis);

BENCHMARK_MAIN();
