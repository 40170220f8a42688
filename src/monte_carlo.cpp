#include "gbm/monte_carlo.hpp"
#include "gbm/errors.hpp"
#include "gbm/statistics.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <future>
#include <thread>

namespace gbm {

MonteCarloDriver::MonteCarloDriver(const SimulationParameters& model)
    : generator_(model) {}

void MonteCarloDriver::validate_parameters(const Parameters& params) const {
    if (params.trials == 0) {
        throw InvalidParameter("Number of trials must be positive");
    }
    if (params.num_threads == 0) {
        throw InvalidParameter("Number of threads must be positive");
    }
    if (!(params.lower_percentile >= 0.0 && params.lower_percentile <= 100.0) ||
        !(params.upper_percentile >= 0.0 && params.upper_percentile <= 100.0)) {
        throw InvalidParameter("Percentile levels must be between 0 and 100");
    }
    if (params.lower_percentile > params.upper_percentile) {
        throw InvalidParameter("Lower percentile cannot exceed upper percentile");
    }
}

MetricsRecord MonteCarloDriver::runTrial(size_t index, const Parameters& params) const {
    auto rng = RandomGenerator::create(params.generator, streamSeed(params.seed, index));
    Trajectory path = generator_.generate(*rng);
    return MetricsCalculator::compute(generator_.parameters(), path);
}

std::vector<MonteCarloDriver::TrialOutcome>
MonteCarloDriver::run_block(size_t first, size_t count, const Parameters& params) const {
    std::vector<TrialOutcome> outcomes;
    outcomes.reserve(count);

    for (size_t i = first; i < first + count; ++i) {
        MetricsRecord record = runTrial(i, params);

        TrialOutcome outcome;
        outcome.finalPrice = record.finalPrice;
        outcome.isLoss = record.isLoss;
        outcome.cagr = record.cagr;
        outcome.maxDrawdown = record.maxDrawdown;
        outcome.degenerate = !record.positiveDaysFraction || !record.volatilityToDriftRatio;
        outcomes.push_back(outcome);
    }
    return outcomes;
}

MonteCarloSummary MonteCarloDriver::run(const Parameters& params) const {
    validate_parameters(params);

    MonteCarloSummary summary;
    summary.trials = params.trials;
    summary.seed = params.seed;
    summary.startTime = std::chrono::steady_clock::now();

    size_t hw_threads = static_cast<size_t>(std::thread::hardware_concurrency());
    if (hw_threads == 0) hw_threads = 1;
    size_t num_threads = std::max(size_t(1),
        std::min({params.num_threads, hw_threads, params.trials}));

    size_t trials_per_thread = params.trials / num_threads;
    size_t remaining = params.trials % num_threads;

    spdlog::debug("Monte Carlo batch: {} trials, {} threads, seed {}, {} generator",
                  params.trials, num_threads, params.seed, generatorName(params.generator));

    // Contiguous blocks, collected in launch order so trial order is kept.
    std::vector<std::future<std::vector<TrialOutcome>>> futures;
    futures.reserve(num_threads);

    size_t first = 0;
    for (size_t i = 0; i < num_threads; ++i) {
        size_t block = trials_per_thread + (i == num_threads - 1 ? remaining : 0);
        futures.push_back(std::async(std::launch::async,
            [this, first, block, &params]() {
                return run_block(first, block, params);
            }));
        first += block;
    }

    std::vector<TrialOutcome> outcomes;
    outcomes.reserve(params.trials);
    for (auto& future : futures) {
        auto block_outcomes = future.get();
        outcomes.insert(outcomes.end(), block_outcomes.begin(), block_outcomes.end());
    }

    if (outcomes.size() != params.trials) {
        throw std::runtime_error("Simulation trial count mismatch");
    }

    summarize(outcomes, params, summary);
    summary.endTime = std::chrono::steady_clock::now();

    if (summary.degenerateTrials > 0) {
        spdlog::warn("{} of {} trials have undefined drift ratio or positive-day fraction",
                     summary.degenerateTrials, summary.trials);
    }
    spdlog::info("Monte Carlo batch finished in {:.3f}s: mean final price {:.2f}, loss probability {:.4f}",
                 summary.totalDuration(), summary.meanFinalPrice, summary.probabilityOfLoss);

    return summary;
}

void MonteCarloDriver::summarize(const std::vector<TrialOutcome>& outcomes,
                                 const Parameters& params,
                                 MonteCarloSummary& summary) const {
    summary.trialFinalPrices.reserve(outcomes.size());
    summary.trialLossIndicators.reserve(outcomes.size());

    double cagr_sum = 0;
    double drawdown_sum = 0;
    for (const auto& outcome : outcomes) {
        summary.trialFinalPrices.push_back(outcome.finalPrice);
        summary.trialLossIndicators.push_back(outcome.isLoss);
        if (outcome.isLoss) ++summary.lossCount;
        if (outcome.degenerate) ++summary.degenerateTrials;
        cagr_sum += outcome.cagr;
        drawdown_sum += outcome.maxDrawdown;
        summary.worstMaxDrawdown = std::min(summary.worstMaxDrawdown, outcome.maxDrawdown);
    }

    const double n = static_cast<double>(outcomes.size());
    summary.probabilityOfLoss = static_cast<double>(summary.lossCount) / n;
    summary.meanCagr = cagr_sum / n;
    summary.meanMaxDrawdown = drawdown_sum / n;

    auto stats = StatisticalAnalysis<double>::analyze(
        summary.trialFinalPrices,
        {params.lower_percentile / 100.0, params.upper_percentile / 100.0});

    summary.meanFinalPrice = stats.mean;
    summary.medianFinalPrice = stats.median;
    summary.finalPriceStdDev = stats.standardDeviation;
    summary.finalPriceStandardError = stats.standardError;
    summary.lowerPercentileLevel = params.lower_percentile;
    summary.upperPercentileLevel = params.upper_percentile;
    summary.lowerPercentile = stats.quantiles[0];
    summary.upperPercentile = stats.quantiles[1];
}

} // namespace gbm
