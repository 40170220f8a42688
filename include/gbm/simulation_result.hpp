#ifndef GBM_SIMULATION_RESULT_HPP
#define GBM_SIMULATION_RESULT_HPP

#include <chrono>
#include <cstdint>
#include <vector>

namespace gbm {

// Aggregate of a Monte Carlo batch. The per-trial sequences are kept in
// trial order; probabilityOfLoss is the mean of trialLossIndicators.
struct MonteCarloSummary {
    std::vector<double> trialFinalPrices;
    std::vector<bool> trialLossIndicators;

    double meanFinalPrice = 0;
    double medianFinalPrice = 0;
    double finalPriceStdDev = 0;
    double finalPriceStandardError = 0;

    double lowerPercentileLevel = 2.5;
    double upperPercentileLevel = 97.5;
    double lowerPercentile = 0;
    double upperPercentile = 0;

    double probabilityOfLoss = 0;
    size_t lossCount = 0;

    double meanCagr = 0;
    double meanMaxDrawdown = 0;
    double worstMaxDrawdown = 0;
    size_t degenerateTrials = 0;

    size_t trials = 0;
    std::uint64_t seed = 0;
    std::chrono::steady_clock::time_point startTime;
    std::chrono::steady_clock::time_point endTime;

    double totalDuration() const {
        return std::chrono::duration<double>(endTime - startTime).count();
    }
};

} // namespace gbm

#endif // GBM_SIMULATION_RESULT_HPP
