#ifndef GBM_METRICS_HPP
#define GBM_METRICS_HPP

#include "gbm/parameters.hpp"
#include "gbm/path_generator.hpp"
#include "gbm/statistics.hpp"
#include <optional>

namespace gbm {

// Risk/return figures of one trajectory. Plain data; the two ratios that
// can have a zero denominator are empty when undefined.
struct MetricsRecord {
    double finalPrice = 0;
    double expectedPrice = 0;
    double cagr = 0;
    double maxDrawdown = 0;              // fraction, <= 0
    size_t maxDrawdownDuration = 0;      // steps spent below the running peak
    bool isLoss = false;                 // finalPrice < initialPrice for this path only
    double minPrice = 0;
    double maxPrice = 0;
    std::optional<double> positiveDaysFraction;
    size_t longestWinningStreak = 0;
    size_t longestLosingStreak = 0;
    double dailyDrift = 0;
    double dailyVolatility = 0;
    std::optional<double> volatilityToDriftRatio;
    double realizedDailyMean = 0;        // of daily log-returns
    double realizedDailyVolatility = 0;  // sample std-dev of daily log-returns
};

struct DrawdownProfile {
    double maxDrawdown = 0;
    size_t longestDuration = 0;
};

struct PriceRange {
    double min = 0;
    double max = 0;
};

struct StreakLengths {
    size_t winning = 0;
    size_t losing = 0;
};

// Each metric is a pure function of the parameters and/or a borrowed
// trajectory. compute() assembles all of them into one record.
class MetricsCalculator {
public:
    static MetricsRecord compute(const SimulationParameters& params,
                                 const Trajectory& trajectory);

    static double finalPrice(const Trajectory& trajectory);
    static double expectedPrice(const SimulationParameters& params);
    static double cagr(const SimulationParameters& params, double final_price);
    static DrawdownProfile drawdown(const Trajectory& trajectory);
    static double maxDrawdown(const Trajectory& trajectory) { return drawdown(trajectory).maxDrawdown; }
    static bool isLoss(const SimulationParameters& params, double final_price);
    static PriceRange priceRange(const Trajectory& trajectory);

    // Throws DegenerateComputation when the trajectory has no day-over-day move.
    static double positiveDaysFraction(const Trajectory& trajectory);

    // A flat day ends both kinds of run.
    static StreakLengths streaks(const Trajectory& trajectory);

    // Throws DegenerateComputation when the daily drift is exactly zero.
    static double volatilityToDriftRatio(const SimulationParameters& params);

    static RunningStats<double> dailyLogReturns(const Trajectory& trajectory);

private:
    static void validate_trajectory(const Trajectory& trajectory);
};

// Closed-form P(S_T < S_0) under the log-normal law of the model.
// Throws DegenerateComputation for zero volatility.
double theoreticalLossProbability(const SimulationParameters& params);

} // namespace gbm

#endif // GBM_METRICS_HPP
