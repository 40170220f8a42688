#include "gbm/metrics.hpp"
#include "gbm/distributions.hpp"
#include <algorithm>
#include <cmath>

namespace gbm {

void MetricsCalculator::validate_trajectory(const Trajectory& trajectory) {
    if (trajectory.empty()) {
        throw InvalidParameter("Trajectory must contain at least the initial price");
    }
    for (double price : trajectory) {
        if (!std::isfinite(price) || price <= 0.0) {
            throw InvalidParameter("Trajectory prices must be positive and finite");
        }
    }
}

MetricsRecord MetricsCalculator::compute(const SimulationParameters& params,
                                         const Trajectory& trajectory) {
    params.validate();
    validate_trajectory(trajectory);

    MetricsRecord record;
    record.finalPrice = finalPrice(trajectory);
    record.expectedPrice = expectedPrice(params);
    record.cagr = cagr(params, record.finalPrice);

    DrawdownProfile profile = drawdown(trajectory);
    record.maxDrawdown = profile.maxDrawdown;
    record.maxDrawdownDuration = profile.longestDuration;

    record.isLoss = isLoss(params, record.finalPrice);

    PriceRange range = priceRange(trajectory);
    record.minPrice = range.min;
    record.maxPrice = range.max;

    StreakLengths runs = streaks(trajectory);
    record.longestWinningStreak = runs.winning;
    record.longestLosingStreak = runs.losing;

    record.dailyDrift = params.dailyDrift();
    record.dailyVolatility = params.dailyVolatility();

    try {
        record.positiveDaysFraction = positiveDaysFraction(trajectory);
    } catch (const DegenerateComputation&) {
        record.positiveDaysFraction.reset();
    }
    try {
        record.volatilityToDriftRatio = volatilityToDriftRatio(params);
    } catch (const DegenerateComputation&) {
        record.volatilityToDriftRatio.reset();
    }

    RunningStats<double> returns = dailyLogReturns(trajectory);
    record.realizedDailyMean = returns.mean();
    record.realizedDailyVolatility = returns.standardDeviation();

    return record;
}

double MetricsCalculator::finalPrice(const Trajectory& trajectory) {
    if (trajectory.empty()) {
        throw InvalidParameter("Trajectory must contain at least the initial price");
    }
    return trajectory.back();
}

double MetricsCalculator::expectedPrice(const SimulationParameters& params) {
    return params.initialPrice *
           std::exp(params.expectedAnnualReturn * static_cast<double>(params.horizonYears));
}

double MetricsCalculator::cagr(const SimulationParameters& params, double final_price) {
    if (params.initialPrice <= 0.0) {
        throw InvalidParameter("CAGR requires a positive initial price");
    }
    if (params.horizonYears <= 0) {
        throw InvalidParameter("CAGR requires a positive horizon");
    }
    if (!std::isfinite(final_price) || final_price <= 0.0) {
        throw InvalidParameter("CAGR requires a positive final price");
    }
    return std::pow(final_price / params.initialPrice,
                    1.0 / static_cast<double>(params.horizonYears)) - 1.0;
}

DrawdownProfile MetricsCalculator::drawdown(const Trajectory& trajectory) {
    DrawdownProfile profile;
    if (trajectory.empty()) {
        return profile;
    }

    double peak = trajectory.front();
    size_t underwater = 0;
    for (double price : trajectory) {
        if (price >= peak) {
            peak = price;
            underwater = 0;
            continue;
        }
        ++underwater;
        profile.longestDuration = std::max(profile.longestDuration, underwater);
        profile.maxDrawdown = std::min(profile.maxDrawdown, (price - peak) / peak);
    }
    return profile;
}

bool MetricsCalculator::isLoss(const SimulationParameters& params, double final_price) {
    return final_price < params.initialPrice;
}

PriceRange MetricsCalculator::priceRange(const Trajectory& trajectory) {
    if (trajectory.empty()) {
        throw InvalidParameter("Trajectory must contain at least the initial price");
    }
    auto bounds = std::minmax_element(trajectory.begin(), trajectory.end());
    return PriceRange{*bounds.first, *bounds.second};
}

double MetricsCalculator::positiveDaysFraction(const Trajectory& trajectory) {
    if (trajectory.size() < 2) {
        throw DegenerateComputation("Positive-day fraction needs at least one step");
    }
    size_t up_days = 0;
    for (size_t t = 1; t < trajectory.size(); ++t) {
        if (trajectory[t] > trajectory[t - 1]) ++up_days;
    }
    return static_cast<double>(up_days) / static_cast<double>(trajectory.size() - 1);
}

StreakLengths MetricsCalculator::streaks(const Trajectory& trajectory) {
    StreakLengths best;
    size_t up_run = 0;
    size_t down_run = 0;
    for (size_t t = 1; t < trajectory.size(); ++t) {
        if (trajectory[t] > trajectory[t - 1]) {
            ++up_run;
            down_run = 0;
        } else if (trajectory[t] < trajectory[t - 1]) {
            ++down_run;
            up_run = 0;
        } else {
            up_run = 0;
            down_run = 0;
        }
        best.winning = std::max(best.winning, up_run);
        best.losing = std::max(best.losing, down_run);
    }
    return best;
}

double MetricsCalculator::volatilityToDriftRatio(const SimulationParameters& params) {
    const double drift = params.dailyDrift();
    if (drift == 0.0) {
        throw DegenerateComputation("Volatility-to-drift ratio is undefined for zero daily drift");
    }
    return params.dailyVolatility() / drift;
}

RunningStats<double> MetricsCalculator::dailyLogReturns(const Trajectory& trajectory) {
    RunningStats<double> stats;
    for (size_t t = 1; t < trajectory.size(); ++t) {
        stats.add(std::log(trajectory[t] / trajectory[t - 1]));
    }
    return stats;
}

double theoreticalLossProbability(const SimulationParameters& params) {
    params.validate();
    if (params.annualVolatility == 0.0) {
        throw DegenerateComputation("Loss probability of a zero-volatility path is not a distribution");
    }
    const double years = static_cast<double>(params.horizonYears);
    const double sigma = params.annualVolatility;
    NormalDistribution<double> log_growth(
        (params.expectedAnnualReturn - 0.5 * sigma * sigma) * years,
        sigma * std::sqrt(years));
    return log_growth.cdf(0.0);
}

} // namespace gbm
