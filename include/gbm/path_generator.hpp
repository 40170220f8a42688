#ifndef GBM_PATH_GENERATOR_HPP
#define GBM_PATH_GENERATOR_HPP

#include "gbm/parameters.hpp"
#include "gbm/random.hpp"
#include <vector>

namespace gbm {

// Daily prices P_0..P_N with P_0 the initial price.
using Trajectory = std::vector<double>;

class PathGenerator {
public:
    explicit PathGenerator(const SimulationParameters& params);

    // Draws N = totalSteps() daily log-returns from
    // N(dailyDrift, dailyVolatility) and returns
    // P_t = initialPrice * exp(sum of the first t log-returns).
    Trajectory generate(RandomGenerator& generator) const;

    const SimulationParameters& parameters() const { return params_; }

private:
    SimulationParameters params_;
};

// Convenience wrapper for a single path.
Trajectory generatePath(const SimulationParameters& params, RandomGenerator& generator);

} // namespace gbm

#endif // GBM_PATH_GENERATOR_HPP
