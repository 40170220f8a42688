#include "gbm/path_generator.hpp"
#include "gbm/distributions.hpp"
#include <cmath>

namespace gbm {

PathGenerator::PathGenerator(const SimulationParameters& params)
    : params_(params) {
    params_.validate();
}

Trajectory PathGenerator::generate(RandomGenerator& generator) const {
    const size_t steps = params_.totalSteps();
    NormalDistribution<double> log_returns(params_.dailyDrift(), params_.dailyVolatility());

    const std::vector<double> draws = log_returns.sampleBatch(generator, steps);

    Trajectory path;
    path.reserve(steps + 1);
    path.push_back(params_.initialPrice);

    double cumulative = 0.0;
    for (double draw : draws) {
        cumulative += draw;
        path.push_back(params_.initialPrice * std::exp(cumulative));
    }
    return path;
}

Trajectory generatePath(const SimulationParameters& params, RandomGenerator& generator) {
    return PathGenerator(params).generate(generator);
}

} // namespace gbm
