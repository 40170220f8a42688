#ifndef GBM_MONTE_CARLO_HPP
#define GBM_MONTE_CARLO_HPP

#include "gbm/metrics.hpp"
#include "gbm/parameters.hpp"
#include "gbm/path_generator.hpp"
#include "gbm/random.hpp"
#include "gbm/simulation_result.hpp"
#include <cstdint>
#include <vector>

namespace gbm {

class MonteCarloDriver {
public:
    struct Parameters {
        size_t trials = 10000;
        size_t num_threads = 1;
        std::uint64_t seed = 42;
        RandomGeneratorType generator = RandomGeneratorType::MERSENNE_TWISTER;
        double lower_percentile = 2.5;   // percent
        double upper_percentile = 97.5;  // percent
    };

    // Throws InvalidParameter before any trial runs.
    explicit MonteCarloDriver(const SimulationParameters& model);

    MonteCarloSummary run(const Parameters& params) const;
    MonteCarloSummary run() const { return run(Parameters{}); }

    // Trial `index` of a batch seeded with `params.seed`. Trials only depend
    // on their index, so a batch gives the same sequence for any thread count.
    MetricsRecord runTrial(size_t index, const Parameters& params) const;

private:
    struct TrialOutcome {
        double finalPrice = 0;
        bool isLoss = false;
        double cagr = 0;
        double maxDrawdown = 0;
        bool degenerate = false;
    };

    PathGenerator generator_;

    void validate_parameters(const Parameters& params) const;

    std::vector<TrialOutcome> run_block(size_t first, size_t count,
                                        const Parameters& params) const;

    void summarize(const std::vector<TrialOutcome>& outcomes,
                   const Parameters& params,
                   MonteCarloSummary& summary) const;
};

} // namespace gbm

#endif // GBM_MONTE_CARLO_HPP
