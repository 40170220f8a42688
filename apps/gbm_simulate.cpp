#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "gbm/errors.hpp"
#include "gbm/logging.hpp"
#include "gbm/metrics.hpp"
#include "gbm/monte_carlo.hpp"
#include "gbm/path_generator.hpp"
#include "gbm/random.hpp"
#include "gbm/report.hpp"

namespace {

void print_usage(const char* program) {
    std::cerr << "usage: " << program
              << " [initial_price] [mu] [sigma] [years] [trials] [seed] [log_level]\n";
}

} // namespace

int main(int argc, char** argv) {
    gbm::SimulationParameters model;
    model.initialPrice = 10000.0;
    model.expectedAnnualReturn = 0.07;
    model.annualVolatility = 0.15;
    model.horizonYears = 30;
    model.tradingDaysPerYear = 260;

    gbm::MonteCarloDriver::Parameters batch;
    batch.trials = 1000;
    batch.num_threads = 4;

    try {
        if (argc > 1) model.initialPrice = std::stod(argv[1]);
        if (argc > 2) model.expectedAnnualReturn = std::stod(argv[2]);
        if (argc > 3) model.annualVolatility = std::stod(argv[3]);
        if (argc > 4) model.horizonYears = std::stoi(argv[4]);
        if (argc > 5) batch.trials = static_cast<size_t>(std::stoul(argv[5]));
        if (argc > 6) batch.seed = std::stoull(argv[6]);
        if (argc > 7) gbm::setLogLevel(argv[7]);
    } catch (const std::logic_error& e) {
        std::cerr << "invalid argument: " << e.what() << '\n';
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try {
        auto rng = gbm::RandomGenerator::create(batch.generator, batch.seed);
        const gbm::Trajectory path = gbm::generatePath(model, *rng);
        const gbm::MetricsRecord record = gbm::MetricsCalculator::compute(model, path);
        std::cout << gbm::formatMetricsReport(model, record) << '\n';

        const gbm::MonteCarloDriver driver(model);
        const gbm::MonteCarloSummary summary = driver.run(batch);

        std::optional<double> closed_form;
        if (model.annualVolatility > 0.0) {
            closed_form = gbm::theoreticalLossProbability(model);
        }
        std::cout << gbm::formatMonteCarloReport(model, summary, closed_form);
    } catch (const gbm::InvalidParameter& e) {
        spdlog::error("invalid simulation parameters: {}", e.what());
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
