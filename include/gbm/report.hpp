#ifndef GBM_REPORT_HPP
#define GBM_REPORT_HPP

#include "gbm/metrics.hpp"
#include "gbm/parameters.hpp"
#include "gbm/simulation_result.hpp"
#include <optional>
#include <string>

namespace gbm {

// Human-readable rendering of engine output. Nothing here feeds back into
// the computations.

// 1234567.891 -> "1,234,567.89" for precision 2.
std::string formatGrouped(double value, int precision);

// "$1,234.57", "-$12.00"
std::string formatCurrency(double value);

// 0.0537 -> "5.37%"
std::string formatPercent(double fraction, int precision = 2);

// A small per-day quantity expressed as "1 in N trials", N = 1 / |value|.
std::string formatOdds(double value);

// "undefined" for an empty metric.
std::string formatOptional(const std::optional<double>& value, int precision = 4);

std::string formatMetricsReport(const SimulationParameters& params,
                                const MetricsRecord& record);

// `theoretical_loss` is printed next to the empirical probability when given.
std::string formatMonteCarloReport(const SimulationParameters& params,
                                   const MonteCarloSummary& summary,
                                   const std::optional<double>& theoretical_loss = std::nullopt);

} // namespace gbm

#endif // GBM_REPORT_HPP
