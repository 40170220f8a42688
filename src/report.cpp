#include "gbm/report.hpp"
#include <fmt/format.h>
#include <cmath>
#include <iterator>

namespace gbm {

namespace {

// True when the printed digits of a magnitude are all zeros.
bool rounds_to_zero(const std::string& digits) {
    return digits.find_first_not_of("0.,") == std::string::npos;
}

} // namespace

std::string formatGrouped(double value, int precision) {
    std::string digits = fmt::format("{:.{}f}", std::fabs(value), precision);
    size_t point = digits.find('.');
    size_t int_end = point == std::string::npos ? digits.size() : point;

    std::string grouped;
    grouped.reserve(digits.size() + int_end / 3 + 1);
    for (size_t i = 0; i < int_end; ++i) {
        if (i > 0 && (int_end - i) % 3 == 0) grouped.push_back(',');
        grouped.push_back(digits[i]);
    }
    grouped.append(digits, int_end, std::string::npos);

    return value < 0.0 && !rounds_to_zero(digits) ? "-" + grouped : grouped;
}

std::string formatCurrency(double value) {
    std::string amount = formatGrouped(std::fabs(value), 2);
    return value < 0.0 && !rounds_to_zero(amount) ? "-$" + amount : "$" + amount;
}

std::string formatPercent(double fraction, int precision) {
    return fmt::format("{:.{}f}%", fraction * 100.0, precision);
}

std::string formatOdds(double value) {
    if (value == 0.0 || !std::isfinite(value)) {
        return "undefined";
    }
    return fmt::format("1 in {} trials", formatGrouped(1.0 / std::fabs(value), 1));
}

std::string formatOptional(const std::optional<double>& value, int precision) {
    if (!value) {
        return "undefined";
    }
    return fmt::format("{:.{}f}", *value, precision);
}

std::string formatMetricsReport(const SimulationParameters& params,
                                const MetricsRecord& record) {
    fmt::memory_buffer out;
    auto it = std::back_inserter(out);

    fmt::format_to(it, "Simulation: {} years x {} trading days, mu {}, sigma {}\n",
                   params.horizonYears, params.tradingDaysPerYear,
                   formatPercent(params.expectedAnnualReturn),
                   formatPercent(params.annualVolatility));
    fmt::format_to(it, "{:<28}{:>20}\n", "Initial Price:", formatCurrency(params.initialPrice));
    fmt::format_to(it, "{:<28}{:>20}\n", "Final Price:", formatCurrency(record.finalPrice));
    fmt::format_to(it, "{:<28}{:>20}\n", "Expected Price:", formatCurrency(record.expectedPrice));
    fmt::format_to(it, "{:<28}{:>20}\n", "CAGR:", formatPercent(record.cagr));
    fmt::format_to(it, "{:<28}{:>20}\n", "Max Drawdown:", formatPercent(record.maxDrawdown));
    fmt::format_to(it, "{:<28}{:>20}\n", "Longest Drawdown (days):", record.maxDrawdownDuration);
    fmt::format_to(it, "{:<28}{:>20}\n", "Ended Below Initial:", record.isLoss ? "yes" : "no");
    fmt::format_to(it, "{:<28}{:>20}\n", "Min Price:", formatCurrency(record.minPrice));
    fmt::format_to(it, "{:<28}{:>20}\n", "Max Price:", formatCurrency(record.maxPrice));
    fmt::format_to(it, "{:<28}{:>20}\n", "Positive Days:",
                   record.positiveDaysFraction ? formatPercent(*record.positiveDaysFraction)
                                               : std::string("undefined"));
    fmt::format_to(it, "{:<28}{:>20}\n", "Longest Winning Streak:", record.longestWinningStreak);
    fmt::format_to(it, "{:<28}{:>20}\n", "Longest Losing Streak:", record.longestLosingStreak);
    fmt::format_to(it, "{:<28}{:>20.6f} | {}\n", "Daily Drift:", record.dailyDrift,
                   formatOdds(record.dailyDrift));
    fmt::format_to(it, "{:<28}{:>20.6f} | {}\n", "Daily Volatility:", record.dailyVolatility,
                   formatOdds(record.dailyVolatility));
    fmt::format_to(it, "{:<28}{:>20}\n", "Volatility / Drift:",
                   formatOptional(record.volatilityToDriftRatio, 2));
    fmt::format_to(it, "{:<28}{:>20.6f}\n", "Realized Daily Mean:", record.realizedDailyMean);
    fmt::format_to(it, "{:<28}{:>20.6f}\n", "Realized Daily Volatility:",
                   record.realizedDailyVolatility);

    return fmt::to_string(out);
}

std::string formatMonteCarloReport(const SimulationParameters& params,
                                   const MonteCarloSummary& summary,
                                   const std::optional<double>& theoretical_loss) {
    fmt::memory_buffer out;
    auto it = std::back_inserter(out);

    fmt::format_to(it, "Monte Carlo: {} trials, seed {}, {:.3f}s\n",
                   formatGrouped(static_cast<double>(summary.trials), 0), summary.seed,
                   summary.totalDuration());
    fmt::format_to(it, "{:<28}{:>20}\n", "Initial Price:", formatCurrency(params.initialPrice));
    fmt::format_to(it, "{:<28}{:>20}\n", "Mean Final Price:", formatCurrency(summary.meanFinalPrice));
    fmt::format_to(it, "{:<28}{:>20}\n", "Median Final Price:",
                   formatCurrency(summary.medianFinalPrice));
    fmt::format_to(it, "{:<28}{:>20}\n", "Std Dev Final Price:",
                   formatCurrency(summary.finalPriceStdDev));
    fmt::format_to(it, "{:<28}{:>20}\n",
                   fmt::format("{:g}th Percentile:", summary.lowerPercentileLevel),
                   formatCurrency(summary.lowerPercentile));
    fmt::format_to(it, "{:<28}{:>20}\n",
                   fmt::format("{:g}th Percentile:", summary.upperPercentileLevel),
                   formatCurrency(summary.upperPercentile));
    fmt::format_to(it, "{:<28}{:>20}\n", "Probability of Loss:",
                   formatPercent(summary.probabilityOfLoss));
    if (theoretical_loss) {
        fmt::format_to(it, "{:<28}{:>20}\n", "Closed-Form Loss:", formatPercent(*theoretical_loss));
    }
    fmt::format_to(it, "{:<28}{:>20}\n", "Mean CAGR:", formatPercent(summary.meanCagr));
    fmt::format_to(it, "{:<28}{:>20}\n", "Mean Max Drawdown:", formatPercent(summary.meanMaxDrawdown));
    fmt::format_to(it, "{:<28}{:>20}\n", "Worst Max Drawdown:",
                   formatPercent(summary.worstMaxDrawdown));
    if (summary.degenerateTrials > 0) {
        fmt::format_to(it, "{:<28}{:>20}\n", "Degenerate Trials:", summary.degenerateTrials);
    }

    return fmt::to_string(out);
}

} // namespace gbm
