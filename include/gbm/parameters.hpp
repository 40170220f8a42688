#ifndef GBM_PARAMETERS_HPP
#define GBM_PARAMETERS_HPP

#include "gbm/errors.hpp"
#include <cfloat>
#include <cmath>
#include <cstddef>

namespace gbm {

struct SimulationParameters {
    double initialPrice = 100.0;
    double expectedAnnualReturn = 0.0;   // mu
    double annualVolatility = 0.0;       // sigma
    int horizonYears = 1;
    int tradingDaysPerYear = 260;

    // Derived values are recomputed on every call so they can never go
    // stale relative to the fields above.
    double dt() const { return 1.0 / static_cast<double>(tradingDaysPerYear); }

    size_t totalSteps() const {
        return static_cast<size_t>(horizonYears) * static_cast<size_t>(tradingDaysPerYear);
    }

    double dailyDrift() const {
        return (expectedAnnualReturn - 0.5 * annualVolatility * annualVolatility) * dt();
    }

    double dailyVolatility() const { return annualVolatility * std::sqrt(dt()); }

    void validate() const {
        if (!std::isfinite(initialPrice) || initialPrice <= 0.0) {
            throw InvalidParameter("Initial price must be positive");
        }
        if (!std::isfinite(expectedAnnualReturn)) {
            throw InvalidParameter("Expected annual return must be finite");
        }
        if (!std::isfinite(annualVolatility) || annualVolatility < 0.0) {
            throw InvalidParameter("Annual volatility must be non-negative");
        }
        if (horizonYears <= 0) {
            throw InvalidParameter("Horizon must be a positive number of years");
        }
        if (tradingDaysPerYear <= 0) {
            throw InvalidParameter("Trading days per year must be positive");
        }

        // Every price of a path must stay a positive finite double. The log
        // price drifts linearly and its noise grows with sqrt(T), so both
        // extremes are reached at the horizon; 40 standard deviations is
        // far past anything a draw can produce.
        const double years = static_cast<double>(horizonYears);
        const double drift = dailyDrift() * static_cast<double>(totalSteps());
        const double spread = 40.0 * annualVolatility * std::sqrt(years);
        const double headroom = std::log(DBL_MAX) - std::log(initialPrice);
        const double lowest = std::log(DBL_MIN) - std::log(initialPrice);
        if (!(drift + spread < headroom) || !(drift - spread > lowest)) {
            throw InvalidParameter(
                "Expected return and volatility push prices outside the double range");
        }
    }
};

} // namespace gbm

#endif // GBM_PARAMETERS_HPP
