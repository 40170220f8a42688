#ifndef GBM_DISTRIBUTIONS_HPP
#define GBM_DISTRIBUTIONS_HPP

#include "gbm/errors.hpp"
#include "gbm/random.hpp"
#include <cmath>
#include <vector>

namespace gbm {

// Normal law N(mean, stddev) driven by a uniform generator through the
// Box-Muller transform. A zero standard deviation is allowed and makes
// every draw equal to the mean.
template<typename T = double>
class NormalDistribution {
public:
    NormalDistribution(T mean = 0.0, T stddev = 1.0)
        : mean_(mean), stddev_(stddev) {
        if (!std::isfinite(mean)) {
            throw InvalidParameter("Mean must be finite");
        }
        if (!std::isfinite(stddev) || stddev < 0) {
            throw InvalidParameter("Standard deviation must be non-negative");
        }
    }

    T sample(RandomGenerator& generator) {
        // Box-Muller transform
        if (!has_cached_value_) {
            double u1 = generator.generate();
            while (u1 <= 0.0) {
                u1 = generator.generate();
            }
            double u2 = generator.generate();

            double mag = stddev_ * std::sqrt(-2.0 * std::log(u1));
            double z1 = mag * std::cos(2 * M_PI * u2) + mean_;
            double z2 = mag * std::sin(2 * M_PI * u2) + mean_;

            cached_value_ = z2;
            has_cached_value_ = true;
            return static_cast<T>(z1);
        } else {
            has_cached_value_ = false;
            return static_cast<T>(cached_value_);
        }
    }

    std::vector<T> sampleBatch(RandomGenerator& generator, size_t n) {
        std::vector<T> result;
        result.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            result.push_back(sample(generator));
        }
        return result;
    }

    // Step function when the standard deviation is zero.
    T cdf(T x) const {
        if (stddev_ == 0) {
            return x < mean_ ? T(0) : T(1);
        }
        T z = (x - mean_) / stddev_;
        return 0.5 * (1 + std::erf(z / std::sqrt(2)));
    }

private:
    T mean_;
    T stddev_;
    double cached_value_ = 0.0;
    bool has_cached_value_ = false;
};

} // namespace gbm

#endif // GBM_DISTRIBUTIONS_HPP
