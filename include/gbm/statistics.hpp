#ifndef GBM_STATISTICS_HPP
#define GBM_STATISTICS_HPP

#include "gbm/errors.hpp"
#include <vector>
#include <cmath>
#include <algorithm>
#include <numeric>

namespace gbm {

// Single-pass mean/variance accumulator (Welford).
template<typename T = double>
class RunningStats {
public:
    void add(T x) {
        ++count_;
        T delta = x - mean_;
        mean_ += delta / static_cast<T>(count_);
        m2_ += delta * (x - mean_);
    }

    size_t count() const { return count_; }
    T mean() const { return mean_; }

    // Sample variance (n - 1 divisor); zero until two values are seen.
    T variance() const {
        return count_ < 2 ? T(0) : m2_ / static_cast<T>(count_ - 1);
    }

    T standardDeviation() const { return std::sqrt(variance()); }

private:
    size_t count_ = 0;
    T mean_ = 0;
    T m2_ = 0;
};

template<typename T>
class StatisticalAnalysis {
public:
    struct Statistics {
        T mean = 0;
        T median = 0;
        T variance = 0;
        T standardDeviation = 0;
        T standardError = 0;
        std::vector<T> quantiles;
        size_t sampleSize = 0;
    };

    // Quantile probabilities are given in [0, 1].
    static Statistics analyze(const std::vector<T>& data,
                              const std::vector<double>& quantile_probs = {0.25, 0.5, 0.75}) {
        if (data.empty()) {
            throw InvalidParameter("Empty data set");
        }

        std::vector<T> sorted_data = data;
        std::sort(sorted_data.begin(), sorted_data.end());

        Statistics stats;
        stats.sampleSize = data.size();
        stats.mean = calculate_mean(data);
        stats.median = percentile(sorted_data, 0.5);
        stats.variance = calculate_variance(data, stats.mean);
        stats.standardDeviation = std::sqrt(stats.variance);
        stats.standardError = stats.standardDeviation / std::sqrt(static_cast<T>(data.size()));

        stats.quantiles.reserve(quantile_probs.size());
        for (double p : quantile_probs) {
            stats.quantiles.push_back(percentile(sorted_data, p));
        }
        return stats;
    }

    // Linear interpolation between the order statistics around rank
    // p * (n - 1). `sorted_data` must be ascending and non-empty.
    static T percentile(const std::vector<T>& sorted_data, double p) {
        if (sorted_data.empty()) {
            throw InvalidParameter("Empty data set");
        }
        if (!(p >= 0.0 && p <= 1.0)) {
            throw InvalidParameter("Quantile probabilities must be between 0 and 1");
        }

        double idx = p * static_cast<double>(sorted_data.size() - 1);
        size_t i = static_cast<size_t>(idx);
        double frac = idx - static_cast<double>(i);

        if (i + 1 >= sorted_data.size()) {
            return sorted_data.back();
        }
        return sorted_data[i] * (1 - frac) + sorted_data[i + 1] * frac;
    }

private:
    static T calculate_mean(const std::vector<T>& data) {
        return std::accumulate(data.begin(), data.end(), T(0)) / static_cast<T>(data.size());
    }

    static T calculate_variance(const std::vector<T>& data, T mean) {
        if (data.size() < 2) return T(0);
        T sum_sq_diff = 0;
        for (const auto& x : data) {
            T diff = x - mean;
            sum_sq_diff += diff * diff;
        }
        return sum_sq_diff / static_cast<T>(data.size() - 1);
    }
};

} // namespace gbm

#endif // GBM_STATISTICS_HPP
