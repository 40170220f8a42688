#ifndef GBM_RANDOM_HPP
#define GBM_RANDOM_HPP

#include <cstdint>
#include <random>
#include <memory>
#include <string>
#include <stdexcept>

namespace gbm {

enum class RandomGeneratorType {
    MERSENNE_TWISTER,
    XOR_SHIFT
};

// Uniform source on [0, 1). Normal draws are derived from it by
// NormalDistribution, so any generator can drive the path generator.
class RandomGenerator {
public:
    virtual ~RandomGenerator() = default;
    virtual double generate() = 0;
    virtual std::string name() const = 0;

    static std::unique_ptr<RandomGenerator> create(
        RandomGeneratorType type, std::uint64_t seed_value);
};

class MersenneTwisterGenerator : public RandomGenerator {
public:
    explicit MersenneTwisterGenerator(std::uint64_t seed_value);

    double generate() override;
    std::string name() const override { return "Mersenne Twister"; }

private:
    std::mt19937_64 engine_;
};

class XorShiftGenerator : public RandomGenerator {
public:
    explicit XorShiftGenerator(std::uint64_t seed_value);

    double generate() override;
    std::string name() const override { return "XorShift"; }

private:
    std::uint64_t state_;
};

std::string generatorName(RandomGeneratorType type);

// Seed for stream `index` of a batch started from `base_seed`. Uses the
// splitmix64 finalizer so neighbouring indices give unrelated seeds.
std::uint64_t streamSeed(std::uint64_t base_seed, std::uint64_t index);

} // namespace gbm

#endif // GBM_RANDOM_HPP
