#include "gbm/random.hpp"

namespace gbm {

namespace {

// Both engines produce 64-bit words; the top 53 bits scaled by 2^-53 give
// a double in [0, 1) with every value equally likely.
constexpr double INV_2_53 = 1.0 / 9007199254740992.0;

double to_unit_interval(std::uint64_t bits) {
    return static_cast<double>(bits >> 11) * INV_2_53;
}

} // namespace

MersenneTwisterGenerator::MersenneTwisterGenerator(std::uint64_t seed_value)
    : engine_(seed_value) {}

double MersenneTwisterGenerator::generate() {
    return to_unit_interval(engine_());
}

// xorshift64 has no zero state; zero seeds are mapped to 1.
XorShiftGenerator::XorShiftGenerator(std::uint64_t seed_value)
    : state_(seed_value == 0 ? 1 : seed_value) {}

double XorShiftGenerator::generate() {
    state_ ^= state_ << 13;
    state_ ^= state_ >> 7;
    state_ ^= state_ << 17;
    return to_unit_interval(state_);
}

std::unique_ptr<RandomGenerator> RandomGenerator::create(RandomGeneratorType type,
                                                         std::uint64_t seed_value) {
    switch (type) {
        case RandomGeneratorType::MERSENNE_TWISTER:
            return std::make_unique<MersenneTwisterGenerator>(seed_value);
        case RandomGeneratorType::XOR_SHIFT:
            return std::make_unique<XorShiftGenerator>(seed_value);
        default:
            throw std::runtime_error("Unknown random generator type");
    }
}

std::string generatorName(RandomGeneratorType type) {
    switch (type) {
        case RandomGeneratorType::MERSENNE_TWISTER:
            return "Mersenne Twister";
        case RandomGeneratorType::XOR_SHIFT:
            return "XorShift";
        default:
            throw std::runtime_error("Unknown random generator type");
    }
}

std::uint64_t streamSeed(std::uint64_t base_seed, std::uint64_t index) {
    std::uint64_t z = base_seed + (index + 1) * 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

} // namespace gbm
