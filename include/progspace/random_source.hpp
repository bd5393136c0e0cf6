/**
 * @file random_source.hpp
 * @brief Seedable random source for target selection.
 *
 * Every sampling operation takes a RandomSource explicitly, so a run is
 * reproducible from its seed alone. Draws are derived from the raw
 * 64-bit engine output rather than std distributions, whose results
 * differ between standard library implementations.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace progspace {

/**
 * @class RandomSource
 * @brief Deterministic 64-bit Mersenne Twister with the draws we need.
 */
class RandomSource {
public:
    explicit RandomSource(uint64_t seed) : seed_(seed), engine_(seed) {}

    // Non-copyable, movable
    RandomSource(const RandomSource&) = delete;
    RandomSource& operator=(const RandomSource&) = delete;
    RandomSource(RandomSource&&) noexcept = default;
    RandomSource& operator=(RandomSource&&) noexcept = default;

    /**
     * @brief Uniform double in [0, 1) with 53 bits of precision.
     *
     * Consumes exactly one engine output.
     */
    double random();

    /**
     * @brief Pick an index with probability proportional to its weight.
     *
     * Consumes exactly one draw.
     *
     * @param weights Non-negative weights with a positive sum.
     * @return Index into weights.
     * @throws std::invalid_argument if weights is empty, a weight is
     *         negative, or the total is not positive.
     */
    size_t choice(const std::vector<double>& weights);

    /// Restart the sequence from a new seed
    void reseed(uint64_t seed);

    uint64_t seed() const noexcept { return seed_; }

    /// Number of draws taken since construction or the last reseed
    uint64_t draws() const noexcept { return draws_; }

private:
    uint64_t seed_;
    std::mt19937_64 engine_;
    uint64_t draws_ = 0;
};

}  // namespace progspace
