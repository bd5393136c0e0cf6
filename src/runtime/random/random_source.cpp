/**
 * @file random_source.cpp
 * @brief Random source implementation.
 */

#include "progspace/random_source.hpp"

#include <stdexcept>

namespace progspace {

double RandomSource::random() {
    ++draws_;
    // Top 53 bits scaled by 2^-53
    return static_cast<double>(engine_() >> 11) * (1.0 / 9007199254740992.0);
}

size_t RandomSource::choice(const std::vector<double>& weights) {
    if (weights.empty()) {
        throw std::invalid_argument("RandomSource: choice needs at least one weight");
    }

    double total = 0.0;
    for (double w : weights) {
        if (w < 0.0) {
            throw std::invalid_argument("RandomSource: weights must be non-negative");
        }
        total += w;
    }
    if (!(total > 0.0)) {
        throw std::invalid_argument("RandomSource: weights must have a positive sum");
    }

    // Cumulative scan; the first bucket whose running sum exceeds the
    // scaled draw wins. Zero-weight buckets can never win.
    double x = random() * total;
    double acc = 0.0;
    size_t last_nonzero = 0;
    for (size_t i = 0; i < weights.size(); ++i) {
        if (weights[i] <= 0.0) {
            continue;
        }
        acc += weights[i];
        last_nonzero = i;
        if (x < acc) {
            return i;
        }
    }

    // Rounding can leave x == total
    return last_nonzero;
}

void RandomSource::reseed(uint64_t seed) {
    seed_ = seed;
    engine_.seed(seed);
    draws_ = 0;
}

}  // namespace progspace
