#pragma once

#include "drop_synth/core/errors.hpp"

#include <cstdint>
#include <random>
#include <vector>

namespace drop_synth {

/**
 * Explicit random source threaded through every drawing step.
 * One instance per generation call (or per worker thread); never shared
 * between threads without external locking.
 */
class RandomSource {
public:
    explicit RandomSource(std::uint64_t seed);

    // Seed drawn from std::random_device.
    static RandomSource from_entropy();

    std::uint64_t seed() const { return seed_; }

    // Inclusive on both ends; hi < lo collapses to lo.
    int uniform_int(int lo, int hi);

    // Half-open [lo, hi).
    double uniform_real(double lo, double hi);

    bool bernoulli(double p);

    template <typename T>
    const T& pick(const std::vector<T>& items) {
        if (items.empty()) {
            throw ValidationError("cannot pick from an empty set");
        }
        const int idx = uniform_int(0, static_cast<int>(items.size()) - 1);
        return items[static_cast<size_t>(idx)];
    }

private:
    std::uint64_t seed_;
    std::mt19937_64 gen_;
};

} // namespace drop_synth
