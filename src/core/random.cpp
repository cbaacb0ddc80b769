#include "drop_synth/core/random.hpp"

namespace drop_synth {

RandomSource::RandomSource(std::uint64_t seed)
    : seed_(seed), gen_(seed) {}

RandomSource RandomSource::from_entropy() {
    std::random_device rd;
    const std::uint64_t hi = rd();
    const std::uint64_t lo = rd();
    return RandomSource((hi << 32) ^ lo);
}

int RandomSource::uniform_int(int lo, int hi) {
    if (hi <= lo) return lo;
    std::uniform_int_distribution<int> dis(lo, hi);
    return dis(gen_);
}

double RandomSource::uniform_real(double lo, double hi) {
    if (!(hi > lo)) return lo;
    std::uniform_real_distribution<double> dis(lo, hi);
    return dis(gen_);
}

bool RandomSource::bernoulli(double p) {
    if (p <= 0.0) return false;
    if (p >= 1.0) return true;
    std::bernoulli_distribution dis(p);
    return dis(gen_);
}

} // namespace drop_synth
