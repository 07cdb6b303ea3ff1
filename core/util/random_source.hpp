#pragma once

#include <algorithm>
#include <cstdint>
#include <random>
#include <vector>

namespace vibescore {

// ─── Random Source ─────────────────────────────────────────────
// The single source of randomness for windowing and sampling.
// Passed explicitly so runs can be replayed from a seed.

class RandomSource {
public:
    explicit RandomSource(uint64_t seed) : seed_(seed), engine_(seed) {}

    /// Seeded from std::random_device.
    static RandomSource fromEntropy();

    /// Uniform integer in [lo, hi] inclusive. Requires lo <= hi.
    size_t uniformIndex(size_t lo, size_t hi);

    /// Uniform in-place permutation.
    template <typename T>
    void shuffle(std::vector<T>& items) {
        std::shuffle(items.begin(), items.end(), engine_);
    }

    uint64_t seed() const { return seed_; }

private:
    uint64_t seed_;
    std::mt19937_64 engine_;
};

} // namespace vibescore
