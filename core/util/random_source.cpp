#include "util/random_source.hpp"
#include <stdexcept>

namespace vibescore {

RandomSource RandomSource::fromEntropy() {
    std::random_device rd;
    uint64_t seed = (static_cast<uint64_t>(rd()) << 32) | rd();
    return RandomSource(seed);
}

size_t RandomSource::uniformIndex(size_t lo, size_t hi) {
    if (lo > hi) {
        throw std::invalid_argument("uniformIndex: empty range");
    }
    std::uniform_int_distribution<size_t> dist(lo, hi);
    return dist(engine_);
}

} // namespace vibescore
