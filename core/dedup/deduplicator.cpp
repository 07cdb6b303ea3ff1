#include "dedup/deduplicator.hpp"
#include <algorithm>

namespace vibescore {

double positionalSimilarity(const std::string& a, const std::string& b) {
    size_t n = std::min(a.size(), b.size());
    if (n == 0) return 0.0;
    size_t same = 0;
    for (size_t i = 0; i < n; i++) {
        if (a[i] == b[i]) same++;
    }
    return static_cast<double>(same) / static_cast<double>(n);
}

bool Deduplicator::isDuplicate(const std::string& a, const std::string& b) const {
    if (a == b) return true;
    return positionalSimilarity(a, b) > config_.similarity_threshold;
}

} // namespace vibescore
