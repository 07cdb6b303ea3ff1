#pragma once

#include "config/config.hpp"
#include <string>
#include <unordered_set>
#include <vector>

namespace vibescore {

/// Fraction of positions i < min(|a|, |b|) where a[i] == b[i].
/// 0.0 when either string is empty.
double positionalSimilarity(const std::string& a, const std::string& b);

// ─── Deduplicator ──────────────────────────────────────────────
// Two fingerprints are duplicates if they are identical or their
// positional similarity strictly exceeds the threshold. Each candidate
// is compared against every fragment accepted so far (O(n²)); the
// first match rejects it. Works on any fragment type with a
// `fingerprint` member.

class Deduplicator {
public:
    explicit Deduplicator(DedupConfig config = {}) : config_(config) {}

    bool isDuplicate(const std::string& a, const std::string& b) const;

    template <typename Fragment>
    std::vector<Fragment> deduplicate(const std::vector<Fragment>& fragments) const {
        std::vector<Fragment> accepted;
        std::unordered_set<std::string> seen;
        for (const auto& candidate : fragments) {
            if (seen.count(candidate.fingerprint)) continue;
            bool duplicate = false;
            for (const auto& existing : accepted) {
                if (isDuplicate(candidate.fingerprint, existing.fingerprint)) {
                    duplicate = true;
                    break;
                }
            }
            if (!duplicate) {
                seen.insert(candidate.fingerprint);
                accepted.push_back(candidate);
            }
        }
        return accepted;
    }

    const DedupConfig& config() const { return config_; }

private:
    DedupConfig config_;
};

} // namespace vibescore
