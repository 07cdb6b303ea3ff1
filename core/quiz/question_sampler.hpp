#pragma once

#include "config/config.hpp"
#include "util/random_source.hpp"
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace vibescore {

/// How many self-authored and other-authored items a track receives.
struct TrackPlan {
    size_t self_count = 0;
    size_t other_count = 0;

    size_t total() const { return self_count + other_count; }
};

// ─── Question Sampler ──────────────────────────────────────────
// Balances a track between self- and other-authored fragments:
//   self  = min(ceil(Q * self_share), selfPool)
//   other = min(Q - self, otherPool)
//   self' = min(Q - other, selfPool)   (reclaims slots a short
//                                        other-pool left unused)
// Each pool is shuffled before slicing; the combined list is shuffled
// again to give the question order.

class QuestionSampler {
public:
    explicit QuestionSampler(SamplerConfig config = {}) : config_(config) {}

    TrackPlan plan(size_t self_pool, size_t other_pool) const;

    template <typename Fragment>
    std::vector<Fragment> sample(std::vector<Fragment> self_pool,
                                 std::vector<Fragment> other_pool,
                                 RandomSource& rng) const {
        TrackPlan p = plan(self_pool.size(), other_pool.size());
        rng.shuffle(self_pool);
        rng.shuffle(other_pool);

        std::vector<Fragment> questions;
        questions.reserve(p.total());
        questions.insert(questions.end(), self_pool.begin(),
                         self_pool.begin() + static_cast<std::ptrdiff_t>(p.self_count));
        questions.insert(questions.end(), other_pool.begin(),
                         other_pool.begin() + static_cast<std::ptrdiff_t>(p.other_count));
        rng.shuffle(questions);
        return questions;
    }

    /// Split a pool by authorship and sample it.
    template <typename Fragment>
    std::vector<Fragment> sampleMixed(const std::vector<Fragment>& pool,
                                      RandomSource& rng) const {
        std::vector<Fragment> self_pool, other_pool;
        for (const auto& f : pool) {
            (f.is_self_authored ? self_pool : other_pool).push_back(f);
        }
        return sample(std::move(self_pool), std::move(other_pool), rng);
    }

    /// Throws InsufficientMaterial if a track has fewer than
    /// min_questions questions.
    void requireSufficient(const std::string& track, size_t question_count) const;

    const SamplerConfig& config() const { return config_; }

private:
    SamplerConfig config_;
};

} // namespace vibescore
