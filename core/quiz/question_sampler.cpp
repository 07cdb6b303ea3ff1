#include "quiz/question_sampler.hpp"
#include "model/errors.hpp"
#include <algorithm>
#include <cmath>

namespace vibescore {

TrackPlan QuestionSampler::plan(size_t self_pool, size_t other_pool) const {
    const size_t q = config_.questions_per_track;
    size_t desired_self = static_cast<size_t>(
        std::ceil(static_cast<double>(q) * config_.self_share));
    desired_self = std::min({desired_self, self_pool, q});

    TrackPlan p;
    p.other_count = std::min(q - desired_self, other_pool);
    p.self_count = std::min(q - p.other_count, self_pool);
    return p;
}

void QuestionSampler::requireSufficient(const std::string& track, size_t question_count) const {
    if (question_count < config_.min_questions) {
        throw InsufficientMaterial(track, question_count, config_.min_questions);
    }
}

} // namespace vibescore
