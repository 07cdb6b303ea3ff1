#pragma once

#include "config/config.hpp"
#include "model/answer.hpp"
#include <cstddef>

namespace vibescore {

// ─── Track Metrics ─────────────────────────────────────────────
// Tallies for one quiz track (code or comment) and its score.
// Higher score = weaker recognition of one's own work.

struct TrackMetrics {
    int self_total = 0;
    int other_total = 0;

    // self-authored answers
    int remembered = 0;
    int familiar = 0;
    int uncertain = 0;
    int misidentified_as_foreign = 0;

    // other-authored answers
    int correctly_rejected = 0;  // uncertain or foreign
    int false_memory = 0;        // remember or familiar

    double forget_rate = 0.0;
    double fuzzy_rate = 0.0;
    double false_memory_rate = 0.0;

    int score = 0;  // 0..100
};

/// Final result of a quiz session.
struct ScoreBreakdown {
    TrackMetrics code;
    TrackMetrics comment;
    int high_output_days = 0;
    int velocity_bonus = 0;
    int total = 0;  // 0..100
};

// ─── Scoring Engine ────────────────────────────────────────────
// Remember/Know weighted model:
//   forgetRate      = (uncertain + foreign) / max(1, selfAnswers)
//   fuzzyRate       = familiar / max(1, selfAnswers)
//   falseMemoryRate = (remember + familiar on others) / max(1, otherAnswers)
//   track = min(100, round(50*forget + 30*fuzzy + 20*falseMemory))
//   total = min(100, round(0.5*code + 0.35*comment + min(3*days, 15)))

class ScoringEngine {
public:
    explicit ScoringEngine(ScoringWeights weights = {}) : weights_(weights) {}

    TrackMetrics scoreTrack(const AnswerLog& answers) const;

    int velocityBonus(size_t high_output_days) const;

    int composite(int code_score, int comment_score, size_t high_output_days) const;

    ScoreBreakdown score(const AnswerLog& code_answers,
                         const AnswerLog& comment_answers,
                         size_t high_output_days) const;

    const ScoringWeights& weights() const { return weights_; }

private:
    ScoringWeights weights_;
};

} // namespace vibescore
