#include "scoring/scoring_engine.hpp"
#include <algorithm>
#include <cmath>

namespace vibescore {

TrackMetrics ScoringEngine::scoreTrack(const AnswerLog& answers) const {
    TrackMetrics m;

    for (const Answer& a : answers) {
        if (a.is_self_authored) {
            m.self_total++;
            switch (a.level) {
                case ConfidenceLevel::Remember:  m.remembered++; break;
                case ConfidenceLevel::Familiar:  m.familiar++; break;
                case ConfidenceLevel::Uncertain: m.uncertain++; break;
                case ConfidenceLevel::Foreign:   m.misidentified_as_foreign++; break;
            }
        } else {
            m.other_total++;
            if (claimsAuthorship(a.level)) {
                m.false_memory++;
            } else {
                m.correctly_rejected++;
            }
        }
    }

    // Guard against empty ownership groups.
    const double my_total = std::max(1, m.self_total);
    const double other_total = std::max(1, m.other_total);

    m.forget_rate = (m.uncertain + m.misidentified_as_foreign) / my_total;
    m.fuzzy_rate = m.familiar / my_total;
    m.false_memory_rate = m.false_memory / other_total;

    long raw = std::lround(m.forget_rate * weights_.forget +
                           m.fuzzy_rate * weights_.fuzzy +
                           m.false_memory_rate * weights_.false_memory);
    m.score = static_cast<int>(std::min(100L, raw));
    return m;
}

int ScoringEngine::velocityBonus(size_t high_output_days) const {
    long bonus = static_cast<long>(high_output_days) * weights_.velocity_per_day;
    return static_cast<int>(std::min(bonus, static_cast<long>(weights_.velocity_cap)));
}

int ScoringEngine::composite(int code_score, int comment_score, size_t high_output_days) const {
    long raw = std::lround(code_score * weights_.code_track +
                           comment_score * weights_.comment_track +
                           velocityBonus(high_output_days));
    return static_cast<int>(std::min(100L, raw));
}

ScoreBreakdown ScoringEngine::score(const AnswerLog& code_answers,
                                    const AnswerLog& comment_answers,
                                    size_t high_output_days) const {
    ScoreBreakdown b;
    b.code = scoreTrack(code_answers);
    b.comment = scoreTrack(comment_answers);
    b.high_output_days = static_cast<int>(high_output_days);
    b.velocity_bonus = velocityBonus(high_output_days);
    b.total = composite(b.code.score, b.comment.score, high_output_days);
    return b;
}

} // namespace vibescore
