#pragma once

#include "model/answer.hpp"
#include "model/fragment.hpp"
#include "scoring/scoring_engine.hpp"
#include <cstddef>
#include <vector>

namespace vibescore {

enum class QuizPhase {
    Code,
    Comment,
    Finished
};

// ─── Quiz Session ──────────────────────────────────────────────
// Walks the code track, then the comment track, recording one
// answer per question. Empty tracks are skipped.

class QuizSession {
public:
    QuizSession(std::vector<CodeFragment> code_questions,
                std::vector<CommentFragment> comment_questions,
                size_t high_output_days = 0,
                ScoringEngine engine = ScoringEngine{});

    QuizPhase phase() const { return phase_; }
    bool finished() const { return phase_ == QuizPhase::Finished; }

    /// Current question; only valid in the matching phase.
    const CodeFragment& currentCode() const;
    const CommentFragment& currentComment() const;

    /// 0-based index within the current track.
    size_t questionIndex() const;
    /// Number of questions in the current track.
    size_t trackSize() const;

    /// Record an answer to the current question and advance.
    /// Throws std::logic_error once finished.
    void answer(ConfidenceLevel level);

    const AnswerLog& codeAnswers() const { return code_answers_; }
    const AnswerLog& commentAnswers() const { return comment_answers_; }

    ScoreBreakdown breakdown() const;

private:
    std::vector<CodeFragment> code_questions_;
    std::vector<CommentFragment> comment_questions_;
    size_t high_output_days_;
    ScoringEngine engine_;

    QuizPhase phase_ = QuizPhase::Code;
    AnswerLog code_answers_;
    AnswerLog comment_answers_;

    void settlePhase();
};

} // namespace vibescore
