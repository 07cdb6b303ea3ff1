#include "quiz/quiz_session.hpp"
#include <stdexcept>
#include <utility>

namespace vibescore {

QuizSession::QuizSession(std::vector<CodeFragment> code_questions,
                         std::vector<CommentFragment> comment_questions,
                         size_t high_output_days,
                         ScoringEngine engine)
    : code_questions_(std::move(code_questions)),
      comment_questions_(std::move(comment_questions)),
      high_output_days_(high_output_days),
      engine_(engine) {
    settlePhase();
}

void QuizSession::settlePhase() {
    if (phase_ == QuizPhase::Code && code_answers_.size() >= code_questions_.size()) {
        phase_ = QuizPhase::Comment;
    }
    if (phase_ == QuizPhase::Comment && comment_answers_.size() >= comment_questions_.size()) {
        phase_ = QuizPhase::Finished;
    }
}

const CodeFragment& QuizSession::currentCode() const {
    if (phase_ != QuizPhase::Code) {
        throw std::logic_error("No current code question");
    }
    return code_questions_[code_answers_.size()];
}

const CommentFragment& QuizSession::currentComment() const {
    if (phase_ != QuizPhase::Comment) {
        throw std::logic_error("No current comment question");
    }
    return comment_questions_[comment_answers_.size()];
}

size_t QuizSession::questionIndex() const {
    switch (phase_) {
        case QuizPhase::Code:     return code_answers_.size();
        case QuizPhase::Comment:  return comment_answers_.size();
        case QuizPhase::Finished: return 0;
    }
    return 0;
}

size_t QuizSession::trackSize() const {
    switch (phase_) {
        case QuizPhase::Code:     return code_questions_.size();
        case QuizPhase::Comment:  return comment_questions_.size();
        case QuizPhase::Finished: return 0;
    }
    return 0;
}

void QuizSession::answer(ConfidenceLevel level) {
    switch (phase_) {
        case QuizPhase::Code:
            code_answers_.push_back({level, currentCode().is_self_authored});
            break;
        case QuizPhase::Comment:
            comment_answers_.push_back({level, currentComment().is_self_authored});
            break;
        case QuizPhase::Finished:
            throw std::logic_error("Quiz already finished");
    }
    settlePhase();
}

ScoreBreakdown QuizSession::breakdown() const {
    return engine_.score(code_answers_, comment_answers_, high_output_days_);
}

} // namespace vibescore
