#pragma once

#include <optional>
#include <string>
#include <vector>

namespace vibescore {

/// Remember/Know confidence scale used to grade each quiz answer.
///   Remember  - explicitly recalls writing it
///   Familiar  - looks familiar, probably theirs
///   Uncertain - cannot tell who wrote it
///   Foreign   - certain someone else wrote it
enum class ConfidenceLevel {
    Remember,
    Familiar,
    Uncertain,
    Foreign
};

struct Answer {
    ConfidenceLevel level = ConfidenceLevel::Uncertain;
    bool is_self_authored = false;
};

using AnswerLog = std::vector<Answer>;

/// "remember", "familiar", "uncertain" or "foreign".
std::string toString(ConfidenceLevel level);

/// Parse a level by name, or by its 1-based menu index ("1".."4").
std::optional<ConfidenceLevel> parseConfidenceLevel(const std::string& input);

/// True for the two levels that claim authorship.
inline bool claimsAuthorship(ConfidenceLevel level) {
    return level == ConfidenceLevel::Remember || level == ConfidenceLevel::Familiar;
}

} // namespace vibescore
