#pragma once

#include <string>

namespace vibescore {

/// Named tier for a composite score.
struct Rating {
    std::string title;
    std::string description;
};

/// Tier boundaries: ≤10, ≤25, ≤40, ≤55, ≤70, ≤85, <100, 100.
Rating rateScore(int total);

/// One-line remark on a code-track score.
std::string codeTrackRemark(int score);

/// One-line remark on a comment-track score.
std::string commentTrackRemark(int score);

} // namespace vibescore
