#include "config/config.hpp"
#include <stdexcept>
#include <string>

namespace vibescore {

namespace {

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::invalid_argument("Invalid configuration: " + message);
    }
}

} // namespace

void PipelineConfig::validate() const {
    require(max_commits > 0, "max_commits must be positive");
    require(sample_commits > 0, "sample_commits must be positive");

    require(extraction.min_snippet_lines > 0, "min_snippet_lines must be positive");
    require(extraction.min_snippet_lines <= extraction.max_snippet_lines,
            "min_snippet_lines exceeds max_snippet_lines");
    require(extraction.window_ratio > 0.0 && extraction.window_ratio <= 1.0,
            "window_ratio must be in (0, 1]");
    require(extraction.comment_context_lines <= extraction.context_ring_size,
            "comment_context_lines exceeds context_ring_size");

    require(dedup.similarity_threshold >= 0.0 && dedup.similarity_threshold <= 1.0,
            "similarity_threshold must be in [0, 1]");
    require(dedup.fingerprint_length > 0, "fingerprint_length must be positive");

    require(velocity.min_lines_per_day >= 0, "min_lines_per_day must not be negative");

    require(sampler.questions_per_track > 0, "questions_per_track must be positive");
    require(sampler.self_share >= 0.0 && sampler.self_share <= 1.0,
            "self_share must be in [0, 1]");
    require(sampler.min_questions <= sampler.questions_per_track,
            "min_questions exceeds questions_per_track");

    require(scoring.velocity_per_day >= 0 && scoring.velocity_cap >= 0,
            "velocity weights must not be negative");
}

} // namespace vibescore
