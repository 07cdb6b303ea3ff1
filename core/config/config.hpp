#pragma once

#include <cstddef>

namespace vibescore {

/// Block and window sizing for snippet extraction.
struct ExtractionConfig {
    size_t min_snippet_lines = 4;
    size_t max_snippet_lines = 12;
    double window_ratio = 0.7;        // target share of a block kept as snippet
    size_t context_ring_size = 5;     // recent code lines remembered for comments
    size_t comment_context_lines = 2;
    size_t comment_min_length = 15;   // shorter comment lines count as noise
    size_t comment_gate_length = 20;  // a comment block needs one line longer than this
    size_t noise_min_length = 8;
};

struct DedupConfig {
    double similarity_threshold = 0.8;  // strict: ratio must exceed it
    size_t fingerprint_length = 200;
};

struct VelocityConfig {
    int min_lines_per_day = 500;    // strict: days must exceed it
    size_t max_days = 10;
    size_t sample_size = 300;       // newest changes considered
};

struct SamplerConfig {
    size_t questions_per_track = 10;
    double self_share = 0.6;
    size_t min_questions = 3;
};

/// Weights of the recognition score. The three track weights are
/// applied to rates in [0, 1] and sum to the 100-point scale.
struct ScoringWeights {
    double forget = 50.0;
    double fuzzy = 30.0;
    double false_memory = 20.0;
    double code_track = 0.5;
    double comment_track = 0.35;
    int velocity_per_day = 3;
    int velocity_cap = 15;
};

/// Configuration for one analysis run.
struct PipelineConfig {
    int max_commits = 2000;         // history depth scanned for ids and authors
    size_t sample_commits = 300;    // shuffled changes mined for snippets
    ExtractionConfig extraction;
    DedupConfig dedup;
    VelocityConfig velocity;
    SamplerConfig sampler;
    ScoringWeights scoring;

    /// Throws std::invalid_argument if the values are inconsistent.
    void validate() const;
};

} // namespace vibescore
