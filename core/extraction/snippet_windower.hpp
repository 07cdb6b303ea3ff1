#pragma once

#include "config/config.hpp"
#include "util/random_source.hpp"
#include <string>
#include <vector>

namespace vibescore {

// ─── Snippet Windower ──────────────────────────────────────────
// Cuts exactly one contiguous window out of a finished code block:
//   len   = clamp(floor(L * window_ratio), min_lines, min(max_lines, L))
//   start ~ uniform [0, L - len]

class SnippetWindower {
public:
    explicit SnippetWindower(ExtractionConfig config = {});

    /// Window length for a block of block_length lines.
    /// Throws std::invalid_argument below min_snippet_lines.
    size_t windowLength(size_t block_length) const;

    /// The window itself; the start offset is drawn from rng.
    std::vector<std::string> window(const std::vector<std::string>& block,
                                    RandomSource& rng) const;

private:
    ExtractionConfig config_;
};

} // namespace vibescore
