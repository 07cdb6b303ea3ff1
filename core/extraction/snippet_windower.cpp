#include "extraction/snippet_windower.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>

namespace vibescore {

SnippetWindower::SnippetWindower(ExtractionConfig config)
    : config_(config) {}

size_t SnippetWindower::windowLength(size_t block_length) const {
    if (block_length < config_.min_snippet_lines) {
        throw std::invalid_argument("Code block shorter than " +
                                    std::to_string(config_.min_snippet_lines) + " lines");
    }
    size_t upper = std::min(config_.max_snippet_lines, block_length);
    size_t target = static_cast<size_t>(
        std::floor(static_cast<double>(block_length) * config_.window_ratio));
    return std::min(upper, std::max(config_.min_snippet_lines, target));
}

std::vector<std::string> SnippetWindower::window(const std::vector<std::string>& block,
                                                 RandomSource& rng) const {
    size_t len = windowLength(block.size());
    size_t start = rng.uniformIndex(0, block.size() - len);
    auto first = block.begin() + static_cast<std::ptrdiff_t>(start);
    return std::vector<std::string>(first, first + static_cast<std::ptrdiff_t>(len));
}

} // namespace vibescore
