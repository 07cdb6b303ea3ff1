#include "extraction/block_accumulator.hpp"
#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>

namespace vibescore {

void FinishedBlocks::append(FinishedBlocks&& other) {
    code.insert(code.end(),
                std::make_move_iterator(other.code.begin()),
                std::make_move_iterator(other.code.end()));
    comments.insert(comments.end(),
                    std::make_move_iterator(other.comments.begin()),
                    std::make_move_iterator(other.comments.end()));
}

BlockAccumulator::BlockAccumulator(ExtractionConfig config)
    : config_(config) {}

FinishedBlocks BlockAccumulator::observe(const std::string& line, LineCategory category) {
    FinishedBlocks out;
    switch (category) {
        case LineCategory::Boilerplate:
            break;
        case LineCategory::Comment:
            comment_buffer_.push_back(line);
            break;
        case LineCategory::Code:
            flushComment(out);
            code_buffer_.push_back(line);
            context_ring_.push_back(line);
            while (context_ring_.size() > config_.context_ring_size) {
                context_ring_.pop_front();
            }
            break;
        case LineCategory::Noise:
            flushComment(out);
            closeCode(out);
            break;
    }
    return out;
}

FinishedBlocks BlockAccumulator::boundary() {
    FinishedBlocks out;
    closeCode(out);
    return out;
}

FinishedBlocks BlockAccumulator::finish() {
    FinishedBlocks out;
    closeCode(out);
    flushComment(out);
    return out;
}

void BlockAccumulator::closeCode(FinishedBlocks& out) {
    if (code_buffer_.size() >= config_.min_snippet_lines) {
        out.code.push_back({std::move(code_buffer_)});
    }
    code_buffer_.clear();
}

void BlockAccumulator::flushComment(FinishedBlocks& out) {
    if (comment_buffer_.empty()) return;

    CommentBlock block;
    block.comment_lines = std::move(comment_buffer_);
    size_t n = std::min(config_.comment_context_lines, context_ring_.size());
    block.context_lines.assign(context_ring_.end() - static_cast<std::ptrdiff_t>(n),
                               context_ring_.end());
    out.comments.push_back(std::move(block));
    comment_buffer_.clear();
}

} // namespace vibescore
