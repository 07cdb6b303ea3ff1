#pragma once

#include "config/config.hpp"
#include "extraction/pattern_classifier.hpp"
#include <deque>
#include <string>
#include <vector>

namespace vibescore {

/// A maximal run of inserted substantive code lines.
struct CodeBlock {
    std::vector<std::string> lines;
};

/// A run of inserted comment lines with the code that preceded it.
struct CommentBlock {
    std::vector<std::string> comment_lines;
    std::vector<std::string> context_lines;
};

/// Blocks completed by a single accumulator transition.
struct FinishedBlocks {
    std::vector<CodeBlock> code;
    std::vector<CommentBlock> comments;

    bool empty() const { return code.empty() && comments.empty(); }
    void append(FinishedBlocks&& other);
};

// ─── Block Accumulator ─────────────────────────────────────────
// Explicit state machine over the classified lines of one file.
//
// State: code buffer, comment buffer, ring of the last N code lines.
// Transitions:
//   Comment     → append to the comment buffer
//   Code        → flush the comment buffer (context = last 2 ring
//                 lines before this one), append to code buffer, push
//                 onto the ring
//   Noise       → flush the comment buffer, then close the code buffer
//   boundary()  → close the code buffer
//   finish()    → close the code buffer and flush the comment buffer
// Closing emits the code buffer as a block if it holds at least
// min_snippet_lines lines and clears it either way.
// Boilerplate lines are ignored and leave all state unchanged.

class BlockAccumulator {
public:
    explicit BlockAccumulator(ExtractionConfig config = {});

    /// Feed one added line with its category.
    FinishedBlocks observe(const std::string& line, LineCategory category);

    /// Hunk restart, context line or deletion line.
    FinishedBlocks boundary();

    /// End of the file section.
    FinishedBlocks finish();

    size_t pendingCodeLines() const { return code_buffer_.size(); }
    size_t pendingCommentLines() const { return comment_buffer_.size(); }
    const std::deque<std::string>& contextRing() const { return context_ring_; }

private:
    ExtractionConfig config_;
    std::vector<std::string> code_buffer_;
    std::vector<std::string> comment_buffer_;
    std::deque<std::string> context_ring_;

    void closeCode(FinishedBlocks& out);
    void flushComment(FinishedBlocks& out);
};

} // namespace vibescore
