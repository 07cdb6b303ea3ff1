#pragma once

#include "config/config.hpp"
#include "extraction/block_accumulator.hpp"
#include "extraction/diff_segmenter.hpp"
#include "extraction/pattern_classifier.hpp"
#include "extraction/snippet_windower.hpp"
#include "model/fragment.hpp"
#include "model/identity.hpp"
#include "util/random_source.hpp"
#include <string>
#include <vector>

namespace vibescore {

struct ExtractedSnippets {
    std::vector<CodeFragment> code;
    std::vector<CommentFragment> comments;
};

// ─── Snippet Extractor ─────────────────────────────────────────
// Runs segmenter → classifier → accumulator → windower over the diff
// of a single change. One code fragment per finished code block; one
// comment fragment per comment block that has a line longer than
// comment_gate_length once trimmed.

class SnippetExtractor {
public:
    explicit SnippetExtractor(ExtractionConfig config = {}, size_t fingerprint_length = 200);
    SnippetExtractor(ExtractionConfig config, PatternClassifier classifier,
                     FileFilter filter, size_t fingerprint_length = 200);

    ExtractedSnippets extract(const std::string& diff,
                              const Identity& author,
                              const std::string& change_id,
                              bool is_self_authored,
                              RandomSource& rng) const;

    const PatternClassifier& classifier() const { return classifier_; }

private:
    ExtractionConfig config_;
    PatternClassifier classifier_;
    DiffSegmenter segmenter_;
    SnippetWindower windower_;
    size_t fingerprint_length_;

    bool passesCommentGate(const CommentBlock& block) const;
};

} // namespace vibescore
