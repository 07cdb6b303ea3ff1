#include "extraction/snippet_extractor.hpp"
#include "extraction/block_accumulator.hpp"
#include "extraction/fingerprint.hpp"
#include "util/text.hpp"
#include <utility>

namespace vibescore {

namespace {

constexpr size_t kShortChangeIdLength = 7;

} // namespace

SnippetExtractor::SnippetExtractor(ExtractionConfig config, size_t fingerprint_length)
    : SnippetExtractor(config, makeDefaultClassifier(config), FileFilter{}, fingerprint_length) {}

SnippetExtractor::SnippetExtractor(ExtractionConfig config, PatternClassifier classifier,
                                   FileFilter filter, size_t fingerprint_length)
    : config_(config),
      classifier_(std::move(classifier)),
      segmenter_(std::move(filter)),
      windower_(config),
      fingerprint_length_(fingerprint_length) {}

bool SnippetExtractor::passesCommentGate(const CommentBlock& block) const {
    for (const auto& line : block.comment_lines) {
        if (text::utf8Length(text::trim(line)) > config_.comment_gate_length) return true;
    }
    return false;
}

ExtractedSnippets SnippetExtractor::extract(const std::string& diff,
                                            const Identity& author,
                                            const std::string& change_id,
                                            bool is_self_authored,
                                            RandomSource& rng) const {
    ExtractedSnippets result;
    const std::string short_id = change_id.substr(0, kShortChangeIdLength);

    for (const FileSection& file : segmenter_.segment(diff)) {
        BlockAccumulator acc(config_);
        FinishedBlocks blocks;

        for (const DiffEvent& event : file.events) {
            switch (event.kind) {
                case DiffEventKind::HunkStart:
                case DiffEventKind::Boundary:
                    blocks.append(acc.boundary());
                    break;
                case DiffEventKind::Added:
                    blocks.append(acc.observe(event.text, classifier_.classify(event.text)));
                    break;
            }
        }
        blocks.append(acc.finish());

        for (const CodeBlock& block : blocks.code) {
            CodeFragment frag;
            frag.file_path = file.path;
            frag.lines = windower_.window(block.lines, rng);
            frag.author = author;
            frag.change_id = short_id;
            frag.is_self_authored = is_self_authored;
            frag.fingerprint = fingerprint(frag.lines, fingerprint_length_);
            result.code.push_back(std::move(frag));
        }

        for (CommentBlock& block : blocks.comments) {
            if (!passesCommentGate(block)) continue;
            CommentFragment frag;
            frag.file_path = file.path;
            frag.fingerprint = fingerprint(block.comment_lines, fingerprint_length_);
            frag.comment_lines = std::move(block.comment_lines);
            frag.context_lines = std::move(block.context_lines);
            frag.author = author;
            frag.is_self_authored = is_self_authored;
            result.comments.push_back(std::move(frag));
        }
    }

    return result;
}

} // namespace vibescore
