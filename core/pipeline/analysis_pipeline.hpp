#pragma once

#include "config/config.hpp"
#include "extraction/snippet_extractor.hpp"
#include "history/history_source.hpp"
#include "model/fragment.hpp"
#include "model/identity.hpp"
#include "util/random_source.hpp"
#include "velocity/velocity_aggregator.hpp"
#include <string>
#include <unordered_set>
#include <vector>

namespace vibescore {

/// Everything one analysis run hands to the presentation layer.
struct AnalysisResult {
    std::vector<CodeFragment> code_pool;        // deduplicated
    std::vector<CommentFragment> comment_pool;  // deduplicated
    std::vector<DailyStat> velocity;            // high-output days
    std::vector<CodeFragment> code_questions;
    std::vector<CommentFragment> comment_questions;
    int changes_scanned = 0;
    int changes_skipped = 0;
};

// ─── Analysis Pipeline ─────────────────────────────────────────
// One analysis run over a history source:
//   1. discoverIdentities()  : fatal if no repository or no authors
//   2. run(selected)         : sample changes, extract per change
//                              (failures skipped), dedup, velocity,
//                              sample questions, sufficiency check
// Strictly sequential: each phase completes before the next begins.

class AnalysisPipeline {
public:
    AnalysisPipeline(HistorySource& source, PipelineConfig config, RandomSource& rng);

    /// Identities found in the scanned history, most commits first.
    /// Throws RepositoryUnavailable or NoHistory.
    std::vector<Identity> discoverIdentities();

    /// Run extraction and sampling for the selected identity keys
    /// ("name|email"). Throws NoHistory or InsufficientMaterial.
    AnalysisResult run(const std::unordered_set<std::string>& selected_keys);

    const PipelineConfig& config() const { return config_; }

private:
    HistorySource& source_;
    PipelineConfig config_;
    RandomSource& rng_;
    SnippetExtractor extractor_;

    void requireRepository();
    std::vector<std::string> listChanges();

    void scanChanges(const std::vector<std::string>& change_ids,
                     const std::unordered_set<std::string>& selected_keys,
                     AnalysisResult& result);

    std::vector<DailyStat> aggregateVelocity(const std::vector<std::string>& change_ids,
                                             const std::unordered_set<std::string>& selected_keys);
};

} // namespace vibescore
