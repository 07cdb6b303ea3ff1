#include "pipeline/analysis_pipeline.hpp"
#include "dedup/deduplicator.hpp"
#include "model/errors.hpp"
#include "quiz/question_sampler.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <exception>
#include <iterator>

namespace vibescore {

AnalysisPipeline::AnalysisPipeline(HistorySource& source, PipelineConfig config,
                                   RandomSource& rng)
    : source_(source),
      config_(config),
      rng_(rng),
      extractor_(config.extraction, config.dedup.fingerprint_length) {
    config_.validate();
}

void AnalysisPipeline::requireRepository() {
    if (!source_.isRepository()) {
        throw RepositoryUnavailable(source_.location());
    }
}

std::vector<Identity> AnalysisPipeline::discoverIdentities() {
    requireRepository();

    std::vector<std::string> records;
    try {
        records = source_.authorRecords(config_.max_commits);
    } catch (const RetrievalFailure& e) {
        throw NoHistory(e.what());
    }

    std::vector<Identity> identities = aggregateIdentities(records);
    if (identities.empty()) {
        throw NoHistory("no commits in " + source_.location());
    }
    logger()->info("Found {} identities in the last {} commits",
                   identities.size(), records.size());
    return identities;
}

std::vector<std::string> AnalysisPipeline::listChanges() {
    std::vector<std::string> ids;
    try {
        ids = source_.changeIds(config_.max_commits);
    } catch (const RetrievalFailure& e) {
        throw NoHistory(e.what());
    }
    if (ids.empty()) {
        throw NoHistory("no commits in " + source_.location());
    }
    return ids;
}

AnalysisResult AnalysisPipeline::run(const std::unordered_set<std::string>& selected_keys) {
    requireRepository();
    const std::vector<std::string> change_ids = listChanges();

    AnalysisResult result;

    // Sample order is fixed once per run.
    std::vector<std::string> sampled = change_ids;
    rng_.shuffle(sampled);
    if (sampled.size() > config_.sample_commits) sampled.resize(config_.sample_commits);

    scanChanges(sampled, selected_keys, result);

    Deduplicator dedup(config_.dedup);
    size_t raw_code = result.code_pool.size();
    size_t raw_comments = result.comment_pool.size();
    result.code_pool = dedup.deduplicate(result.code_pool);
    result.comment_pool = dedup.deduplicate(result.comment_pool);
    logger()->info("Snippet pools after dedup: {} code (from {}), {} comments (from {})",
                   result.code_pool.size(), raw_code,
                   result.comment_pool.size(), raw_comments);

    result.velocity = aggregateVelocity(change_ids, selected_keys);
    logger()->info("High-output days: {}", result.velocity.size());

    QuestionSampler sampler(config_.sampler);
    result.code_questions = sampler.sampleMixed(result.code_pool, rng_);
    result.comment_questions = sampler.sampleMixed(result.comment_pool, rng_);

    sampler.requireSufficient("code", result.code_questions.size());
    sampler.requireSufficient("comment", result.comment_questions.size());
    return result;
}

void AnalysisPipeline::scanChanges(const std::vector<std::string>& change_ids,
                                   const std::unordered_set<std::string>& selected_keys,
                                   AnalysisResult& result) {
    for (const auto& id : change_ids) {
        try {
            ChangeInfo info = source_.changeInfo(id);
            std::string diff = source_.changeDiff(id);
            if (!diff.empty()) {
                bool is_self = selected_keys.count(info.author.key()) > 0;
                ExtractedSnippets s = extractor_.extract(diff, info.author, id, is_self, rng_);
                result.code_pool.insert(result.code_pool.end(),
                                        std::make_move_iterator(s.code.begin()),
                                        std::make_move_iterator(s.code.end()));
                result.comment_pool.insert(result.comment_pool.end(),
                                           std::make_move_iterator(s.comments.begin()),
                                           std::make_move_iterator(s.comments.end()));
            }
            result.changes_scanned++;
        } catch (const std::exception& e) {
            result.changes_skipped++;
            logger()->debug("Skipping change {}: {}", id, e.what());
        }
    }
    logger()->info("Scanned {} changes ({} skipped)",
                   result.changes_scanned, result.changes_skipped);
}

std::vector<DailyStat> AnalysisPipeline::aggregateVelocity(
    const std::vector<std::string>& change_ids,
    const std::unordered_set<std::string>& selected_keys) {
    VelocityAggregator velocity(config_.velocity);
    size_t n = std::min(change_ids.size(), config_.velocity.sample_size);

    for (size_t i = 0; i < n; i++) {
        const std::string& id = change_ids[i];
        try {
            ChangeInfo info = source_.changeInfo(id);
            if (selected_keys.count(info.author.key()) == 0) continue;
            velocity.addChange(info.timestamp, source_.changeDiff(id));
        } catch (const std::exception& e) {
            logger()->debug("Skipping change {} in velocity scan: {}", id, e.what());
        }
    }
    return velocity.topDays();
}

} // namespace vibescore
