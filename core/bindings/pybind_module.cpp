// PyBind11 bindings for the vibescore core.
// Exposes classification, extraction, dedup, velocity and scoring to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "config/config.hpp"
#include "dedup/deduplicator.hpp"
#include "extraction/fingerprint.hpp"
#include "extraction/pattern_classifier.hpp"
#include "extraction/snippet_extractor.hpp"
#include "model/answer.hpp"
#include "model/fragment.hpp"
#include "model/identity.hpp"
#include "quiz/question_sampler.hpp"
#include "scoring/rating.hpp"
#include "scoring/scoring_engine.hpp"
#include "util/random_source.hpp"
#include "velocity/velocity_aggregator.hpp"

namespace py = pybind11;

PYBIND11_MODULE(vibescore_bindings, m) {
    m.doc() = "vibescore C++ Core Bindings";

    // ── Enums ──
    py::enum_<vibescore::LineCategory>(m, "LineCategory")
        .value("Boilerplate", vibescore::LineCategory::Boilerplate)
        .value("Comment",     vibescore::LineCategory::Comment)
        .value("Noise",       vibescore::LineCategory::Noise)
        .value("Code",        vibescore::LineCategory::Code);

    py::enum_<vibescore::ConfidenceLevel>(m, "ConfidenceLevel")
        .value("Remember",  vibescore::ConfidenceLevel::Remember)
        .value("Familiar",  vibescore::ConfidenceLevel::Familiar)
        .value("Uncertain", vibescore::ConfidenceLevel::Uncertain)
        .value("Foreign",   vibescore::ConfidenceLevel::Foreign);

    // ── Identity ──
    py::class_<vibescore::Identity>(m, "Identity")
        .def(py::init<>())
        .def(py::init<std::string, std::string, int>(),
             py::arg("name"), py::arg("email"), py::arg("commit_count") = 0)
        .def_readwrite("name", &vibescore::Identity::name)
        .def_readwrite("email", &vibescore::Identity::email)
        .def_readwrite("commit_count", &vibescore::Identity::commit_count)
        .def("key", &vibescore::Identity::key);

    // ── Fragments ──
    py::class_<vibescore::CodeFragment>(m, "CodeFragment")
        .def(py::init<>())
        .def_readwrite("file_path", &vibescore::CodeFragment::file_path)
        .def_readwrite("lines", &vibescore::CodeFragment::lines)
        .def_readwrite("author", &vibescore::CodeFragment::author)
        .def_readwrite("change_id", &vibescore::CodeFragment::change_id)
        .def_readwrite("is_self_authored", &vibescore::CodeFragment::is_self_authored)
        .def_readwrite("fingerprint", &vibescore::CodeFragment::fingerprint);

    py::class_<vibescore::CommentFragment>(m, "CommentFragment")
        .def(py::init<>())
        .def_readwrite("file_path", &vibescore::CommentFragment::file_path)
        .def_readwrite("comment_lines", &vibescore::CommentFragment::comment_lines)
        .def_readwrite("context_lines", &vibescore::CommentFragment::context_lines)
        .def_readwrite("author", &vibescore::CommentFragment::author)
        .def_readwrite("is_self_authored", &vibescore::CommentFragment::is_self_authored)
        .def_readwrite("fingerprint", &vibescore::CommentFragment::fingerprint);

    py::class_<vibescore::ExtractedSnippets>(m, "ExtractedSnippets")
        .def_readonly("code", &vibescore::ExtractedSnippets::code)
        .def_readonly("comments", &vibescore::ExtractedSnippets::comments);

    // ── Config ──
    py::class_<vibescore::ExtractionConfig>(m, "ExtractionConfig")
        .def(py::init<>())
        .def_readwrite("min_snippet_lines", &vibescore::ExtractionConfig::min_snippet_lines)
        .def_readwrite("max_snippet_lines", &vibescore::ExtractionConfig::max_snippet_lines)
        .def_readwrite("window_ratio", &vibescore::ExtractionConfig::window_ratio)
        .def_readwrite("comment_min_length", &vibescore::ExtractionConfig::comment_min_length)
        .def_readwrite("comment_gate_length", &vibescore::ExtractionConfig::comment_gate_length);

    py::class_<vibescore::ScoringWeights>(m, "ScoringWeights")
        .def(py::init<>())
        .def_readwrite("forget", &vibescore::ScoringWeights::forget)
        .def_readwrite("fuzzy", &vibescore::ScoringWeights::fuzzy)
        .def_readwrite("false_memory", &vibescore::ScoringWeights::false_memory)
        .def_readwrite("code_track", &vibescore::ScoringWeights::code_track)
        .def_readwrite("comment_track", &vibescore::ScoringWeights::comment_track);

    // ── RandomSource ──
    py::class_<vibescore::RandomSource>(m, "RandomSource")
        .def(py::init<uint64_t>(), py::arg("seed"))
        .def("seed", &vibescore::RandomSource::seed);

    // ── Classification / Extraction ──
    py::class_<vibescore::PatternClassifier>(m, "PatternClassifier")
        .def(py::init([]() { return vibescore::makeDefaultClassifier(); }))
        .def("classify",      &vibescore::PatternClassifier::classify)
        .def("matching_rule", &vibescore::PatternClassifier::matchingRule)
        .def("rule_count",    &vibescore::PatternClassifier::ruleCount);

    py::class_<vibescore::SnippetExtractor>(m, "SnippetExtractor")
        .def(py::init<vibescore::ExtractionConfig, size_t>(),
             py::arg("config") = vibescore::ExtractionConfig{},
             py::arg("fingerprint_length") = 200)
        .def("extract", &vibescore::SnippetExtractor::extract,
             py::arg("diff"), py::arg("author"), py::arg("change_id"),
             py::arg("is_self_authored"), py::arg("rng"));

    m.def("fingerprint", &vibescore::fingerprint,
          py::arg("lines"), py::arg("max_length") = 200);
    m.def("positional_similarity", &vibescore::positionalSimilarity);

    m.def("deduplicate_code", [](const std::vector<vibescore::CodeFragment>& fragments) {
        return vibescore::Deduplicator().deduplicate(fragments);
    }, py::arg("fragments"));

    m.def("deduplicate_comments", [](const std::vector<vibescore::CommentFragment>& fragments) {
        return vibescore::Deduplicator().deduplicate(fragments);
    }, py::arg("fragments"));

    // ── Velocity ──
    py::class_<vibescore::DailyStat>(m, "DailyStat")
        .def_readonly("date", &vibescore::DailyStat::date)
        .def_readonly("lines_added", &vibescore::DailyStat::lines_added)
        .def_readonly("commit_count", &vibescore::DailyStat::commit_count)
        .def_readonly("avg_lines_per_commit", &vibescore::DailyStat::avg_lines_per_commit);

    py::class_<vibescore::VelocityAggregator>(m, "VelocityAggregator")
        .def(py::init<>())
        .def("add_change", &vibescore::VelocityAggregator::addChange)
        .def("add_lines",  &vibescore::VelocityAggregator::addLines)
        .def("top_days",   &vibescore::VelocityAggregator::topDays);

    // ── Sampling ──
    py::class_<vibescore::TrackPlan>(m, "TrackPlan")
        .def_readonly("self_count", &vibescore::TrackPlan::self_count)
        .def_readonly("other_count", &vibescore::TrackPlan::other_count);

    m.def("plan_track", [](size_t self_pool, size_t other_pool) {
        return vibescore::QuestionSampler().plan(self_pool, other_pool);
    }, py::arg("self_pool"), py::arg("other_pool"));

    // ── Scoring ──
    py::class_<vibescore::Answer>(m, "Answer")
        .def(py::init<>())
        .def(py::init([](vibescore::ConfidenceLevel level, bool self) {
            return vibescore::Answer{level, self};
        }), py::arg("level"), py::arg("is_self_authored"))
        .def_readwrite("level", &vibescore::Answer::level)
        .def_readwrite("is_self_authored", &vibescore::Answer::is_self_authored);

    py::class_<vibescore::TrackMetrics>(m, "TrackMetrics")
        .def_readonly("self_total", &vibescore::TrackMetrics::self_total)
        .def_readonly("other_total", &vibescore::TrackMetrics::other_total)
        .def_readonly("forget_rate", &vibescore::TrackMetrics::forget_rate)
        .def_readonly("fuzzy_rate", &vibescore::TrackMetrics::fuzzy_rate)
        .def_readonly("false_memory_rate", &vibescore::TrackMetrics::false_memory_rate)
        .def_readonly("score", &vibescore::TrackMetrics::score);

    py::class_<vibescore::ScoreBreakdown>(m, "ScoreBreakdown")
        .def_readonly("code", &vibescore::ScoreBreakdown::code)
        .def_readonly("comment", &vibescore::ScoreBreakdown::comment)
        .def_readonly("high_output_days", &vibescore::ScoreBreakdown::high_output_days)
        .def_readonly("velocity_bonus", &vibescore::ScoreBreakdown::velocity_bonus)
        .def_readonly("total", &vibescore::ScoreBreakdown::total);

    py::class_<vibescore::ScoringEngine>(m, "ScoringEngine")
        .def(py::init<vibescore::ScoringWeights>(),
             py::arg("weights") = vibescore::ScoringWeights{})
        .def("score_track", &vibescore::ScoringEngine::scoreTrack)
        .def("velocity_bonus", &vibescore::ScoringEngine::velocityBonus)
        .def("composite", &vibescore::ScoringEngine::composite)
        .def("score", &vibescore::ScoringEngine::score);

    py::class_<vibescore::Rating>(m, "Rating")
        .def_readonly("title", &vibescore::Rating::title)
        .def_readonly("description", &vibescore::Rating::description);

    m.def("rate_score", &vibescore::rateScore, py::arg("total"));
}
