// vibescore: quiz yourself on code you committed.
//
// Usage: vibescore [--repo DIR] [--author "name|email"]... [--seed N]
//                  [--questions N] [--sample N] [--verbose]

#include "history/git_history_source.hpp"
#include "model/errors.hpp"
#include "pipeline/analysis_pipeline.hpp"
#include "quiz/quiz_session.hpp"
#include "scoring/rating.hpp"
#include "util/logging.hpp"
#include "util/random_source.hpp"
#include "util/text.hpp"

#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

using namespace vibescore;

namespace {

struct CliOptions {
    std::string repo = ".";
    std::vector<std::string> authors;
    std::optional<uint64_t> seed;
    PipelineConfig pipeline;
    bool verbose = false;
};

void printUsage() {
    std::cout <<
        "Usage: vibescore [options]\n"
        "  --repo DIR            repository to analyse (default: .)\n"
        "  --author NAME|EMAIL   identity that represents you (repeatable);\n"
        "                        asked interactively when omitted\n"
        "  --seed N              seed for reproducible sampling\n"
        "  --questions N         questions per track (default: 10)\n"
        "  --sample N            commits mined for snippets (default: 300)\n"
        "  --verbose             debug logging\n"
        "  --help                show this help\n";
}

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--repo" && i + 1 < argc) {
            opts.repo = argv[++i];
        } else if (arg == "--author" && i + 1 < argc) {
            opts.authors.push_back(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            opts.seed = std::stoull(argv[++i]);
        } else if (arg == "--questions" && i + 1 < argc) {
            opts.pipeline.sampler.questions_per_track = std::stoul(argv[++i]);
        } else if (arg == "--sample" && i + 1 < argc) {
            opts.pipeline.sample_commits = std::stoul(argv[++i]);
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
    return opts;
}

std::string readLine(const std::string& prompt) {
    std::cout << prompt << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
        throw std::runtime_error("Input closed");
    }
    return text::trim(line);
}

/// Ask the user which identities are theirs. Returns keys; empty = quit.
std::unordered_set<std::string> selectIdentities(const std::vector<Identity>& identities) {
    std::cout << "\nSelect the git identities that represent you:\n";
    for (size_t i = 0; i < identities.size(); i++) {
        const auto& id = identities[i];
        std::cout << std::setw(4) << (i + 1) << ") " << id.name << " <" << id.email << "> ("
                  << id.commit_count << " commits)\n";
    }
    std::cout << "Tip: one person often has several git configs.\n";

    std::unordered_set<std::string> keys;
    while (true) {
        std::string input = readLine("Numbers separated by commas (empty to quit): ");
        if (input.empty()) return keys;

        keys.clear();
        bool valid = true;
        for (const auto& part : text::split(input, ',')) {
            std::string t = text::trim(part);
            if (t.empty()) continue;
            try {
                size_t n = std::stoul(t);
                if (n == 0 || n > identities.size()) throw std::out_of_range(t);
                keys.insert(identities[n - 1].key());
            } catch (const std::logic_error&) {
                valid = false;
                break;
            }
        }
        if (valid && !keys.empty()) return keys;
        std::cout << "Invalid selection, try again.\n";
    }
}

ConfidenceLevel askConfidence(const std::string& subject) {
    std::cout << "  1) I remember writing this " << subject << "\n"
              << "  2) Looks familiar, probably mine\n"
              << "  3) Not sure who wrote it\n"
              << "  4) Definitely not mine\n";
    while (true) {
        if (auto level = parseConfidenceLevel(readLine("> "))) return *level;
        std::cout << "Please answer 1-4.\n";
    }
}

void printCode(const std::vector<std::string>& lines) {
    for (size_t i = 0; i < lines.size(); i++) {
        std::cout << std::setw(3) << (i + 1) << " | " << lines[i] << "\n";
    }
}

void runQuiz(QuizSession& quiz) {
    while (!quiz.finished()) {
        std::cout << "\n";
        if (quiz.phase() == QuizPhase::Code) {
            std::cout << "[Code memory " << (quiz.questionIndex() + 1) << "/"
                      << quiz.trackSize() << "] Did you write this code?\n\n";
            printCode(quiz.currentCode().lines);
            std::cout << "\n";
            quiz.answer(askConfidence("code"));
        } else {
            const CommentFragment& c = quiz.currentComment();
            std::cout << "[Comment " << (quiz.questionIndex() + 1) << "/"
                      << quiz.trackSize() << "] Did you write this comment?\n\n";
            for (const auto& line : c.comment_lines) std::cout << "    " << line << "\n";
            if (!c.context_lines.empty()) {
                std::cout << "\n  context:\n";
                for (const auto& line : c.context_lines) std::cout << "    " << line << "\n";
            }
            std::cout << "\n";
            quiz.answer(askConfidence("comment"));
        }
    }
}

void printTrack(const std::string& title, const TrackMetrics& m, const std::string& remark) {
    std::cout << title << ": " << m.score << "/100\n"
              << "  your snippets:   " << m.remembered << " remembered, "
              << m.familiar << " familiar, " << m.uncertain << " uncertain, "
              << m.misidentified_as_foreign << " called foreign (of " << m.self_total << ")\n";
    if (m.other_total > 0) {
        std::cout << "  others' snippets: " << m.false_memory << " claimed as yours, "
                  << m.correctly_rejected << " rejected (of " << m.other_total << ")\n";
    }
    std::cout << "  " << remark << "\n";
}

void printResult(const ScoreBreakdown& b, const std::vector<DailyStat>& velocity) {
    std::cout << "\n==================== RESULT ====================\n\n";
    printTrack("Code memory", b.code, codeTrackRemark(b.code.score));
    std::cout << "\n";
    printTrack("Comment recognition", b.comment, commentTrackRemark(b.comment.score));

    std::cout << "\nVelocity: ";
    if (velocity.empty()) {
        std::cout << "no day above the high-output threshold\n";
    } else {
        std::cout << velocity.size() << " high-output day(s), +" << b.velocity_bonus << "\n";
        for (size_t i = 0; i < velocity.size() && i < 5; i++) {
            const DailyStat& d = velocity[i];
            std::cout << "  " << d.date << "  " << d.lines_added << " lines in "
                      << d.commit_count << " commit(s), avg " << d.avg_lines_per_commit << "\n";
        }
        if (velocity.size() > 5) {
            std::cout << "  ... and " << (velocity.size() - 5) << " more\n";
        }
    }

    Rating rating = rateScore(b.total);
    std::cout << "\nVIBE SCORE: " << b.total << "/100  " << rating.title << "\n"
              << rating.description << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        CliOptions opts = parseArgs(argc, argv);
        if (opts.verbose) setLogLevel(spdlog::level::debug);

        RandomSource rng = opts.seed ? RandomSource(*opts.seed) : RandomSource::fromEntropy();
        logger()->debug("Random seed: {}", rng.seed());

        GitHistorySource source(opts.repo);
        AnalysisPipeline pipeline(source, opts.pipeline, rng);

        std::vector<Identity> identities = pipeline.discoverIdentities();

        std::unordered_set<std::string> selected(opts.authors.begin(), opts.authors.end());
        if (selected.empty()) {
            selected = selectIdentities(identities);
            if (selected.empty()) return 0;
        }

        std::cout << "\nScanning commits...\n";
        AnalysisResult result = pipeline.run(selected);

        std::cout << "Ready: " << result.code_questions.size() << " code and "
                  << result.comment_questions.size() << " comment questions.\n";
        readLine("Press Enter to start...");

        QuizSession quiz(result.code_questions, result.comment_questions,
                         result.velocity.size(), ScoringEngine(opts.pipeline.scoring));
        runQuiz(quiz);
        printResult(quiz.breakdown(), result.velocity);
        return 0;
    } catch (const Error& e) {
        logger()->error("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        logger()->error("Failed: {}", e.what());
        return 1;
    }
}
