#include "extraction/pattern_classifier.hpp"
#include "util/text.hpp"
#include <algorithm>
#include <regex>
#include <unordered_set>

namespace vibescore {

namespace {

int priority(LineCategory category) {
    switch (category) {
        case LineCategory::Boilerplate: return 0;
        case LineCategory::Comment:     return 1;
        case LineCategory::Noise:       return 2;
        case LineCategory::Code:        return 3;
    }
    return 3;
}

bool isPunctuationOnly(const std::string& s, bool allow_space) {
    if (s.empty()) return false;
    for (char c : s) {
        switch (c) {
            case '{': case '}': case '[': case ']':
            case '(': case ')': case ';': case ',':
                break;
            case ' ': case '\t': case '\r': case '\n': case '\f': case '\v':
                if (!allow_space) return false;
                break;
            default:
                return false;
        }
    }
    return true;
}

} // namespace

std::string toString(LineCategory category) {
    switch (category) {
        case LineCategory::Boilerplate: return "boilerplate";
        case LineCategory::Comment:     return "comment";
        case LineCategory::Noise:       return "noise";
        case LineCategory::Code:        return "code";
    }
    return "code";
}

ClassifierRule regexRule(const std::string& name, const std::string& pattern,
                         LineCategory category) {
    std::regex re(pattern, std::regex::ECMAScript | std::regex::optimize);
    return {name, [re](const std::string& line) { return std::regex_search(line, re); },
            category};
}

// ─── PatternClassifier ─────────────────────────────────────────

PatternClassifier::PatternClassifier(ExtractionConfig config)
    : config_(config) {}

void PatternClassifier::addRule(ClassifierRule rule) {
    // Insert after the last rule of equal or higher priority so that
    // insertion order is kept within a category.
    auto pos = std::upper_bound(
        rules_.begin(), rules_.end(), priority(rule.category),
        [](int p, const ClassifierRule& r) { return p < priority(r.category); });
    rules_.insert(pos, std::move(rule));
}

const ClassifierRule* PatternClassifier::findRule(const std::string& trimmed) const {
    for (const auto& rule : rules_) {
        if (rule.predicate(trimmed)) return &rule;
    }
    return nullptr;
}

LineCategory PatternClassifier::classify(const std::string& line) const {
    std::string trimmed = text::trim(line);
    const ClassifierRule* rule = findRule(trimmed);
    if (!rule) return LineCategory::Code;

    if (rule->category == LineCategory::Comment &&
        text::utf8Length(trimmed) <= config_.comment_min_length) {
        return LineCategory::Noise;
    }
    return rule->category;
}

std::string PatternClassifier::matchingRule(const std::string& line) const {
    const ClassifierRule* rule = findRule(text::trim(line));
    return rule ? rule->name : "";
}

// ─── Default rule tables ───────────────────────────────────────

std::vector<ClassifierRule> defaultBoilerplateRules() {
    const LineCategory B = LineCategory::Boilerplate;
    return {
        // JavaScript / TypeScript
        regexRule("js-import", R"(^import\s+)", B),
        regexRule("js-export",
                  R"(^export\s+(default\s+)?([{]|class|function|const|let|var|interface|type|enum))", B),
        regexRule("react-hook", R"(^const\s+\w+\s*=\s*use[A-Z]\w*\()", B),
        regexRule("react-state", R"(^const\s*\[\s*\w+\s*,\s*set[A-Z])", B),
        regexRule("react-hook-destructure", R"(^const\s+[{]\s*\w+\s*[}]\s*=\s*use\w+)", B),
        regexRule("commonjs-export", R"(^module\.exports)", B),
        regexRule("commonjs-require", R"(^require\()", B),
        // Python
        regexRule("py-from-import", R"(^from\s+\S+\s+import)", B),
        regexRule("py-import", R"(^import\s+\S+)", B),
        regexRule("py-dunder", R"(^def\s+__\w+__)", B),
        regexRule("py-class", R"(^class\s+\w+\s*(\(|:))", B),
        // Go
        regexRule("go-package", R"(^package\s+)", B),
        regexRule("go-import-block", R"(^import\s*\()", B),
        regexRule("go-method", R"(^func\s+\(\w+\s+\*?\w+\)\s+\w+)", B),
        // Rust
        regexRule("rust-use", R"(^use\s+)", B),
        regexRule("rust-mod", R"(^mod\s+)", B),
        regexRule("rust-pub", R"(^pub\s+(fn|struct|enum|trait|impl|mod|use|const|static))", B),
        // Java / Kotlin
        regexRule("jvm-public-type", R"(^public\s+(class|interface|enum))", B),
        regexRule("jvm-private-type", R"(^private\s+(class|interface|enum))", B),
        // Ruby
        regexRule("rb-require", R"(^require\s+)", B),
        regexRule("rb-require-relative", R"(^require_relative\s+)", B),
        regexRule("rb-module", R"(^module\s+)", B),
        // C / C++
        regexRule("c-include", R"(^#include\s+)", B),
        regexRule("c-define", R"(^#define\s+)", B),
        regexRule("c-pragma", R"(^#pragma\s+)", B),
        regexRule("cpp-using-namespace", R"(^using\s+namespace)", B),
        // Generic
        {"brackets-only", [](const std::string& s) { return isPunctuationOnly(s, false); }, B},
        {"blank", [](const std::string& s) { return s.empty(); }, B},
    };
}

std::vector<ClassifierRule> defaultCommentRules() {
    const LineCategory C = LineCategory::Comment;
    return {
        regexRule("c-line-comment", R"(^//)", C),
        regexRule("c-block-open", R"(^/\*)", C),
        regexRule("c-block-middle", R"(^\*)", C),
        regexRule("hash-comment", R"(^#(?!!))", C),  // not a shebang
        regexRule("dash-comment", R"(^--)", C),
        regexRule("py-docstring-double", R"(^""")", C),
        regexRule("py-docstring-single", R"(^''')", C),
        regexRule("lisp-comment", R"(^;)", C),
        regexRule("hs-block-open", R"(^[{]-)", C),
    };
}

std::vector<ClassifierRule> defaultNoiseRules(const ExtractionConfig& config) {
    const LineCategory N = LineCategory::Noise;
    const size_t min_length = config.noise_min_length;
    static const std::unordered_set<std::string> closers = {
        "else", "end", "endif", "fi", "done", "esac", "}", ")", ");",
    };
    return {
        {"empty", [](const std::string& s) { return s.empty(); }, N},
        {"too-short",
         [min_length](const std::string& s) { return text::utf8Length(s) < min_length; }, N},
        {"punctuation", [](const std::string& s) { return isPunctuationOnly(s, true); }, N},
        {"closing-construct", [](const std::string& s) { return closers.count(s) > 0; }, N},
    };
}

PatternClassifier makeDefaultClassifier(const ExtractionConfig& config) {
    PatternClassifier classifier(config);
    for (auto& r : defaultBoilerplateRules()) classifier.addRule(std::move(r));
    for (auto& r : defaultCommentRules()) classifier.addRule(std::move(r));
    for (auto& r : defaultNoiseRules(config)) classifier.addRule(std::move(r));
    return classifier;
}

} // namespace vibescore
