#pragma once

#include "config/config.hpp"
#include <functional>
#include <string>
#include <vector>

namespace vibescore {

/// Category of one inserted line.
enum class LineCategory {
    Boilerplate,  // structural line, dropped without breaking a block
    Comment,
    Noise,        // too short or trivial, closes a code block
    Code
};

std::string toString(LineCategory category);

/// Predicate over a trimmed line.
using LinePredicate = std::function<bool(const std::string&)>;

struct ClassifierRule {
    std::string name;
    LinePredicate predicate;
    LineCategory category;
};

/// Rule from an ECMAScript regular expression, searched in the trimmed line.
ClassifierRule regexRule(const std::string& name, const std::string& pattern,
                         LineCategory category);

// ─── Pattern Classifier ────────────────────────────────────────
// Ordered rule set. Rules are evaluated by category priority
// (Boilerplate > Comment > Noise) and, within a category, in
// insertion order. The first matching rule decides. A Comment match
// whose trimmed length does not exceed comment_min_length is
// downgraded to Noise. A line matching nothing is Code.

class PatternClassifier {
public:
    explicit PatternClassifier(ExtractionConfig config = {});

    void addRule(ClassifierRule rule);

    /// Classify a raw added line (diff marker already stripped).
    LineCategory classify(const std::string& line) const;

    /// Name of the rule that decided the line, or "" for Code.
    std::string matchingRule(const std::string& line) const;

    size_t ruleCount() const { return rules_.size(); }

private:
    ExtractionConfig config_;
    std::vector<ClassifierRule> rules_;  // kept sorted by category priority

    const ClassifierRule* findRule(const std::string& trimmed) const;
};

/// Boilerplate rules for JS/TS, Python, Go, Rust, JVM, Ruby and C/C++.
std::vector<ClassifierRule> defaultBoilerplateRules();

/// Line, block and docstring comment starters.
std::vector<ClassifierRule> defaultCommentRules();

/// Empty, short, pure-punctuation and closing-construct lines.
std::vector<ClassifierRule> defaultNoiseRules(const ExtractionConfig& config = {});

/// Classifier loaded with all default rules.
PatternClassifier makeDefaultClassifier(const ExtractionConfig& config = {});

} // namespace vibescore
