#include "model/answer.hpp"
#include "util/text.hpp"

namespace vibescore {

std::string toString(ConfidenceLevel level) {
    switch (level) {
        case ConfidenceLevel::Remember:  return "remember";
        case ConfidenceLevel::Familiar:  return "familiar";
        case ConfidenceLevel::Uncertain: return "uncertain";
        case ConfidenceLevel::Foreign:   return "foreign";
    }
    return "uncertain";
}

std::optional<ConfidenceLevel> parseConfidenceLevel(const std::string& input) {
    std::string t = text::toLower(text::trim(input));
    if (t == "1" || t == "remember")  return ConfidenceLevel::Remember;
    if (t == "2" || t == "familiar")  return ConfidenceLevel::Familiar;
    if (t == "3" || t == "uncertain") return ConfidenceLevel::Uncertain;
    if (t == "4" || t == "foreign")   return ConfidenceLevel::Foreign;
    return std::nullopt;
}

} // namespace vibescore
