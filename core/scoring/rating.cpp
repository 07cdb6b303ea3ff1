#include "scoring/rating.hpp"

namespace vibescore {

Rating rateScore(int total) {
    if (total <= 10) {
        return {"Code Artisan",
                "You know your code inside out; every line is etched in memory."};
    }
    if (total <= 25) {
        return {"Traditional Programmer",
                "You still write code the old way and remember every variable name."};
    }
    if (total <= 40) {
        return {"Hybrid Developer",
                "You balance your own judgement with AI assistance. Pragmatic."};
    }
    if (total <= 55) {
        return {"Vibe Coder",
                "Writing code feels like a dream; you wake up remembering the gist."};
    }
    if (total <= 70) {
        return {"AI Collaboration Master",
                "You bring the requirements, the AI brings the implementation."};
    }
    if (total <= 85) {
        return {"Prompt Engineer",
                "Code is a by-product of prompts; your core skill is asking well."};
    }
    if (total < 100) {
        return {"Human Copilot",
                "You can no longer tell which lines you wrote and which the AI did."};
    }
    return {"AI Puppet",
            "Code just flows through your fingers on its way from the model."};
}

std::string codeTrackRemark(int score) {
    if (score < 20) return "You remember your code in detail.";
    if (score < 50) return "Some remembered, some forgotten; a normal level.";
    if (score < 80) return "Written and forgotten, a classic vibe coder.";
    return "Did you really write this code?";
}

std::string commentTrackRemark(int score) {
    if (score < 20) return "You even remember your comments. Thorough.";
    if (score < 50) return "Comments? As long as it runs.";
    if (score < 80) return "The comments were probably pasted in.";
    return "Comments are the AI's job.";
}

} // namespace vibescore
