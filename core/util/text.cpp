#include "util/text.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace vibescore::text {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isContinuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

std::string trim(const std::string& s) {
    size_t begin = 0;
    while (begin < s.size() && isSpace(s[begin])) begin++;
    size_t end = s.size();
    while (end > begin && isSpace(s[end - 1])) end--;
    return s.substr(begin, end - begin);
}

std::string collapseWhitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool in_space = false;
    for (char c : s) {
        if (isSpace(c)) {
            if (!in_space) out.push_back(' ');
            in_space = true;
        } else {
            out.push_back(c);
            in_space = false;
        }
    }
    return out;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (c == delim) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

std::vector<std::string> splitLines(const std::string& s) {
    std::vector<std::string> lines;
    std::istringstream iss(s);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) oss << sep;
        oss << parts[i];
    }
    return oss.str();
}

size_t utf8Length(const std::string& s) {
    size_t n = 0;
    for (char c : s) {
        if (!isContinuation(c)) n++;
    }
    return n;
}

std::string utf8Prefix(const std::string& s, size_t n) {
    size_t seen = 0;
    for (size_t i = 0; i < s.size(); i++) {
        if (isContinuation(s[i])) continue;
        if (seen == n) return s.substr(0, i);
        seen++;
    }
    return s;
}

} // namespace vibescore::text
