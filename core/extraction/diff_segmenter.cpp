#include "extraction/diff_segmenter.hpp"
#include "util/text.hpp"
#include <utility>

namespace vibescore {

namespace {

const std::string kFileHeader = "diff --git ";

bool isAddedLine(const std::string& line) {
    return text::startsWith(line, "+") && !text::startsWith(line, "+++");
}

} // namespace

size_t FileSection::addedCount() const {
    size_t n = 0;
    for (const auto& e : events) {
        if (e.kind == DiffEventKind::Added) n++;
    }
    return n;
}

DiffSegmenter::DiffSegmenter(FileFilter filter)
    : filter_(std::move(filter)) {}

std::string DiffSegmenter::pathFromHeader(const std::string& header_line) {
    if (!text::startsWith(header_line, kFileHeader + "a/")) return "";
    // Greedy on the old side: the new path starts after the last " b/".
    size_t pos = header_line.rfind(" b/");
    if (pos == std::string::npos || pos < kFileHeader.size()) return "";
    return header_line.substr(pos + 3);
}

std::vector<FileSection> DiffSegmenter::segment(const std::string& diff) const {
    std::vector<FileSection> sections;

    FileSection current;
    bool keep = false;     // current file passed the filter
    bool in_hunk = false;

    auto close = [&]() {
        if (keep && !current.events.empty()) {
            sections.push_back(std::move(current));
        }
        current = FileSection{};
        keep = false;
        in_hunk = false;
    };

    for (const std::string& line : text::splitLines(diff)) {
        if (text::startsWith(line, kFileHeader)) {
            close();
            current.path = pathFromHeader(line);
            keep = !current.path.empty() && filter_.accepts(current.path);
            continue;
        }
        if (!keep) continue;

        if (text::startsWith(line, "@@")) {
            in_hunk = true;
            current.events.push_back({DiffEventKind::HunkStart, ""});
            continue;
        }
        if (!in_hunk) continue;

        if (isAddedLine(line)) {
            current.events.push_back({DiffEventKind::Added, line.substr(1)});
        } else if (text::startsWith(line, "-") || text::startsWith(line, " ")) {
            current.events.push_back({DiffEventKind::Boundary, ""});
        }
        // "\ No newline at end of file" and similar markers carry nothing
    }
    close();

    return sections;
}

int DiffSegmenter::countAddedLines(const std::string& diff) {
    int count = 0;
    for (const std::string& line : text::splitLines(diff)) {
        if (isAddedLine(line)) count++;
    }
    return count;
}

} // namespace vibescore
