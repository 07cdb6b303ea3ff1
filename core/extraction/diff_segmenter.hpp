#pragma once

#include "extraction/file_filter.hpp"
#include <string>
#include <vector>

namespace vibescore {

enum class DiffEventKind {
    HunkStart,  // "@@ ... @@" header
    Added,      // "+" line, marker stripped
    Boundary    // context or deletion line inside a hunk
};

struct DiffEvent {
    DiffEventKind kind;
    std::string text;  // added line content; empty for other kinds
};

/// The hunks of one retained file, flattened into an event stream.
struct FileSection {
    std::string path;
    std::vector<DiffEvent> events;

    /// Number of Added events.
    size_t addedCount() const;
};

// ─── Diff Segmenter ────────────────────────────────────────────
// Splits a unified diff (as printed by `git show`) into per-file
// sections at "diff --git" headers and keeps only files accepted by
// the FileFilter. Within a file, everything before the first hunk
// header is ignored; from then on "+" lines become Added events and
// " "/"-" lines become Boundary events. "+++" is never an added line.

class DiffSegmenter {
public:
    explicit DiffSegmenter(FileFilter filter = {});

    std::vector<FileSection> segment(const std::string& diff) const;

    /// New-side path from a "diff --git a/<old> b/<new>" header line,
    /// or "" if the line is not such a header.
    static std::string pathFromHeader(const std::string& header_line);

    /// Count of "+" lines excluding "+++", over the whole diff text.
    static int countAddedLines(const std::string& diff);

private:
    FileFilter filter_;
};

} // namespace vibescore
