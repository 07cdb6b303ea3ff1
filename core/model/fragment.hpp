#pragma once

#include "model/identity.hpp"
#include <string>
#include <vector>

namespace vibescore {

// ─── Code Fragment ─────────────────────────────────────────────
// A windowed run of inserted source lines from one change. Always
// holds between min_snippet_lines and max_snippet_lines lines.

struct CodeFragment {
    std::string file_path;
    std::vector<std::string> lines;
    Identity author;
    std::string change_id;      // abbreviated to 7 characters
    bool is_self_authored = false;
    std::string fingerprint;
};

// ─── Comment Fragment ──────────────────────────────────────────
// A run of inserted comment lines plus up to two preceding code
// lines for context. The fingerprint covers the comment lines only.

struct CommentFragment {
    std::string file_path;
    std::vector<std::string> comment_lines;
    std::vector<std::string> context_lines;
    Identity author;
    bool is_self_authored = false;
    std::string fingerprint;
};

} // namespace vibescore
