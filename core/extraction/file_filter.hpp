#pragma once

#include <string>
#include <unordered_set>
#include <vector>

namespace vibescore {

// ─── File Filter ───────────────────────────────────────────────
// Decides which changed files are worth mining. A path is kept only
// if it matches no ignore rule (generated, minified, vendored, build
// output, compiled artifacts) and its extension is a known source
// extension.

class FileFilter {
public:
    /// Default ignore rules and source extensions.
    FileFilter();

    FileFilter(std::vector<std::string> ignored_substrings,
               std::vector<std::string> ignored_suffixes,
               std::unordered_set<std::string> extensions);

    /// True if the file should be mined for snippets.
    bool accepts(const std::string& path) const;

    bool isIgnored(const std::string& path) const;
    bool hasSourceExtension(const std::string& path) const;

    /// Lower-cased last ".suffix" of the path, or "" if none.
    static std::string extensionOf(const std::string& path);

private:
    std::vector<std::string> ignored_substrings_;
    std::vector<std::string> ignored_suffixes_;
    std::unordered_set<std::string> extensions_;
};

} // namespace vibescore
