#include "extraction/file_filter.hpp"
#include "util/text.hpp"
#include <utility>

namespace vibescore {

namespace {

std::vector<std::string> defaultIgnoredSubstrings() {
    return {
        ".min.", ".bundle.", ".generated.",
        "node_modules", "vendor/", "dist/", "build/", "target/",
        "__pycache__",
    };
}

std::vector<std::string> defaultIgnoredSuffixes() {
    return {".d.ts", ".pyc"};
}

std::unordered_set<std::string> defaultExtensions() {
    return {
        // JavaScript / TypeScript
        ".ts", ".tsx", ".js", ".jsx", ".mjs", ".cjs", ".vue", ".svelte", ".astro",
        // Python
        ".py", ".pyw", ".pyx", ".pxd", ".pxi",
        ".go",
        ".rs",
        // JVM
        ".java", ".kt", ".kts", ".scala", ".sc", ".groovy", ".gradle",
        // C family
        ".c", ".cpp", ".cc", ".cxx", ".h", ".hpp", ".hxx", ".m", ".mm",
        // .NET
        ".cs", ".fs", ".fsx",
        ".rb", ".rake", ".gemspec",
        ".php", ".phtml",
        ".swift", ".dart", ".lua",
        // Shell
        ".sh", ".bash", ".zsh", ".fish",
        ".pl", ".pm",
        ".r",
        ".ex", ".exs", ".erl", ".hrl",
        ".hs", ".lhs",
        ".clj", ".cljs", ".cljc", ".edn",
        ".zig", ".nim", ".v",
        ".ml", ".mli",
        ".sql",
    };
}

} // namespace

FileFilter::FileFilter()
    : FileFilter(defaultIgnoredSubstrings(), defaultIgnoredSuffixes(), defaultExtensions()) {}

FileFilter::FileFilter(std::vector<std::string> ignored_substrings,
                       std::vector<std::string> ignored_suffixes,
                       std::unordered_set<std::string> extensions)
    : ignored_substrings_(std::move(ignored_substrings)),
      ignored_suffixes_(std::move(ignored_suffixes)),
      extensions_(std::move(extensions)) {}

bool FileFilter::accepts(const std::string& path) const {
    return !isIgnored(path) && hasSourceExtension(path);
}

bool FileFilter::isIgnored(const std::string& path) const {
    for (const auto& s : ignored_substrings_) {
        if (path.find(s) != std::string::npos) return true;
    }
    for (const auto& s : ignored_suffixes_) {
        if (text::endsWith(path, s)) return true;
    }
    return false;
}

bool FileFilter::hasSourceExtension(const std::string& path) const {
    std::string ext = extensionOf(path);
    return !ext.empty() && extensions_.count(ext) > 0;
}

std::string FileFilter::extensionOf(const std::string& path) {
    size_t dot = path.rfind('.');
    if (dot == std::string::npos) return "";
    return text::toLower(path.substr(dot));
}

} // namespace vibescore
