#pragma once

#include <string>

// Unified diffs as printed by `git show --format= --unified=5`.
// Each one adds a comment line followed by a single code block.

namespace vibescore::samples {

// 5 code lines, import dropped as boilerplate
inline const char* kPythonDiff =
    "diff --git a/app/users.py b/app/users.py\n"
    "index 0000000..3b18e51 100644\n"
    "--- a/app/users.py\n"
    "+++ b/app/users.py\n"
    "@@ -0,0 +1,7 @@\n"
    "+import re\n"
    "+# normalise user names before they reach the database layer\n"
    "+def normalise_user(name):\n"
    "+    cleaned = name.strip().lower()\n"
    "+    if not cleaned.isidentifier():\n"
    "+        raise ValueError(name)\n"
    "+    return cleaned\n";

// 4 code lines
inline const char* kJavaScriptDiff =
    "diff --git a/web/layout.js b/web/layout.js\n"
    "--- a/web/layout.js\n"
    "+++ b/web/layout.js\n"
    "@@ -10,3 +10,9 @@ export function mount() {\n"
    " const pendingFrame = null;\n"
    "+// debounce resize events so the layout is computed once per frame\n"
    "+function onResize(event) {\n"
    "+  cancelAnimationFrame(pendingFrame);\n"
    "+  pendingFrame = requestAnimationFrame(() => relayout(event.target));\n"
    "+  metrics.resizeCount += 1;\n"
    "+}\n";

// 8 code lines
inline const char* kGoDiff =
    "diff --git a/upload/retry.go b/upload/retry.go\n"
    "--- a/upload/retry.go\n"
    "+++ b/upload/retry.go\n"
    "@@ -0,0 +1,12 @@\n"
    "+// retry the upload with exponential backoff until the deadline passes\n"
    "+func uploadWithRetry(ctx context.Context, blob []byte) error {\n"
    "+\tdelay := 100 * time.Millisecond\n"
    "+\tfor attempt := 0; attempt < maxAttempts; attempt++ {\n"
    "+\t\tif err := upload(ctx, blob); err == nil {\n"
    "+\t\t\treturn nil\n"
    "+\t\t}\n"
    "+\t\ttime.Sleep(delay)\n"
    "+\t\tdelay *= 2\n"
    "+\t}\n"
    "+\treturn errUploadFailed\n"
    "+}\n";

// 5 code lines
inline const char* kRustDiff =
    "diff --git a/src/header.rs b/src/header.rs\n"
    "--- a/src/header.rs\n"
    "+++ b/src/header.rs\n"
    "@@ -0,0 +1,7 @@\n"
    "+// parse the header once and cache the decoded length for later reads\n"
    "+fn decode_header(bytes: &[u8]) -> Result<Header, DecodeError> {\n"
    "+    let magic = u32::from_le_bytes(bytes[0..4].try_into()?);\n"
    "+    let length = u32::from_le_bytes(bytes[4..8].try_into()?);\n"
    "+    validate_magic(magic)?;\n"
    "+    Ok(Header { magic, length })\n"
    "+}\n";

/// A diff adding `lines` trivial lines to a non-source file.
inline std::string bulkTextDiff(int lines) {
    std::string diff = "diff --git a/notes.txt b/notes.txt\n@@ -0,0 +1 @@\n";
    for (int i = 0; i < lines; i++) diff += "+note\n";
    return diff;
}

} // namespace vibescore::samples
