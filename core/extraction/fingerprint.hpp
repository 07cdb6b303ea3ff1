#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace vibescore {

/// Content fingerprint used for duplicate detection: lines joined with
/// '\n', whitespace runs collapsed to one space, trimmed, truncated to
/// max_length characters (UTF-8 code points).
std::string fingerprint(const std::vector<std::string>& lines, size_t max_length = 200);

} // namespace vibescore
