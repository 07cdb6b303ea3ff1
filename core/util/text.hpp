#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace vibescore::text {

/// Strip leading and trailing whitespace.
std::string trim(const std::string& s);

/// Replace every run of whitespace with a single space.
std::string collapseWhitespace(const std::string& s);

std::string toLower(std::string s);

bool startsWith(const std::string& s, const std::string& prefix);
bool endsWith(const std::string& s, const std::string& suffix);

/// Split on a single character. Empty fields are kept.
std::vector<std::string> split(const std::string& s, char delim);

/// Split into lines on '\n', dropping a trailing '\r' from each line.
std::vector<std::string> splitLines(const std::string& s);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

/// Number of UTF-8 code points. Continuation bytes are not counted.
size_t utf8Length(const std::string& s);

/// The first n code points of s. Never splits a multi-byte sequence.
std::string utf8Prefix(const std::string& s, size_t n);

} // namespace vibescore::text
