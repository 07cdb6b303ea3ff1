#include "extraction/fingerprint.hpp"
#include "util/text.hpp"

namespace vibescore {

std::string fingerprint(const std::vector<std::string>& lines, size_t max_length) {
    std::string normalized = text::trim(text::collapseWhitespace(text::join(lines, "\n")));
    return text::utf8Prefix(normalized, max_length);
}

} // namespace vibescore
