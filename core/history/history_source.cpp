#include "history/history_source.hpp"
#include "util/text.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <unordered_map>

namespace vibescore {

namespace {

int64_t parseTimestamp(const std::string& field) {
    std::string t = text::trim(field);
    if (t.empty()) return 0;
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(t.c_str(), &end, 10);
    if (errno != 0 || end == t.c_str() || *end != '\0') return 0;
    return static_cast<int64_t>(value);
}

} // namespace

ChangeInfo parseChangeRecord(const std::string& record, const std::string& change_id) {
    std::vector<std::string> parts = text::split(text::trim(record), '|');

    ChangeInfo info;
    info.change_id = change_id;
    info.author.name = parts.size() > 0 ? parts[0] : "";
    info.author.email = parts.size() > 1 ? parts[1] : "";
    info.timestamp = parts.size() > 2 ? parseTimestamp(parts[2]) : 0;
    if (parts.size() > 3) {
        info.message = text::join(std::vector<std::string>(parts.begin() + 3, parts.end()), "|");
    }
    return info;
}

std::vector<Identity> aggregateIdentities(const std::vector<std::string>& author_records) {
    std::vector<Identity> identities;
    std::unordered_map<std::string, size_t> index;

    for (const auto& record : author_records) {
        if (text::trim(record).empty()) continue;
        std::vector<std::string> parts = text::split(record, '|');
        Identity id(parts[0], parts.size() > 1 ? parts[1] : "");

        auto it = index.find(id.key());
        if (it != index.end()) {
            identities[it->second].commit_count++;
        } else {
            id.commit_count = 1;
            index[id.key()] = identities.size();
            identities.push_back(id);
        }
    }

    std::stable_sort(identities.begin(), identities.end(),
                     [](const Identity& a, const Identity& b) {
                         return a.commit_count > b.commit_count;
                     });
    return identities;
}

} // namespace vibescore
