#pragma once

#include "config/config.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace vibescore {

/// Added-line volume for one calendar day (UTC).
struct DailyStat {
    std::string date;             // YYYY-MM-DD
    int lines_added = 0;
    int commit_count = 0;
    int avg_lines_per_commit = 0; // round(lines_added / commit_count)
};

/// Calendar date (UTC) of a unix timestamp, as YYYY-MM-DD.
std::string utcDate(int64_t unix_seconds);

// ─── Velocity Aggregator ───────────────────────────────────────
// Raw volume, no file-type or pattern filtering: every "+" line
// except "+++" counts. Days above min_lines_per_day are high-output
// days; at most max_days of them are reported, largest first.

class VelocityAggregator {
public:
    explicit VelocityAggregator(VelocityConfig config = {});

    /// Record one change by a selected identity.
    void addChange(int64_t unix_seconds, const std::string& diff);

    /// Record a pre-counted change for a given date.
    void addLines(const std::string& date, int lines_added);

    /// High-output days, sorted by lines_added descending.
    std::vector<DailyStat> topDays() const;

    size_t dayCount() const { return days_.size(); }
    void clear() { days_.clear(); }

private:
    struct Totals {
        int lines = 0;
        int commits = 0;
    };

    VelocityConfig config_;
    std::map<std::string, Totals> days_;
};

} // namespace vibescore
