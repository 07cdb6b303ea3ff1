#include "velocity/velocity_aggregator.hpp"
#include "extraction/diff_segmenter.hpp"
#include <algorithm>
#include <cmath>
#include <ctime>
#include <stdexcept>

namespace vibescore {

std::string utcDate(int64_t unix_seconds) {
    std::time_t t = static_cast<std::time_t>(unix_seconds);
    std::tm tm{};
#ifdef _WIN32
    if (gmtime_s(&tm, &t) != 0) {
        throw std::runtime_error("Invalid timestamp: " + std::to_string(unix_seconds));
    }
#else
    if (gmtime_r(&t, &tm) == nullptr) {
        throw std::runtime_error("Invalid timestamp: " + std::to_string(unix_seconds));
    }
#endif
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

VelocityAggregator::VelocityAggregator(VelocityConfig config)
    : config_(config) {}

void VelocityAggregator::addChange(int64_t unix_seconds, const std::string& diff) {
    addLines(utcDate(unix_seconds), DiffSegmenter::countAddedLines(diff));
}

void VelocityAggregator::addLines(const std::string& date, int lines_added) {
    Totals& t = days_[date];
    t.lines += lines_added;
    t.commits++;
}

std::vector<DailyStat> VelocityAggregator::topDays() const {
    std::vector<DailyStat> result;
    for (const auto& [date, t] : days_) {
        if (t.lines <= config_.min_lines_per_day) continue;
        DailyStat stat;
        stat.date = date;
        stat.lines_added = t.lines;
        stat.commit_count = t.commits;
        stat.avg_lines_per_commit = static_cast<int>(
            std::lround(static_cast<double>(t.lines) / t.commits));
        result.push_back(stat);
    }

    std::stable_sort(result.begin(), result.end(),
                     [](const DailyStat& a, const DailyStat& b) {
                         return a.lines_added > b.lines_added;
                     });
    if (result.size() > config_.max_days) result.resize(config_.max_days);
    return result;
}

} // namespace vibescore
