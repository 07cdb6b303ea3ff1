#pragma once

#include "model/identity.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace vibescore {

/// Metadata of one historical change.
struct ChangeInfo {
    std::string change_id;
    Identity author;
    int64_t timestamp = 0;  // unix seconds
    std::string message;
};

/// Parse a "name|email|unixTimestamp|message..." record. The message may
/// itself contain '|' and is rebuilt from all trailing fields. A missing
/// or non-numeric timestamp becomes 0.
ChangeInfo parseChangeRecord(const std::string& record, const std::string& change_id);

/// Aggregate "name|email" records into identities, most commits first.
/// Blank records are skipped; ties keep first-seen order.
std::vector<Identity> aggregateIdentities(const std::vector<std::string>& author_records);

// ─── History Source ────────────────────────────────────────────
// Read-only boundary to the version-control system. Implementations
// throw RetrievalFailure when a single lookup fails.

class HistorySource {
public:
    virtual ~HistorySource() = default;

    /// Whether the working location holds a repository.
    virtual bool isRepository() = 0;

    /// Human-readable location, for error messages.
    virtual std::string location() const = 0;

    /// One "name|email" record per change, newest first.
    virtual std::vector<std::string> authorRecords(int max_count) = 0;

    /// Change ids, newest first.
    virtual std::vector<std::string> changeIds(int max_count) = 0;

    virtual ChangeInfo changeInfo(const std::string& change_id) = 0;

    /// Unified diff of the change (added and modified files only).
    virtual std::string changeDiff(const std::string& change_id) = 0;
};

} // namespace vibescore
