#pragma once

#include "history/history_source.hpp"
#include <string>
#include <vector>

namespace vibescore {

// ─── Git History Source ────────────────────────────────────────
// HistorySource backed by the `git` executable:
//   isRepository   git rev-parse --git-dir
//   authorRecords  git log --max-count=N --format=%aN|%aE
//   changeIds      git log --max-count=N --format=%H
//   changeInfo     git log -1 --format=%aN|%aE|%at|%s <id>
//   changeDiff     git show <id> --format= --unified=5 --diff-filter=AM

class GitHistorySource : public HistorySource {
public:
    explicit GitHistorySource(std::string working_dir = ".",
                              std::string git_executable = "git");

    bool isRepository() override;
    std::string location() const override { return working_dir_; }
    std::vector<std::string> authorRecords(int max_count) override;
    std::vector<std::string> changeIds(int max_count) override;
    ChangeInfo changeInfo(const std::string& change_id) override;
    std::string changeDiff(const std::string& change_id) override;

    /// True for a non-empty hexadecimal object id.
    static bool isValidChangeId(const std::string& change_id);

private:
    std::string working_dir_;
    std::string git_;

    /// Run git with the given arguments and return trimmed stdout.
    /// Throws RetrievalFailure on a non-zero exit.
    std::string runGit(const std::vector<std::string>& args) const;

    std::vector<std::string> nonEmptyLines(const std::string& output) const;
    void requireValidId(const std::string& change_id) const;
};

} // namespace vibescore
