#include "history/git_history_source.hpp"
#include "history/process_runner.hpp"
#include "model/errors.hpp"
#include "util/text.hpp"
#include <cctype>
#include <utility>

namespace vibescore {

GitHistorySource::GitHistorySource(std::string working_dir, std::string git_executable)
    : working_dir_(std::move(working_dir)), git_(std::move(git_executable)) {}

std::string GitHistorySource::runGit(const std::vector<std::string>& args) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(git_);
    argv.insert(argv.end(), args.begin(), args.end());

    CommandResult r = runProcess(argv, working_dir_);
    if (!r.ok()) {
        std::string detail = text::trim(r.stderr_output);
        if (detail.empty()) {
            detail = "git " + (args.empty() ? std::string() : args[0]) +
                     " failed with exit code " + std::to_string(r.exit_code);
        }
        throw RetrievalFailure(detail);
    }
    return text::trim(r.stdout_output);
}

std::vector<std::string> GitHistorySource::nonEmptyLines(const std::string& output) const {
    std::vector<std::string> lines;
    for (auto& line : text::splitLines(output)) {
        if (!text::trim(line).empty()) lines.push_back(std::move(line));
    }
    return lines;
}

bool GitHistorySource::isValidChangeId(const std::string& change_id) {
    if (change_id.empty()) return false;
    for (char c : change_id) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

void GitHistorySource::requireValidId(const std::string& change_id) const {
    if (!isValidChangeId(change_id)) {
        throw RetrievalFailure("Invalid change id: '" + change_id + "'");
    }
}

bool GitHistorySource::isRepository() {
    try {
        runGit({"rev-parse", "--git-dir"});
        return true;
    } catch (const RetrievalFailure&) {
        return false;
    }
}

std::vector<std::string> GitHistorySource::authorRecords(int max_count) {
    return nonEmptyLines(runGit({"log", "--max-count=" + std::to_string(max_count),
                                 "--format=%aN|%aE"}));
}

std::vector<std::string> GitHistorySource::changeIds(int max_count) {
    return nonEmptyLines(runGit({"log", "--max-count=" + std::to_string(max_count),
                                 "--format=%H"}));
}

ChangeInfo GitHistorySource::changeInfo(const std::string& change_id) {
    requireValidId(change_id);
    return parseChangeRecord(runGit({"log", "-1", "--format=%aN|%aE|%at|%s", change_id}),
                             change_id);
}

std::string GitHistorySource::changeDiff(const std::string& change_id) {
    requireValidId(change_id);
    return runGit({"show", change_id, "--format=", "--unified=5", "--diff-filter=AM"});
}

} // namespace vibescore
