#pragma once

#include <string>
#include <vector>

namespace vibescore {

struct CommandResult {
    int exit_code = -1;
    std::string stdout_output;
    std::string stderr_output;

    bool ok() const { return exit_code == 0; }
};

/// Run argv[0] (looked up on PATH) with the given arguments in
/// working_dir, without a shell, and collect both output streams.
/// exit_code is -1 if the process could not be started.
CommandResult runProcess(const std::vector<std::string>& argv,
                         const std::string& working_dir);

} // namespace vibescore
