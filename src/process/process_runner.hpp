#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace ojrunner::process {

struct ProcessResult {
    // Absent when the process was terminated by a signal.
    std::optional<int> exit_code;
    bool timed_out = false;
    std::string output;
    std::string error;
};

class ProcessRunner {
public:
    // A zero timeout lets the process run until it exits on its own.
    explicit ProcessRunner(std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

    // Runs `command` without a shell and feeds `input` on stdin. The first
    // call sets SIGPIPE to SIG_IGN for the whole process, so a child that
    // never reads its input fails our write with EPIPE instead of killing us.
    // Throws runner::LaunchError when the executable cannot be started.
    ProcessResult Run(const std::string& command,
                      const std::vector<std::string>& args,
                      const std::string& input,
                      const std::string& working_dir) const;

    std::chrono::milliseconds Timeout() const { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
};

}  // namespace ojrunner::process
