#pragma once

#include <string>
#include <vector>

namespace infergate {

struct CommandResult {
    /// Process exit status; 127 when the program could not be executed,
    /// 128 + signal when it was killed.
    int exit_code{-1};
    /// Combined stdout and stderr.
    std::string output;

    bool ok() const { return exit_code == 0; }
};

/// Seam between the supervisor and the operating system. Every external
/// command the supervisor issues (init system, process signalling,
/// container runtime) goes through this interface.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /// Run to completion and capture output.
    virtual CommandResult run(const std::vector<std::string>& args) = 0;

    /// Launch in a new session, detached from the caller, with stdout and
    /// stderr appended to log_path. Returns false when the program could
    /// not be started; error receives the reason.
    virtual bool spawnDetached(const std::vector<std::string>& args,
                               const std::string& log_path,
                               std::string& error) = 0;
};

class PosixCommandRunner : public CommandRunner {
public:
    CommandResult run(const std::vector<std::string>& args) override;
    bool spawnDetached(const std::vector<std::string>& args,
                       const std::string& log_path,
                       std::string& error) override;
};

/// Whitespace split, used for configured commands such as "docker compose".
std::vector<std::string> splitCommandLine(const std::string& command);

}  // namespace infergate
