#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include "supervisor/command_runner.h"

namespace infergate {

struct ServiceCounts {
    size_t running{0};
    size_t total{0};
};

/// Container runtime primitives for the worker project, issued as
/// `<compose_command> --project-directory <dir> <verb> ...`.
class ComposeRuntime {
public:
    ComposeRuntime(CommandRunner& runner, std::string compose_command, std::string project_dir);

    /// Service names; std::nullopt when the runtime cannot be queried.
    std::optional<std::vector<std::string>> listServices(bool running_only = false) const;
    std::optional<ServiceCounts> counts() const;

    CommandResult up() const;
    CommandResult restart() const;
    CommandResult stop() const;
    CommandResult kill() const;

    const std::string& projectDir() const { return project_dir_; }

private:
    std::vector<std::string> command(std::initializer_list<std::string> verb) const;

    CommandRunner& runner_;
    std::vector<std::string> compose_;
    std::string project_dir_;
};

}  // namespace infergate
