#include "supervisor/container_runtime.h"

#include <spdlog/spdlog.h>
#include <sstream>
#include <utility>

namespace infergate {

ComposeRuntime::ComposeRuntime(CommandRunner& runner, std::string compose_command, std::string project_dir)
    : runner_(runner), compose_(splitCommandLine(compose_command)), project_dir_(std::move(project_dir)) {
    if (compose_.empty()) {
        compose_ = {"docker", "compose"};
    }
}

std::vector<std::string> ComposeRuntime::command(std::initializer_list<std::string> verb) const {
    std::vector<std::string> args = compose_;
    args.push_back("--project-directory");
    args.push_back(project_dir_);
    args.insert(args.end(), verb.begin(), verb.end());
    return args;
}

std::optional<std::vector<std::string>> ComposeRuntime::listServices(bool running_only) const {
    auto args = running_only ? command({"ps", "--services", "--filter", "status=running"})
                             : command({"ps", "--services", "--all"});
    auto res = runner_.run(args);
    if (!res.ok()) {
        spdlog::debug("Container runtime query failed ({}): {}", res.exit_code, res.output);
        return std::nullopt;
    }

    std::vector<std::string> services;
    std::istringstream iss(res.output);
    std::string line;
    while (std::getline(iss, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
        if (!line.empty()) services.push_back(line);
    }
    return services;
}

std::optional<ServiceCounts> ComposeRuntime::counts() const {
    auto all = listServices(false);
    if (!all) return std::nullopt;
    auto running = listServices(true);
    if (!running) return std::nullopt;
    return ServiceCounts{running->size(), all->size()};
}

CommandResult ComposeRuntime::up() const {
    return runner_.run(command({"up", "-d"}));
}

CommandResult ComposeRuntime::restart() const {
    return runner_.run(command({"restart"}));
}

CommandResult ComposeRuntime::stop() const {
    return runner_.run(command({"stop"}));
}

CommandResult ComposeRuntime::kill() const {
    return runner_.run(command({"kill"}));
}

}  // namespace infergate
