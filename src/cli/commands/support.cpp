#include "cli/commands.h"

#include <spdlog/spdlog.h>
#include <climits>
#include <unistd.h>

namespace infergate {
namespace cli {
namespace commands {

GatewayConfig loadConfig() {
    auto [cfg, log] = loadGatewayConfigWithLog();
    spdlog::debug("config: {}", log);
    return cfg;
}

std::shared_ptr<Supervisor> makeSupervisor(const GatewayConfig& config) {
    static PosixCommandRunner runner;
    return std::make_shared<Supervisor>(buildDefaultUnits(runner, config, selfExecutablePath()));
}

std::string selfExecutablePath() {
    char buf[PATH_MAX];
    ssize_t n = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) {
        return "infergate";
    }
    buf[n] = '\0';
    return std::string(buf);
}

std::optional<UnitKind> parseUnitKind(const std::string& name) {
    if (name == "daemon") return UnitKind::InferenceDaemon;
    if (name == "gateway") return UnitKind::Gateway;
    if (name == "worker") return UnitKind::ContainerWorker;
    return std::nullopt;
}

}  // namespace commands
}  // namespace cli
}  // namespace infergate
