#include "supervisor/supervisor.h"

#include <spdlog/spdlog.h>
#include <filesystem>
#include <thread>
#include <utility>

#include "utils/config.h"

namespace infergate {

namespace {

constexpr UnitKind kRestartOrder[] = {
    UnitKind::InferenceDaemon,
    UnitKind::Gateway,
    UnitKind::ContainerWorker,
};

}  // namespace

Supervisor::Supervisor(std::vector<std::unique_ptr<ManagedUnit>> units, SupervisorOptions options)
    : units_(std::move(units)),
      options_(options),
      sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

bool Supervisor::has(UnitKind kind) const {
    return unit(kind) != nullptr;
}

ManagedUnit* Supervisor::unit(UnitKind kind) const {
    for (const auto& u : units_) {
        if (u->kind() == kind) return u.get();
    }
    return nullptr;
}

std::vector<UnitKind> Supervisor::kinds() const {
    std::vector<UnitKind> out;
    for (auto kind : kRestartOrder) {
        if (has(kind)) out.push_back(kind);
    }
    return out;
}

UnitStatus Supervisor::status(UnitKind kind) {
    auto* u = unit(kind);
    if (!u) {
        UnitStatus s;
        s.kind = kind;
        s.name = to_string(kind);
        s.detail = "not configured";
        return s;
    }
    return u->status();
}

std::vector<UnitStatus> Supervisor::statusAll() {
    std::vector<UnitStatus> out;
    for (auto kind : kinds()) {
        out.push_back(status(kind));
    }
    return out;
}

UnitStatus Supervisor::pollUntil(ManagedUnit& unit, std::chrono::milliseconds window,
                                 const std::function<bool(const UnitStatus&)>& done) {
    const auto deadline = std::chrono::steady_clock::now() + window;
    for (;;) {
        auto s = unit.status();
        if (done(s) || std::chrono::steady_clock::now() >= deadline) {
            return s;
        }
        sleeper_(options_.poll_interval);
    }
}

UnitStatus Supervisor::awaitStableRunning(ManagedUnit& unit) {
    auto settled = pollUntil(unit, options_.settle_window, [](const UnitStatus& s) { return s.running(); });
    if (!settled.running()) {
        return settled;
    }
    // a process that exits right after spawning is briefly visible
    sleeper_(options_.stability_window);
    return unit.status();
}

UnitResult Supervisor::makeResult(ManagedUnit& unit, ErrorCode code, const UnitStatus& status,
                                  std::string message) const {
    UnitResult r;
    r.kind = unit.kind();
    r.name = unit.name();
    r.code = code;
    r.state = status.state;
    r.message = std::move(message);
    return r;
}

UnitResult Supervisor::missing(UnitKind kind) const {
    UnitResult r;
    r.kind = kind;
    r.name = to_string(kind);
    r.code = ErrorCode::kInvalidConfig;
    r.message = to_string(kind) + " is not configured on this host";
    return r;
}

UnitResult Supervisor::start(UnitKind kind) {
    auto* u = unit(kind);
    if (!u) return missing(kind);

    auto current = u->status();
    if (current.running()) {
        auto r = makeResult(*u, ErrorCode::kOk, current, u->name() + " already running");
        r.unchanged = true;
        return r;
    }

    spdlog::info("Starting {}", u->name());
    auto action = u->launch();
    if (!action.ok) {
        spdlog::error("Failed to start {}: {}", u->name(), action.detail);
        return makeResult(*u, ErrorCode::kStartFailed, current, action.detail);
    }

    auto settled = awaitStableRunning(*u);
    if (settled.running()) {
        return makeResult(*u, ErrorCode::kOk, settled, u->name() + " started (" + action.detail + ")");
    }
    if (settled.state == UnitState::Indeterminate) {
        return makeResult(*u, ErrorCode::kIndeterminate, settled,
                          u->name() + " did not settle: " + settled.detail);
    }
    spdlog::error("{} not running after start: {}", u->name(), settled.detail);
    return makeResult(*u, ErrorCode::kStartFailed, settled,
                      u->name() + " not running after start: " + settled.detail);
}

UnitResult Supervisor::stop(UnitKind kind, bool force) {
    auto* u = unit(kind);
    if (!u) return missing(kind);

    auto current = u->status();
    if (current.state == UnitState::Stopped) {
        auto r = makeResult(*u, ErrorCode::kOk, current, u->name() + " already stopped");
        r.unchanged = true;
        return r;
    }

    spdlog::info("Stopping {}", u->name());
    auto stopped = [](const UnitStatus& s) { return s.state == UnitState::Stopped; };

    auto action = u->terminate(StopSignal::Graceful);
    UnitStatus settled = action.ok ? pollUntil(*u, options_.grace_window, stopped) : u->status();

    if (!stopped(settled) && force) {
        spdlog::warn("{} still {} after graceful stop, killing", u->name(), to_string(settled.state));
        action = u->terminate(StopSignal::Kill);
        settled = action.ok ? pollUntil(*u, options_.grace_window, stopped) : u->status();
    }

    if (stopped(settled)) {
        return makeResult(*u, ErrorCode::kOk, settled, u->name() + " stopped");
    }
    if (!action.ok) {
        spdlog::error("Failed to stop {}: {}", u->name(), action.detail);
        return makeResult(*u, ErrorCode::kStopFailed, settled, action.detail);
    }
    if (settled.running()) {
        return makeResult(*u, ErrorCode::kStopFailed, settled,
                          u->name() + " still running: " + settled.detail);
    }
    return makeResult(*u, ErrorCode::kIndeterminate, settled,
                      u->name() + " state after stop is " + to_string(settled.state) + ": " + settled.detail);
}

UnitResult Supervisor::restart(UnitKind kind) {
    auto* u = unit(kind);
    if (!u) return missing(kind);

    if (u->hasNativeRestart()) {
        spdlog::info("Restarting {}", u->name());
        auto action = u->restartInPlace();
        if (!action.ok) {
            return makeResult(*u, ErrorCode::kStartFailed, u->status(), action.detail);
        }
        auto settled = awaitStableRunning(*u);
        if (settled.running()) {
            return makeResult(*u, ErrorCode::kOk, settled, u->name() + " restarted (" + settled.detail + ")");
        }
        ErrorCode code = settled.state == UnitState::Indeterminate ? ErrorCode::kIndeterminate
                                                                    : ErrorCode::kStartFailed;
        return makeResult(*u, code, settled, u->name() + " after restart: " + settled.detail);
    }

    auto stopped = stop(kind);
    if (!stopped.ok()) {
        return stopped;
    }
    sleeper_(options_.restart_delay);
    auto started = start(kind);
    if (started.ok()) {
        started.message = u->name() + " restarted";
    }
    return started;
}

std::vector<UnitResult> Supervisor::restartAll() {
    std::vector<UnitResult> results;
    for (auto kind : kinds()) {
        results.push_back(restart(kind));
    }
    return results;
}

std::vector<UnitResult> Supervisor::restartFailing() {
    std::vector<UnitResult> results;
    for (auto kind : kinds()) {
        if (status(kind).running()) continue;
        results.push_back(restart(kind));
    }
    return results;
}

std::vector<std::unique_ptr<ManagedUnit>> buildDefaultUnits(CommandRunner& runner,
                                                            const GatewayConfig& config,
                                                            const std::string& self_exe) {
    namespace fs = std::filesystem;
    const fs::path log_dir = config.log_dir;

    std::vector<std::unique_ptr<ManagedUnit>> units;

    ProcessUnitConfig daemon;
    daemon.kind = UnitKind::InferenceDaemon;
    daemon.name = "ollama";
    daemon.init_unit = config.daemon_unit;
    daemon.process_pattern = config.daemon_command;
    daemon.launch_command = splitCommandLine(config.daemon_command);
    daemon.log_path = (log_dir / "ollama.log").string();
    units.push_back(std::make_unique<ProcessUnit>(runner, std::move(daemon)));

    ProcessUnitConfig gateway;
    gateway.kind = UnitKind::Gateway;
    gateway.name = "gateway";
    gateway.process_pattern = fs::path(self_exe).filename().string() + " serve";
    gateway.launch_command = {self_exe, "serve"};
    gateway.log_path = (log_dir / "gateway.log").string();
    units.push_back(std::make_unique<ProcessUnit>(runner, std::move(gateway)));

    if (!config.worker_dir.empty()) {
        units.push_back(std::make_unique<ContainerUnit>(runner, "worker", config.compose_command,
                                                        config.worker_dir,
                                                        (log_dir / "worker.log").string()));
    }
    return units;
}

}  // namespace infergate
