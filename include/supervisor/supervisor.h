#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/gateway_error.h"
#include "supervisor/managed_unit.h"

namespace infergate {

struct GatewayConfig;

struct SupervisorOptions {
    /// How long start() waits for a launched unit to report Running.
    std::chrono::milliseconds settle_window{std::chrono::seconds(15)};
    /// Once Running is seen after a launch, the unit must still be Running
    /// this long afterwards to count as started.
    std::chrono::milliseconds stability_window{std::chrono::seconds(2)};
    /// How long stop() waits for a terminated unit to report Stopped.
    std::chrono::milliseconds grace_window{std::chrono::seconds(10)};
    std::chrono::milliseconds poll_interval{std::chrono::milliseconds(500)};
    /// Pause between the stop and start halves of restart().
    std::chrono::milliseconds restart_delay{std::chrono::seconds(2)};
};

struct UnitResult {
    UnitKind kind{UnitKind::InferenceDaemon};
    std::string name;
    ErrorCode code{ErrorCode::kOk};
    UnitState state{UnitState::Unknown};
    /// Requested state already held; nothing was done.
    bool unchanged{false};
    std::string message;

    bool ok() const { return code == ErrorCode::kOk; }
};

/// Lifecycle control over the managed units. Every operation reports its
/// outcome once; nothing is retried.
class Supervisor {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit Supervisor(std::vector<std::unique_ptr<ManagedUnit>> units, SupervisorOptions options = {});

    void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    bool has(UnitKind kind) const;
    ManagedUnit* unit(UnitKind kind) const;

    UnitStatus status(UnitKind kind);
    std::vector<UnitStatus> statusAll();

    UnitResult start(UnitKind kind);
    UnitResult stop(UnitKind kind, bool force = false);
    UnitResult restart(UnitKind kind);

    /// Daemon, then gateway, each fully stopped and started, then the worker.
    std::vector<UnitResult> restartAll();

    /// Restart each configured unit whose status is not Running, in the
    /// same order as restartAll().
    std::vector<UnitResult> restartFailing();

    /// Units in fixed daemon, gateway, worker order.
    std::vector<UnitKind> kinds() const;

private:
    UnitStatus pollUntil(ManagedUnit& unit, std::chrono::milliseconds window,
                         const std::function<bool(const UnitStatus&)>& done);
    UnitStatus awaitStableRunning(ManagedUnit& unit);
    UnitResult makeResult(ManagedUnit& unit, ErrorCode code, const UnitStatus& status, std::string message) const;
    UnitResult missing(UnitKind kind) const;

    std::vector<std::unique_ptr<ManagedUnit>> units_;
    SupervisorOptions options_;
    Sleeper sleeper_;
};

/// The default unit set for this host: the Ollama daemon, the gateway run
/// as `<self_exe> serve`, and the container worker when a worker directory
/// is configured.
std::vector<std::unique_ptr<ManagedUnit>> buildDefaultUnits(CommandRunner& runner,
                                                            const GatewayConfig& config,
                                                            const std::string& self_exe);

}  // namespace infergate
