#pragma once

#include <memory>
#include <string>
#include <vector>

#include "supervisor/command_runner.h"
#include "supervisor/container_runtime.h"
#include "supervisor/unit_detector.h"

namespace infergate {

enum class UnitKind { InferenceDaemon, Gateway, ContainerWorker };

std::string to_string(UnitKind kind);

struct UnitStatus {
    UnitKind kind{UnitKind::InferenceDaemon};
    std::string name;
    UnitState state{UnitState::Unknown};
    std::string detail;

    bool running() const { return state == UnitState::Running; }
};

struct UnitAction {
    bool ok{false};
    std::string detail;
};

enum class StopSignal { Graceful, Kill };

/// A local service the supervisor can observe and control. Implementations
/// issue commands and report what they observed; waiting for a state to
/// settle is the supervisor's job.
class ManagedUnit {
public:
    virtual ~ManagedUnit() = default;

    virtual UnitKind kind() const = 0;
    virtual std::string name() const = 0;
    virtual std::string logPath() const = 0;

    virtual UnitStatus status() = 0;
    virtual UnitAction launch() = 0;
    virtual UnitAction terminate(StopSignal signal) = 0;

    /// Units managed by a runtime with its own restart primitive override
    /// this; the default means restart is stop followed by start.
    virtual bool hasNativeRestart() const { return false; }
    virtual UnitAction restartInPlace() { return {false, "no native restart"}; }
};

struct ProcessUnitConfig {
    UnitKind kind{UnitKind::InferenceDaemon};
    std::string name;
    /// systemd unit name; empty when the unit is never managed by the init system
    std::string init_unit;
    /// pgrep/pkill -f pattern
    std::string process_pattern;
    std::vector<std::string> launch_command;
    std::string log_path;
};

/// A host process, optionally backed by a systemd unit. Detection tries the
/// init system first and the process table second.
class ProcessUnit : public ManagedUnit {
public:
    ProcessUnit(CommandRunner& runner, ProcessUnitConfig config);

    UnitKind kind() const override { return config_.kind; }
    std::string name() const override { return config_.name; }
    std::string logPath() const override { return config_.log_path; }

    UnitStatus status() override;
    UnitAction launch() override;
    UnitAction terminate(StopSignal signal) override;

private:
    CommandRunner& runner_;
    ProcessUnitConfig config_;
    std::vector<std::unique_ptr<UnitDetector>> detectors_;
    InitSystemDetector* init_detector_{nullptr};
};

/// The containerized worker, controlled through the container runtime.
class ContainerUnit : public ManagedUnit {
public:
    ContainerUnit(CommandRunner& runner, std::string name, std::string compose_command,
                  std::string project_dir, std::string log_path);

    UnitKind kind() const override { return UnitKind::ContainerWorker; }
    std::string name() const override { return name_; }
    std::string logPath() const override { return log_path_; }

    UnitStatus status() override;
    UnitAction launch() override;
    UnitAction terminate(StopSignal signal) override;

    bool hasNativeRestart() const override { return true; }
    UnitAction restartInPlace() override;

    const ComposeRuntime& runtime() const { return runtime_; }

private:
    std::string name_;
    std::string log_path_;
    ComposeRuntime runtime_;
    ContainerDetector detector_;
};

}  // namespace infergate
