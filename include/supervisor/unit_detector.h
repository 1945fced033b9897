#pragma once

#include <memory>
#include <string>
#include <vector>

#include "supervisor/command_runner.h"
#include "supervisor/container_runtime.h"

namespace infergate {

enum class Detection {
    Running,
    NotRunning,
    Transitional,  // starting, stopping, or partially up
    Unavailable,   // the mechanism itself could not answer
};

enum class UnitState { Unknown, Running, Stopped, Indeterminate };

std::string to_string(Detection d);
std::string to_string(UnitState s);

struct DetectResult {
    Detection state{Detection::Unavailable};
    std::string detail;
};

/// One way of asking whether a unit is running.
class UnitDetector {
public:
    virtual ~UnitDetector() = default;
    virtual std::string name() const = 0;
    virtual DetectResult detect() = 0;
};

/// `systemctl is-active <unit>`.
class InitSystemDetector : public UnitDetector {
public:
    InitSystemDetector(CommandRunner& runner, std::string unit);
    std::string name() const override { return "init-system"; }
    DetectResult detect() override;

private:
    CommandRunner& runner_;
    std::string unit_;
};

/// `pgrep -f <pattern>`.
class ProcessPatternDetector : public UnitDetector {
public:
    ProcessPatternDetector(CommandRunner& runner, std::string pattern);
    std::string name() const override { return "process"; }
    DetectResult detect() override;

private:
    CommandRunner& runner_;
    std::string pattern_;
};

/// Running service count against total from the container runtime.
/// Running only when every declared service is up and at least one is
/// declared; an empty project is not running.
class ContainerDetector : public UnitDetector {
public:
    explicit ContainerDetector(const ComposeRuntime& runtime);
    std::string name() const override { return "container"; }
    DetectResult detect() override;

    static DetectResult classify(const ServiceCounts& counts);

private:
    const ComposeRuntime& runtime_;
};

/// Combine detector answers tried in priority order: any Running wins,
/// then Transitional, then NotRunning; Unknown when none could answer.
UnitState combineDetections(const std::vector<DetectResult>& results);

}  // namespace infergate
