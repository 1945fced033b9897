#include "supervisor/unit_detector.h"

#include <algorithm>
#include <utility>

namespace infergate {

namespace {

std::string first_line(const std::string& text) {
    auto pos = text.find('\n');
    std::string line = pos == std::string::npos ? text : text.substr(0, pos);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
    return line;
}

}  // namespace

std::string to_string(Detection d) {
    switch (d) {
        case Detection::Running: return "running";
        case Detection::NotRunning: return "not running";
        case Detection::Transitional: return "transitional";
        case Detection::Unavailable: return "unavailable";
    }
    return "unavailable";
}

std::string to_string(UnitState s) {
    switch (s) {
        case UnitState::Unknown: return "unknown";
        case UnitState::Running: return "running";
        case UnitState::Stopped: return "stopped";
        case UnitState::Indeterminate: return "indeterminate";
    }
    return "unknown";
}

InitSystemDetector::InitSystemDetector(CommandRunner& runner, std::string unit)
    : runner_(runner), unit_(std::move(unit)) {}

DetectResult InitSystemDetector::detect() {
    auto res = runner_.run({"systemctl", "is-active", unit_});
    const std::string state = first_line(res.output);
    if (res.exit_code == 127 || res.exit_code < 0) {
        return {Detection::Unavailable, "systemctl not available"};
    }
    if (state == "active") {
        return {Detection::Running, "systemd unit " + unit_ + " active"};
    }
    if (state == "activating" || state == "deactivating" || state == "reloading") {
        return {Detection::Transitional, "systemd unit " + unit_ + " " + state};
    }
    if (state == "inactive" || state == "failed") {
        return {Detection::NotRunning, "systemd unit " + unit_ + " " + state};
    }
    // e.g. "System has not been booted with systemd", or no such unit
    return {Detection::Unavailable, state.empty() ? "systemctl gave no answer" : state};
}

ProcessPatternDetector::ProcessPatternDetector(CommandRunner& runner, std::string pattern)
    : runner_(runner), pattern_(std::move(pattern)) {}

DetectResult ProcessPatternDetector::detect() {
    auto res = runner_.run({"pgrep", "-f", pattern_});
    if (res.exit_code == 0) {
        auto pid = first_line(res.output);
        return {Detection::Running, "process '" + pattern_ + "' (pid " + pid + ")"};
    }
    if (res.exit_code == 1) {
        return {Detection::NotRunning, "no process matching '" + pattern_ + "'"};
    }
    return {Detection::Unavailable, "pgrep failed: " + first_line(res.output)};
}

ContainerDetector::ContainerDetector(const ComposeRuntime& runtime) : runtime_(runtime) {}

DetectResult ContainerDetector::classify(const ServiceCounts& counts) {
    const std::string detail = std::to_string(counts.running) + " of " + std::to_string(counts.total) + " running";
    if (counts.total == 0) {
        return {Detection::NotRunning, detail + " (no services declared)"};
    }
    if (counts.running >= counts.total) {
        return {Detection::Running, detail};
    }
    if (counts.running == 0) {
        return {Detection::NotRunning, detail};
    }
    return {Detection::Transitional, detail};
}

DetectResult ContainerDetector::detect() {
    auto counts = runtime_.counts();
    if (!counts) {
        return {Detection::Unavailable, "container runtime unavailable in " + runtime_.projectDir()};
    }
    return classify(*counts);
}

UnitState combineDetections(const std::vector<DetectResult>& results) {
    auto any = [&](Detection d) {
        return std::any_of(results.begin(), results.end(), [d](const DetectResult& r) { return r.state == d; });
    };
    if (any(Detection::Running)) return UnitState::Running;
    if (any(Detection::Transitional)) return UnitState::Indeterminate;
    if (any(Detection::NotRunning)) return UnitState::Stopped;
    return UnitState::Unknown;
}

}  // namespace infergate
