#include "supervisor/managed_unit.h"

#include <spdlog/spdlog.h>
#include <utility>

namespace infergate {

namespace {

std::string join_details(const std::vector<DetectResult>& results) {
    std::string out;
    for (const auto& r : results) {
        if (r.state == Detection::Unavailable) continue;
        if (!out.empty()) out += "; ";
        out += r.detail;
    }
    return out;
}

std::string trimmed(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

}  // namespace

std::string to_string(UnitKind kind) {
    switch (kind) {
        case UnitKind::InferenceDaemon: return "daemon";
        case UnitKind::Gateway: return "gateway";
        case UnitKind::ContainerWorker: return "worker";
    }
    return "unknown";
}

ProcessUnit::ProcessUnit(CommandRunner& runner, ProcessUnitConfig config)
    : runner_(runner), config_(std::move(config)) {
    if (!config_.init_unit.empty()) {
        auto init = std::make_unique<InitSystemDetector>(runner_, config_.init_unit);
        init_detector_ = init.get();
        detectors_.push_back(std::move(init));
    }
    detectors_.push_back(std::make_unique<ProcessPatternDetector>(runner_, config_.process_pattern));
}

UnitStatus ProcessUnit::status() {
    std::vector<DetectResult> results;
    results.reserve(detectors_.size());
    for (auto& detector : detectors_) {
        results.push_back(detector->detect());
        // authoritative answer; the fallback is not consulted
        if (results.back().state == Detection::Running) break;
    }

    UnitStatus status;
    status.kind = config_.kind;
    status.name = config_.name;
    status.state = combineDetections(results);
    status.detail = join_details(results);
    if (status.detail.empty()) status.detail = "no detector could determine state";
    return status;
}

UnitAction ProcessUnit::launch() {
    if (init_detector_) {
        auto res = runner_.run({"systemctl", "start", config_.init_unit});
        if (res.ok()) {
            return {true, "systemctl start " + config_.init_unit};
        }
        spdlog::warn("systemctl start {} failed ({}), spawning directly", config_.init_unit, trimmed(res.output));
    }

    std::string error;
    if (!runner_.spawnDetached(config_.launch_command, config_.log_path, error)) {
        return {false, error};
    }
    return {true, "spawned, logging to " + config_.log_path};
}

UnitAction ProcessUnit::terminate(StopSignal signal) {
    if (init_detector_ && signal == StopSignal::Graceful &&
        init_detector_->detect().state == Detection::Running) {
        auto res = runner_.run({"systemctl", "stop", config_.init_unit});
        if (res.ok()) {
            return {true, "systemctl stop " + config_.init_unit};
        }
        spdlog::warn("systemctl stop {} failed ({}), signalling processes", config_.init_unit, trimmed(res.output));
    }

    const char* sig = signal == StopSignal::Kill ? "-KILL" : "-TERM";
    auto res = runner_.run({"pkill", sig, "-f", config_.process_pattern});
    // pkill exits 1 when nothing matched
    if (res.exit_code == 0 || res.exit_code == 1) {
        return {true, std::string("sent SIG") + (sig + 1) + " to '" + config_.process_pattern + "'"};
    }
    return {false, "pkill failed: " + trimmed(res.output)};
}

ContainerUnit::ContainerUnit(CommandRunner& runner, std::string name, std::string compose_command,
                             std::string project_dir, std::string log_path)
    : name_(std::move(name)),
      log_path_(std::move(log_path)),
      runtime_(runner, std::move(compose_command), std::move(project_dir)),
      detector_(runtime_) {}

UnitStatus ContainerUnit::status() {
    auto result = detector_.detect();
    UnitStatus status;
    status.kind = UnitKind::ContainerWorker;
    status.name = name_;
    status.state = combineDetections({result});
    status.detail = result.detail;
    return status;
}

UnitAction ContainerUnit::launch() {
    auto res = runtime_.up();
    if (!res.ok()) return {false, "container up failed: " + trimmed(res.output)};
    return {true, "container services started"};
}

UnitAction ContainerUnit::terminate(StopSignal signal) {
    auto res = signal == StopSignal::Kill ? runtime_.kill() : runtime_.stop();
    if (!res.ok()) return {false, "container stop failed: " + trimmed(res.output)};
    return {true, "container services stopped"};
}

UnitAction ContainerUnit::restartInPlace() {
    auto res = runtime_.restart();
    if (!res.ok()) return {false, "container restart failed: " + trimmed(res.output)};
    return {true, "container services restarted"};
}

}  // namespace infergate
