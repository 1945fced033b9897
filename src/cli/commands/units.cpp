// start / stop / restart / status over the managed units

#include "cli/commands.h"
#include <algorithm>
#include <functional>
#include <iostream>
#include <vector>

namespace infergate {
namespace cli {
namespace commands {

namespace {

void printResult(const UnitResult& r) {
    if (r.ok()) {
        std::cout << "[ OK ] " << r.message << std::endl;
    } else {
        std::cerr << "[FAIL] " << r.name << ": " << to_string(r.code) << " - " << r.message << std::endl;
    }
}

/// Units named by the options, in daemon, gateway, worker order.
std::vector<UnitKind> selectUnits(const Supervisor& supervisor, const UnitOptions& options) {
    if (options.unit.empty()) {
        return supervisor.kinds();
    }
    auto kind = parseUnitKind(options.unit);
    if (!kind) return {};
    return {*kind};
}

int runEach(const std::vector<UnitKind>& kinds, const std::function<UnitResult(UnitKind)>& op) {
    int exit_code = 0;
    for (auto kind : kinds) {
        auto r = op(kind);
        printResult(r);
        if (!r.ok()) exit_code = 1;
    }
    return exit_code;
}

}  // namespace

int start(const UnitOptions& options) {
    auto supervisor = makeSupervisor(loadConfig());
    auto kinds = selectUnits(*supervisor, options);
    return runEach(kinds, [&](UnitKind kind) { return supervisor->start(kind); });
}

int stop(const UnitOptions& options) {
    auto supervisor = makeSupervisor(loadConfig());
    auto kinds = selectUnits(*supervisor, options);
    // dependents first
    std::reverse(kinds.begin(), kinds.end());
    return runEach(kinds, [&](UnitKind kind) { return supervisor->stop(kind, options.force); });
}

int restart(const UnitOptions& options) {
    auto supervisor = makeSupervisor(loadConfig());
    if (options.unit.empty()) {
        int exit_code = 0;
        for (const auto& r : supervisor->restartAll()) {
            printResult(r);
            if (!r.ok()) exit_code = 1;
        }
        return exit_code;
    }
    auto kinds = selectUnits(*supervisor, options);
    return runEach(kinds, [&](UnitKind kind) { return supervisor->restart(kind); });
}

int status() {
    auto cfg = loadConfig();
    auto supervisor = makeSupervisor(cfg);

    std::cout << "=== Service Status ===" << std::endl;
    for (const auto& s : supervisor->statusAll()) {
        std::cout << (s.running() ? "[ OK ] " : "[FAIL] ") << s.name << ": " << to_string(s.state);
        if (!s.detail.empty()) std::cout << " (" << s.detail << ")";
        std::cout << std::endl;
    }

    std::cout << std::endl << "=== Configuration ===" << std::endl;
    std::cout << "Model:        " << cfg.model_identifier << std::endl;
    if (cfg.hasPortAssignment()) {
        std::cout << "Gateway port: " << cfg.gateway_port << std::endl;
    } else {
        std::cout << "Gateway port: not assigned (run: infergate setup)" << std::endl;
    }
    std::cout << "Ollama:       " << cfg.backend_host << ":" << cfg.backend_port << std::endl;
    if (!cfg.worker_dir.empty()) {
        std::cout << "Worker:       " << cfg.worker_dir << std::endl;
    }
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace infergate
