#include <gtest/gtest.h>
#include <functional>
#include <string>
#include <vector>

#include "supervisor/container_runtime.h"
#include "supervisor/managed_unit.h"
#include "supervisor/unit_detector.h"

using namespace infergate;

namespace {

std::string join(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out += " ";
        out += a;
    }
    return out;
}

// Answers commands through a lambda and records every invocation.
class ScriptedRunner : public CommandRunner {
public:
    explicit ScriptedRunner(std::function<CommandResult(const std::string&)> script)
        : script_(std::move(script)) {}

    CommandResult run(const std::vector<std::string>& args) override {
        calls.push_back(join(args));
        return script_(calls.back());
    }

    bool spawnDetached(const std::vector<std::string>& args, const std::string&, std::string& error) override {
        calls.push_back("spawn " + join(args));
        if (!spawn_ok) error = "exec failed";
        return spawn_ok;
    }

    std::vector<std::string> calls;
    bool spawn_ok{true};

private:
    std::function<CommandResult(const std::string&)> script_;
};

}  // namespace

TEST(UnitDetectorTest, InitSystemMapsActiveStates) {
    std::string answer;
    int code = 0;
    ScriptedRunner runner([&](const std::string&) { return CommandResult{code, answer + "\n"}; });
    InitSystemDetector detector(runner, "ollama");

    answer = "active";
    EXPECT_EQ(detector.detect().state, Detection::Running);
    answer = "activating";
    code = 3;
    EXPECT_EQ(detector.detect().state, Detection::Transitional);
    answer = "inactive";
    EXPECT_EQ(detector.detect().state, Detection::NotRunning);
    answer = "failed";
    EXPECT_EQ(detector.detect().state, Detection::NotRunning);
    EXPECT_EQ(runner.calls.front(), "systemctl is-active ollama");
}

TEST(UnitDetectorTest, InitSystemUnavailableWhenSystemctlMissing) {
    ScriptedRunner runner([](const std::string&) { return CommandResult{127, "exec failed"}; });
    InitSystemDetector detector(runner, "ollama");
    EXPECT_EQ(detector.detect().state, Detection::Unavailable);
}

TEST(UnitDetectorTest, ProcessPatternUsesPgrepExitCode) {
    int code = 0;
    ScriptedRunner runner([&](const std::string&) { return CommandResult{code, "4242\n"}; });
    ProcessPatternDetector detector(runner, "ollama serve");

    auto running = detector.detect();
    EXPECT_EQ(running.state, Detection::Running);
    EXPECT_NE(running.detail.find("4242"), std::string::npos);
    code = 1;
    EXPECT_EQ(detector.detect().state, Detection::NotRunning);
    code = 2;
    EXPECT_EQ(detector.detect().state, Detection::Unavailable);
    EXPECT_EQ(runner.calls.front(), "pgrep -f ollama serve");
}

TEST(UnitDetectorTest, ContainerClassifiesServiceCounts) {
    EXPECT_EQ(ContainerDetector::classify({3, 3}).state, Detection::Running);
    EXPECT_EQ(ContainerDetector::classify({0, 3}).state, Detection::NotRunning);
    EXPECT_EQ(ContainerDetector::classify({1, 3}).state, Detection::Transitional);
    EXPECT_EQ(ContainerDetector::classify({2, 3}).detail, "2 of 3 running");
}

TEST(UnitDetectorTest, EmptyComposeProjectIsNotRunning) {
    auto result = ContainerDetector::classify({0, 0});
    EXPECT_EQ(result.state, Detection::NotRunning);
    EXPECT_EQ(combineDetections({result}), UnitState::Stopped);
}

TEST(UnitDetectorTest, CombinePrefersRunningThenTransitional) {
    DetectResult running{Detection::Running, ""};
    DetectResult stopped{Detection::NotRunning, ""};
    DetectResult partial{Detection::Transitional, ""};
    DetectResult unavailable{Detection::Unavailable, ""};

    EXPECT_EQ(combineDetections({stopped, running}), UnitState::Running);
    EXPECT_EQ(combineDetections({stopped, partial}), UnitState::Indeterminate);
    EXPECT_EQ(combineDetections({unavailable, stopped}), UnitState::Stopped);
    EXPECT_EQ(combineDetections({unavailable}), UnitState::Unknown);
    EXPECT_EQ(combineDetections({}), UnitState::Unknown);
}

TEST(ComposeRuntimeTest, CountsRunningAgainstAllServices) {
    ScriptedRunner runner([](const std::string& cmd) {
        if (cmd.find("status=running") != std::string::npos) return CommandResult{0, "api\n"};
        return CommandResult{0, "api\nworker\n\n"};
    });
    ComposeRuntime runtime(runner, "docker compose", "/srv/worker");

    auto counts = runtime.counts();
    ASSERT_TRUE(counts.has_value());
    EXPECT_EQ(counts->running, 1u);
    EXPECT_EQ(counts->total, 2u);
    EXPECT_EQ(runner.calls[0], "docker compose --project-directory /srv/worker ps --services --all");
    EXPECT_EQ(runner.calls[1],
              "docker compose --project-directory /srv/worker ps --services --filter status=running");
}

TEST(ComposeRuntimeTest, QueryFailureYieldsNoCounts) {
    ScriptedRunner runner([](const std::string&) { return CommandResult{1, "no configuration file"}; });
    ComposeRuntime runtime(runner, "", "/srv/worker");
    EXPECT_FALSE(runtime.counts().has_value());
    EXPECT_EQ(runner.calls[0].rfind("docker compose ", 0), 0u);
}

TEST(ProcessUnitTest, InitSystemAnswerShortCircuitsPatternDetection) {
    ScriptedRunner runner([](const std::string& cmd) {
        if (cmd.rfind("systemctl", 0) == 0) return CommandResult{0, "active\n"};
        return CommandResult{1, ""};
    });
    ProcessUnitConfig cfg;
    cfg.name = "ollama";
    cfg.init_unit = "ollama";
    cfg.process_pattern = "ollama serve";
    ProcessUnit unit(runner, cfg);

    auto status = unit.status();
    EXPECT_EQ(status.state, UnitState::Running);
    ASSERT_EQ(runner.calls.size(), 1u);
}

TEST(ProcessUnitTest, FallsBackToProcessTableWithoutInitSystem) {
    ScriptedRunner runner([](const std::string& cmd) {
        if (cmd.rfind("systemctl", 0) == 0) return CommandResult{127, ""};
        return CommandResult{0, "99\n"};
    });
    ProcessUnitConfig cfg;
    cfg.name = "ollama";
    cfg.init_unit = "ollama";
    cfg.process_pattern = "ollama serve";
    ProcessUnit unit(runner, cfg);

    EXPECT_EQ(unit.status().state, UnitState::Running);
    EXPECT_EQ(runner.calls.back(), "pgrep -f ollama serve");
}

TEST(ProcessUnitTest, LaunchSpawnsWhenInitSystemStartFails) {
    ScriptedRunner runner([](const std::string&) { return CommandResult{1, "Unit not found"}; });
    ProcessUnitConfig cfg;
    cfg.name = "ollama";
    cfg.init_unit = "ollama";
    cfg.process_pattern = "ollama serve";
    cfg.launch_command = {"ollama", "serve"};
    cfg.log_path = "/tmp/ollama.log";
    ProcessUnit unit(runner, cfg);

    auto action = unit.launch();
    EXPECT_TRUE(action.ok);
    EXPECT_EQ(runner.calls[0], "systemctl start ollama");
    EXPECT_EQ(runner.calls[1], "spawn ollama serve");
}

TEST(ProcessUnitTest, LaunchReportsSpawnFailure) {
    ScriptedRunner runner([](const std::string&) { return CommandResult{1, ""}; });
    runner.spawn_ok = false;
    ProcessUnitConfig cfg;
    cfg.kind = UnitKind::Gateway;
    cfg.name = "gateway";
    cfg.process_pattern = "infergate serve";
    cfg.launch_command = {"/nonexistent/infergate", "serve"};
    ProcessUnit unit(runner, cfg);

    auto action = unit.launch();
    EXPECT_FALSE(action.ok);
    EXPECT_EQ(action.detail, "exec failed");
}

TEST(ProcessUnitTest, TerminateSignalsMatchingProcesses) {
    ScriptedRunner runner([](const std::string&) { return CommandResult{1, ""}; });
    ProcessUnitConfig cfg;
    cfg.kind = UnitKind::Gateway;
    cfg.name = "gateway";
    cfg.process_pattern = "infergate serve";
    ProcessUnit unit(runner, cfg);

    EXPECT_TRUE(unit.terminate(StopSignal::Graceful).ok);
    EXPECT_EQ(runner.calls.back(), "pkill -TERM -f infergate serve");
    EXPECT_TRUE(unit.terminate(StopSignal::Kill).ok);
    EXPECT_EQ(runner.calls.back(), "pkill -KILL -f infergate serve");
}

TEST(ContainerUnitTest, PartialServicesAreIndeterminate) {
    ScriptedRunner runner([](const std::string& cmd) {
        if (cmd.find("status=running") != std::string::npos) return CommandResult{0, "api\n"};
        return CommandResult{0, "api\nworker\n"};
    });
    ContainerUnit unit(runner, "worker", "docker compose", "/srv/worker", "/tmp/worker.log");

    auto status = unit.status();
    EXPECT_EQ(status.state, UnitState::Indeterminate);
    EXPECT_EQ(status.detail, "1 of 2 running");
    EXPECT_TRUE(unit.hasNativeRestart());
}
