#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "backend/ollama_client.h"
#include "diagnostics/health_report.h"
#include "runtime/state.h"
#include "supervisor/supervisor.h"
#include "utils/config.h"

namespace infergate {

/// What a single check produced. Besides its CheckResult a check may
/// contribute a section of the report.
struct CheckOutcome {
    CheckResult result;
    std::optional<ResourceSnapshot> resources;
    std::optional<UnitStatus> unit;
    std::optional<BenchmarkResult> benchmark;
};

struct DiagnosticCheck {
    std::string name;
    std::string category;
    std::function<CheckOutcome()> run;
};

struct DiagnosticsOptions {
    bool run_benchmark{false};
    std::chrono::milliseconds backend_timeout{std::chrono::seconds(5)};
    std::chrono::milliseconds gateway_timeout{std::chrono::seconds(5)};
    std::chrono::milliseconds inference_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds benchmark_timeout{std::chrono::seconds(60)};
    /// Upper bound on how long any one check may run before it is reported
    /// as timed out.
    std::chrono::milliseconds check_deadline{std::chrono::seconds(90)};
    std::string benchmark_prompt{"Write a short poem about artificial intelligence"};
    std::string inference_prompt{"Hello"};
};

/// Runs independent checks in parallel and assembles one report. A check
/// that throws or exceeds the deadline becomes a failed entry; the others
/// are still reported. Checks that time out keep running on their own
/// thread, so they must own everything they touch.
class DiagnosticsAggregator {
public:
    explicit DiagnosticsAggregator(std::chrono::milliseconds check_deadline = std::chrono::seconds(90));

    void addCheck(DiagnosticCheck check);
    const std::vector<DiagnosticCheck>& checks() const { return checks_; }

    HealthReport run() const;

private:
    std::vector<DiagnosticCheck> checks_;
    std::chrono::milliseconds check_deadline_;
};

/// Compare the gateway's runtime record with the persisted assignment.
/// A mismatch is reported as ConfigDrift and never corrected.
CheckResult checkConfigDrift(const GatewayConfig& config,
                             const std::optional<GatewayRuntimeRecord>& record,
                             bool process_alive);

/// Throughput figures for one generation that took `elapsed`.
BenchmarkResult computeBenchmark(const std::string& model, const GenerateResult& generation,
                                 std::chrono::duration<double> elapsed);

/// The full check set: resources, one status per unit, backend, gateway,
/// end-to-end inference, configuration drift and the benchmark (skipped
/// unless requested).
DiagnosticsAggregator buildStandardDiagnostics(const GatewayConfig& config,
                                               std::shared_ptr<Supervisor> supervisor,
                                               const DiagnosticsOptions& options);

}  // namespace infergate
