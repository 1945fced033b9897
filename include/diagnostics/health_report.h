#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "core/gateway_error.h"
#include "supervisor/managed_unit.h"
#include "system/resource_monitor.h"

namespace infergate {

enum class CheckStatus { Pass, Warn, Fail, Skipped };

std::string to_string(CheckStatus status);

struct CheckResult {
    std::string name;
    std::string category;
    CheckStatus status{CheckStatus::Skipped};
    ErrorCode code{ErrorCode::kOk};
    std::string detail;
    /// One-line remediation shown next to anything that is not a pass.
    std::string hint;
    std::optional<std::chrono::milliseconds> latency;
};

struct BenchmarkResult {
    std::string model;
    double elapsed_seconds{0.0};
    size_t word_count{0};
    double words_per_second{0.0};
    /// Only when the backend reported eval_count and eval_duration.
    std::optional<double> tokens_per_second;
};

/// Output of a single diagnostic run. Every configured check appears in
/// `checks` exactly once, whether it passed, failed, threw or timed out.
struct HealthReport {
    std::chrono::system_clock::time_point generated_at{};
    std::optional<ResourceSnapshot> resources;
    std::vector<UnitStatus> units;
    std::optional<BenchmarkResult> benchmark;
    std::vector<CheckResult> checks;

    bool healthy() const;
    size_t count(CheckStatus status) const;
    const CheckResult* find(const std::string& name) const;

    nlohmann::json toJson() const;
};

/// Human-readable rendering with a marker per check and hints for failures.
std::string renderReport(const HealthReport& report);

}  // namespace infergate
