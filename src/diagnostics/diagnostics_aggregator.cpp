#include "diagnostics/diagnostics_aggregator.h"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <future>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>

namespace infergate {

namespace {

using Clock = std::chrono::steady_clock;

constexpr const char* kRerunHint = "Run the check again or inspect it manually: infergate doctor";

std::chrono::milliseconds since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

CheckResult failed(const DiagnosticCheck& check, ErrorCode code, std::string detail, std::string hint) {
    CheckResult r;
    r.name = check.name;
    r.category = check.category;
    r.status = CheckStatus::Fail;
    r.code = code;
    r.detail = std::move(detail);
    r.hint = std::move(hint);
    return r;
}

ErrorCode codeForBackendError(BackendError error) {
    return error == BackendError::ConnectionError ? ErrorCode::kBackendUnreachable : ErrorCode::kBackendError;
}

std::string truncated(const std::string& text, size_t max_len) {
    if (text.size() <= max_len) return text;
    return text.substr(0, max_len) + "...";
}

CheckOutcome checkResources() {
    CheckOutcome o;
    auto snapshot = ResourceMonitor().sample();
    o.resources = snapshot;

    std::ostringstream detail;
    detail << "RAM " << formatBytes(snapshot.mem_available_bytes) << " available of "
           << formatBytes(snapshot.mem_total_bytes) << ", disk "
           << static_cast<int>(snapshot.diskUsagePercent()) << "% used ("
           << formatBytes(snapshot.disk_available_bytes) << " free), load "
           << snapshot.load_average_1m;
    if (snapshot.vram_total_bytes) {
        detail << ", VRAM " << formatBytes(snapshot.vram_used_bytes.value_or(0)) << " / "
               << formatBytes(*snapshot.vram_total_bytes);
    }

    auto warnings = assessResources(snapshot);
    o.result.status = warnings.empty() ? CheckStatus::Pass : CheckStatus::Warn;
    for (const auto& w : warnings) detail << "; " << w;
    o.result.detail = detail.str();
    if (!warnings.empty()) {
        o.result.hint = "Free up memory or disk space, or use a smaller model";
    }
    return o;
}

CheckOutcome checkUnit(Supervisor& supervisor, UnitKind kind) {
    CheckOutcome o;
    auto status = supervisor.status(kind);
    o.unit = status;
    o.result.detail = to_string(status.state) + (status.detail.empty() ? "" : " (" + status.detail + ")");
    switch (status.state) {
        case UnitState::Running:
            o.result.status = CheckStatus::Pass;
            break;
        case UnitState::Indeterminate:
            o.result.status = CheckStatus::Fail;
            o.result.code = ErrorCode::kIndeterminate;
            o.result.hint = "Wait for it to settle, then run: infergate restart";
            break;
        default:
            o.result.status = CheckStatus::Fail;
            o.result.hint = kind == UnitKind::ContainerWorker
                                ? "Check the worker project and run: infergate restart"
                                : "Run: infergate start";
            break;
    }
    return o;
}

CheckOutcome checkBackend(const GatewayConfig& config, std::chrono::milliseconds timeout) {
    CheckOutcome o;
    OllamaClient client(config.backend_host, static_cast<uint16_t>(config.backend_port));
    const auto start = Clock::now();
    auto res = client.listModels(timeout);
    o.result.latency = since(start);

    if (res.ok()) {
        const size_t models = res.data ? parseModelList(*res.data).size() : 0;
        o.result.status = CheckStatus::Pass;
        o.result.detail = "Ollama responding on " + config.backend_host + ":" +
                          std::to_string(config.backend_port) + ", " + std::to_string(models) + " model(s)";
        return o;
    }
    o.result.status = CheckStatus::Fail;
    o.result.code = codeForBackendError(res.error);
    o.result.detail = res.error_message;
    o.result.hint = "Start Ollama: infergate start";
    return o;
}

CheckOutcome checkGateway(const GatewayConfig& config, std::chrono::milliseconds timeout) {
    CheckOutcome o;
    if (!config.hasPortAssignment()) {
        o.result.status = CheckStatus::Fail;
        o.result.code = ErrorCode::kInvalidConfig;
        o.result.detail = "no gateway port assigned";
        o.result.hint = "Run: infergate setup";
        return o;
    }

    httplib::Client client("127.0.0.1", config.gateway_port);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    const auto start = Clock::now();
    auto res = client.Get("/health");
    o.result.latency = since(start);

    if (!res) {
        o.result.status = CheckStatus::Fail;
        o.result.code = ErrorCode::kBackendUnreachable;
        o.result.detail = "gateway not reachable on port " + std::to_string(config.gateway_port) + ": " +
                          httplib::to_string(res.error());
        o.result.hint = "Run: infergate start";
        return o;
    }
    if (res->status == 200) {
        o.result.status = CheckStatus::Pass;
        o.result.detail = "gateway healthy on port " + std::to_string(config.gateway_port);
        return o;
    }
    o.result.status = CheckStatus::Fail;
    o.result.code = ErrorCode::kBackendError;
    o.result.detail = "gateway /health returned " + std::to_string(res->status);
    o.result.hint = res->status == 503 ? "Gateway is up but cannot reach Ollama: infergate start"
                                       : "Check the gateway log: infergate logs";
    return o;
}

CheckOutcome checkInference(const GatewayConfig& config, const std::string& prompt,
                            std::chrono::milliseconds timeout) {
    CheckOutcome o;
    if (!config.hasPortAssignment()) {
        o.result.status = CheckStatus::Skipped;
        o.result.detail = "no gateway port assigned";
        return o;
    }

    httplib::Client client("127.0.0.1", config.gateway_port);
    client.set_connection_timeout(std::chrono::seconds(3));
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);

    nlohmann::json body = {{"prompt", prompt}};
    const auto start = Clock::now();
    auto res = client.Post("/", body.dump(), "application/json");
    o.result.latency = since(start);

    if (!res) {
        o.result.status = CheckStatus::Fail;
        o.result.code = ErrorCode::kBackendUnreachable;
        o.result.detail = "request failed: " + httplib::to_string(res.error());
        o.result.hint = "Run: infergate start";
        return o;
    }
    auto json = nlohmann::json::parse(res->body, nullptr, false);
    if (res->status != 200 || json.is_discarded() || !json.contains("response")) {
        o.result.status = CheckStatus::Fail;
        o.result.code = ErrorCode::kBackendError;
        o.result.detail = "gateway returned " + std::to_string(res->status) + ": " + truncated(res->body, 120);
        o.result.hint = "Make sure the model is installed: infergate pull " + config.model_identifier;
        return o;
    }
    o.result.status = CheckStatus::Pass;
    o.result.detail = "\"" + truncated(json["response"].is_string() ? json["response"].get<std::string>() : "", 60) + "\"";
    return o;
}

CheckOutcome checkBenchmark(const GatewayConfig& config, const DiagnosticsOptions& options) {
    CheckOutcome o;
    if (!options.run_benchmark) {
        o.result.status = CheckStatus::Skipped;
        o.result.detail = "not requested (use --benchmark)";
        return o;
    }

    OllamaClient client(config.backend_host, static_cast<uint16_t>(config.backend_port));
    const auto start = Clock::now();
    auto res = client.generate(config.model_identifier, options.benchmark_prompt, options.benchmark_timeout);
    const std::chrono::duration<double> elapsed = Clock::now() - start;

    if (!res.ok()) {
        o.result.status = CheckStatus::Fail;
        o.result.code = ErrorCode::kBenchmarkFailed;
        o.result.detail = res.error_message;
        o.result.hint = "Check that " + config.model_identifier + " is installed: infergate models";
        return o;
    }

    auto bench = computeBenchmark(config.model_identifier, *res.data, elapsed);
    std::ostringstream detail;
    detail.precision(2);
    detail << std::fixed << bench.words_per_second << " words/s";
    if (bench.tokens_per_second) detail << ", " << *bench.tokens_per_second << " tokens/s";
    o.result.status = CheckStatus::Pass;
    o.result.detail = detail.str();
    o.result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed);
    o.benchmark = bench;
    return o;
}

}  // namespace

DiagnosticsAggregator::DiagnosticsAggregator(std::chrono::milliseconds check_deadline)
    : check_deadline_(check_deadline) {}

void DiagnosticsAggregator::addCheck(DiagnosticCheck check) {
    checks_.push_back(std::move(check));
}

HealthReport DiagnosticsAggregator::run() const {
    HealthReport report;
    report.generated_at = std::chrono::system_clock::now();

    // packaged_task futures do not block on destruction, so a hung check
    // cannot hold the report hostage
    std::vector<std::future<CheckOutcome>> futures;
    std::vector<std::string> launch_errors(checks_.size());
    futures.reserve(checks_.size());
    for (size_t i = 0; i < checks_.size(); ++i) {
        auto task = std::make_shared<std::packaged_task<CheckOutcome()>>(checks_[i].run);
        futures.push_back(task->get_future());
        try {
            std::thread([task]() { (*task)(); }).detach();
        } catch (const std::system_error& e) {
            launch_errors[i] = e.what();
        }
    }

    const auto deadline = Clock::now() + check_deadline_;
    for (size_t i = 0; i < checks_.size(); ++i) {
        const auto& check = checks_[i];
        if (!launch_errors[i].empty()) {
            report.checks.push_back(
                failed(check, ErrorCode::kCheckFailed, "could not run: " + launch_errors[i], kRerunHint));
            continue;
        }
        if (futures[i].wait_until(deadline) != std::future_status::ready) {
            spdlog::warn("Diagnostic check {} timed out", check.name);
            report.checks.push_back(failed(check, ErrorCode::kIndeterminate,
                                           "timed out after " + std::to_string(check_deadline_.count()) + " ms",
                                           kRerunHint));
            continue;
        }

        CheckOutcome outcome;
        try {
            outcome = futures[i].get();
        } catch (const std::exception& e) {
            spdlog::warn("Diagnostic check {} threw: {}", check.name, e.what());
            report.checks.push_back(
                failed(check, ErrorCode::kCheckFailed, std::string("check raised: ") + e.what(), kRerunHint));
            continue;
        } catch (...) {
            report.checks.push_back(
                failed(check, ErrorCode::kCheckFailed, "check raised a non-standard exception", kRerunHint));
            continue;
        }

        outcome.result.name = check.name;
        outcome.result.category = check.category;
        if (outcome.resources) report.resources = std::move(outcome.resources);
        if (outcome.unit) report.units.push_back(std::move(*outcome.unit));
        if (outcome.benchmark) report.benchmark = std::move(outcome.benchmark);
        report.checks.push_back(std::move(outcome.result));
    }
    return report;
}

CheckResult checkConfigDrift(const GatewayConfig& config,
                             const std::optional<GatewayRuntimeRecord>& record,
                             bool process_alive) {
    CheckResult r;
    r.name = "config_drift";
    r.category = "configuration";

    if (!config.hasPortAssignment()) {
        r.status = CheckStatus::Warn;
        r.code = ErrorCode::kInvalidConfig;
        r.detail = "no gateway port assigned";
        r.hint = "Run: infergate setup";
        return r;
    }
    if (!record) {
        r.status = CheckStatus::Skipped;
        r.detail = "gateway not running; configured port " + std::to_string(config.gateway_port);
        return r;
    }
    if (!process_alive) {
        r.status = CheckStatus::Warn;
        r.detail = "stale runtime record for pid " + std::to_string(record->pid);
        r.hint = "Start the gateway (infergate start) to refresh it";
        return r;
    }
    if (record->bound_port != config.gateway_port) {
        r.status = CheckStatus::Fail;
        r.code = ErrorCode::kConfigDrift;
        r.detail = "gateway bound to port " + std::to_string(record->bound_port) +
                   " but configuration assigns " + std::to_string(config.gateway_port);
        r.hint = "Free port " + std::to_string(config.gateway_port) +
                 " and run: infergate restart (or infergate setup --force)";
        return r;
    }
    if (!record->model_identifier.empty() && record->model_identifier != config.model_identifier) {
        r.status = CheckStatus::Fail;
        r.code = ErrorCode::kConfigDrift;
        r.detail = "gateway serves " + record->model_identifier + " but configuration names " +
                   config.model_identifier;
        r.hint = "Restart the gateway to pick up the configured model: infergate restart";
        return r;
    }
    r.status = CheckStatus::Pass;
    r.detail = "gateway bound to configured port " + std::to_string(config.gateway_port);
    return r;
}

BenchmarkResult computeBenchmark(const std::string& model, const GenerateResult& generation,
                                 std::chrono::duration<double> elapsed) {
    BenchmarkResult b;
    b.model = model;
    b.elapsed_seconds = elapsed.count();

    std::istringstream iss(generation.response);
    std::string word;
    while (iss >> word) ++b.word_count;
    if (b.elapsed_seconds > 0.0) {
        b.words_per_second = static_cast<double>(b.word_count) / b.elapsed_seconds;
    }

    if (generation.eval_count && generation.eval_duration_ns && *generation.eval_duration_ns > 0) {
        b.tokens_per_second = static_cast<double>(*generation.eval_count) /
                              (static_cast<double>(*generation.eval_duration_ns) / 1e9);
    }
    return b;
}

DiagnosticsAggregator buildStandardDiagnostics(const GatewayConfig& config,
                                               std::shared_ptr<Supervisor> supervisor,
                                               const DiagnosticsOptions& options) {
    DiagnosticsAggregator aggregator(options.check_deadline);

    aggregator.addCheck({"resources", "system", []() { return checkResources(); }});

    if (supervisor) {
        for (auto kind : supervisor->kinds()) {
            aggregator.addCheck({"unit:" + supervisor->unit(kind)->name(), "services",
                                 [supervisor, kind]() { return checkUnit(*supervisor, kind); }});
        }
    }

    aggregator.addCheck({"backend", "connectivity",
                         [config, options]() { return checkBackend(config, options.backend_timeout); }});
    aggregator.addCheck({"gateway", "connectivity",
                         [config, options]() { return checkGateway(config, options.gateway_timeout); }});
    aggregator.addCheck({"inference", "connectivity", [config, options]() {
                             return checkInference(config, options.inference_prompt, options.inference_timeout);
                         }});
    aggregator.addCheck({"config_drift", "configuration", [config]() {
                             CheckOutcome o;
                             auto record = readGatewayRuntimeRecord(gatewayStatePath());
                             o.result = checkConfigDrift(config, record, record && isRecordedProcessAlive(*record));
                             return o;
                         }});
    aggregator.addCheck({"benchmark", "performance",
                         [config, options]() { return checkBenchmark(config, options); }});
    return aggregator;
}

}  // namespace infergate
