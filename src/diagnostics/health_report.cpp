#include "diagnostics/health_report.h"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace infergate {

namespace {

const char* marker(CheckStatus status) {
    switch (status) {
        case CheckStatus::Pass: return "[ OK ]";
        case CheckStatus::Warn: return "[WARN]";
        case CheckStatus::Fail: return "[FAIL]";
        case CheckStatus::Skipped: return "[SKIP]";
    }
    return "[????]";
}

std::string format_time(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

}  // namespace

std::string to_string(CheckStatus status) {
    switch (status) {
        case CheckStatus::Pass: return "pass";
        case CheckStatus::Warn: return "warn";
        case CheckStatus::Fail: return "fail";
        case CheckStatus::Skipped: return "skipped";
    }
    return "fail";
}

bool HealthReport::healthy() const {
    return count(CheckStatus::Fail) == 0;
}

size_t HealthReport::count(CheckStatus status) const {
    return static_cast<size_t>(std::count_if(checks.begin(), checks.end(),
                                             [status](const CheckResult& c) { return c.status == status; }));
}

const CheckResult* HealthReport::find(const std::string& name) const {
    auto it = std::find_if(checks.begin(), checks.end(), [&](const CheckResult& c) { return c.name == name; });
    return it == checks.end() ? nullptr : &*it;
}

nlohmann::json HealthReport::toJson() const {
    nlohmann::json j;
    j["generated_at"] = format_time(generated_at);
    j["healthy"] = healthy();

    if (resources) {
        nlohmann::json r = {
            {"mem_total_bytes", resources->mem_total_bytes},
            {"mem_used_bytes", resources->mem_used_bytes},
            {"mem_available_bytes", resources->mem_available_bytes},
            {"disk_usage_percent", resources->diskUsagePercent()},
            {"disk_available_bytes", resources->disk_available_bytes},
            {"load_average_1m", resources->load_average_1m},
        };
        if (resources->vram_total_bytes) {
            r["vram_total_bytes"] = *resources->vram_total_bytes;
            r["vram_used_bytes"] = resources->vram_used_bytes.value_or(0);
        }
        j["resources"] = r;
    }

    j["units"] = nlohmann::json::array();
    for (const auto& u : units) {
        j["units"].push_back({
            {"name", u.name},
            {"running", u.running()},
            {"state", to_string(u.state)},
            {"detail", u.detail}
        });
    }

    if (benchmark) {
        nlohmann::json b = {
            {"model", benchmark->model},
            {"elapsed_seconds", benchmark->elapsed_seconds},
            {"word_count", benchmark->word_count},
            {"words_per_second", benchmark->words_per_second},
        };
        if (benchmark->tokens_per_second) b["tokens_per_second"] = *benchmark->tokens_per_second;
        j["benchmark"] = b;
    }

    j["checks"] = nlohmann::json::array();
    for (const auto& c : checks) {
        nlohmann::json entry = {
            {"name", c.name},
            {"category", c.category},
            {"status", to_string(c.status)},
            {"detail", c.detail}
        };
        if (c.code != ErrorCode::kOk) entry["code"] = to_string(c.code);
        if (!c.hint.empty()) entry["hint"] = c.hint;
        if (c.latency) entry["latency_ms"] = c.latency->count();
        j["checks"].push_back(entry);
    }
    return j;
}

std::string renderReport(const HealthReport& report) {
    std::ostringstream oss;
    oss << "Diagnostics report (" << format_time(report.generated_at) << ")\n";

    std::string category;
    for (const auto& c : report.checks) {
        if (c.category != category) {
            category = c.category;
            oss << "\n== " << category << " ==\n";
        }
        oss << marker(c.status) << " " << c.name;
        if (!c.detail.empty()) oss << ": " << c.detail;
        if (c.latency) oss << " (" << c.latency->count() << " ms)";
        oss << "\n";
        if (c.status != CheckStatus::Pass && c.status != CheckStatus::Skipped && !c.hint.empty()) {
            oss << "       -> " << c.hint << "\n";
        }
    }

    if (report.benchmark) {
        const auto& b = *report.benchmark;
        oss << "\n== benchmark ==\n";
        oss << std::fixed << std::setprecision(2);
        oss << "  model:          " << b.model << "\n";
        oss << "  elapsed:        " << b.elapsed_seconds << " s\n";
        oss << "  words:          " << b.word_count << "\n";
        oss << "  words/second:   " << b.words_per_second << "\n";
        if (b.tokens_per_second) {
            oss << "  tokens/second:  " << *b.tokens_per_second << "\n";
        }
    }

    oss << "\n" << report.count(CheckStatus::Pass) << " passed, "
        << report.count(CheckStatus::Warn) << " warnings, "
        << report.count(CheckStatus::Fail) << " failed";
    if (report.count(CheckStatus::Skipped) > 0) {
        oss << ", " << report.count(CheckStatus::Skipped) << " skipped";
    }
    oss << "\n";
    return oss.str();
}

}  // namespace infergate
