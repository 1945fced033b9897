#include "diagnostics/remediation.h"

#include <spdlog/spdlog.h>
#include <filesystem>
#include <istream>
#include <ostream>
#include <utility>
#include <vector>

#include "utils/logger.h"

namespace infergate {

namespace fs = std::filesystem;

Confirmer streamConfirmer(std::istream& in, std::ostream& out) {
    return [&in, &out](const std::string& question) {
        out << question << " (y/n): " << std::flush;
        std::string answer;
        if (!std::getline(in, answer)) return false;
        return answer == "y" || answer == "Y";
    };
}

Remediator::Remediator(std::shared_ptr<Supervisor> supervisor, GatewayConfig config, Confirmer confirm,
                       std::ostream& out)
    : supervisor_(std::move(supervisor)), config_(std::move(config)), confirm_(std::move(confirm)), out_(out) {}

bool Remediator::report(const std::vector<UnitResult>& results) {
    bool all_ok = true;
    for (const auto& r : results) {
        if (r.ok()) {
            out_ << "  [ OK ] " << r.message << "\n";
        } else {
            all_ok = false;
            out_ << "  [FAIL] " << r.name << ": " << to_string(r.code) << " - " << r.message << "\n";
        }
    }
    return all_ok;
}

bool Remediator::restartFailing() {
    std::vector<std::string> failing;
    for (const auto& s : supervisor_->statusAll()) {
        if (!s.running()) failing.push_back(s.name);
    }
    if (failing.empty()) {
        out_ << "All services are running; nothing to fix.\n";
        return true;
    }

    std::string names;
    for (const auto& n : failing) names += (names.empty() ? "" : ", ") + n;
    if (!confirm_("Restart " + names + "?")) {
        out_ << "Skipped.\n";
        return false;
    }
    return report(supervisor_->restartFailing());
}

bool Remediator::restartAll() {
    if (!confirm_("Restart all services (Ollama, gateway, worker)?")) {
        out_ << "Skipped.\n";
        return false;
    }
    out_ << "Restarting all services...\n";
    return report(supervisor_->restartAll());
}

bool Remediator::cleanLogs(size_t keep_lines) {
    std::error_code ec;
    if (!fs::is_directory(config_.log_dir, ec)) {
        out_ << "No log directory at " << config_.log_dir << "\n";
        return true;
    }
    if (!confirm_("Truncate logs in " + config_.log_dir + " to the last " + std::to_string(keep_lines) +
                  " lines?")) {
        out_ << "Skipped.\n";
        return false;
    }

    std::vector<fs::path> logs;
    for (const auto& entry : fs::directory_iterator(config_.log_dir, ec)) {
        if (!entry.is_regular_file()) continue;
        const auto ext = entry.path().extension().string();
        if (ext == ".log" || ext == ".jsonl") logs.push_back(entry.path());
    }
    if (ec) {
        out_ << "Error reading " << config_.log_dir << ": " << ec.message() << "\n";
        return false;
    }

    bool all_ok = true;
    for (const auto& path : logs) {
        if (logger::truncate_to_last_lines(path.string(), keep_lines)) {
            out_ << "  Cleaned " << path.filename().string() << "\n";
        } else {
            all_ok = false;
            out_ << "  Failed to clean " << path.filename().string() << "\n";
        }
    }
    return all_ok;
}

bool Remediator::clearModelCache() {
    std::error_code ec;
    if (config_.model_cache_dir.empty() || !fs::is_directory(config_.model_cache_dir, ec)) {
        out_ << "No model cache at " << config_.model_cache_dir << "\n";
        return true;
    }
    if (!confirm_("Clear the model cache in " + config_.model_cache_dir +
                  "? Models will have to be downloaded again")) {
        out_ << "Skipped.\n";
        return false;
    }

    std::vector<fs::path> entries;
    for (const auto& entry : fs::directory_iterator(config_.model_cache_dir, ec)) {
        entries.push_back(entry.path());
    }
    if (ec) {
        out_ << "Error reading " << config_.model_cache_dir << ": " << ec.message() << "\n";
        return false;
    }

    size_t removed = 0;
    bool all_ok = true;
    for (const auto& path : entries) {
        std::error_code rm_ec;
        fs::remove_all(path, rm_ec);
        if (rm_ec) {
            all_ok = false;
            spdlog::warn("Failed to remove {}: {}", path.string(), rm_ec.message());
        } else {
            ++removed;
        }
    }
    out_ << "Removed " << removed << " entries from the model cache.\n";
    return all_ok;
}

}  // namespace infergate
