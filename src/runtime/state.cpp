#include "runtime/state.h"

#include <spdlog/spdlog.h>
#include <cerrno>
#include <fstream>
#include <signal.h>

#include "core/gateway_error.h"
#include "utils/config.h"
#include "utils/file_lock.h"

namespace infergate {

std::atomic<bool> g_running_flag{true};

std::filesystem::path gatewayStatePath() {
    return dataDir() / "gateway.state";
}

void writeGatewayRuntimeRecord(const std::filesystem::path& path, const GatewayRuntimeRecord& record) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    FileLock lock(path, FileLock::Mode::Exclusive);
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs.is_open()) {
        throw GatewayError(ErrorCode::kInvalidConfig, "cannot write runtime record: " + path.string());
    }
    ofs << "pid=" << record.pid << "\n";
    ofs << "bound_port=" << record.bound_port << "\n";
    ofs << "model_identifier=" << record.model_identifier << "\n";
    if (!ofs) {
        throw GatewayError(ErrorCode::kInvalidConfig, "failed writing runtime record: " + path.string());
    }
}

std::optional<GatewayRuntimeRecord> readGatewayRuntimeRecord(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) return std::nullopt;
    FileLock lock(path, FileLock::Mode::Shared);
    std::ifstream ifs(path);
    if (!ifs.is_open()) return std::nullopt;
    auto kv = parseKeyValueLines(ifs);

    GatewayRuntimeRecord record;
    try {
        record.pid = static_cast<pid_t>(std::stol(kv.at("pid")));
        record.bound_port = std::stoi(kv.at("bound_port"));
    } catch (const std::exception& e) {
        spdlog::warn("Ignoring malformed runtime record {}: {}", path.string(), e.what());
        return std::nullopt;
    }
    if (auto it = kv.find("model_identifier"); it != kv.end()) {
        record.model_identifier = it->second;
    }
    return record;
}

void removeGatewayRuntimeRecord(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        spdlog::warn("Failed to remove runtime record {}: {}", path.string(), ec.message());
    }
}

bool isRecordedProcessAlive(const GatewayRuntimeRecord& record) {
    if (record.pid <= 0) return false;
    return ::kill(record.pid, 0) == 0 || errno == EPERM;
}

}  // namespace infergate
