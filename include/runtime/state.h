#pragma once

#include <atomic>
#include <filesystem>
#include <optional>
#include <string>
#include <sys/types.h>

namespace infergate {

extern std::atomic<bool> g_running_flag;

inline bool is_running() { return g_running_flag.load(); }
inline void request_shutdown() { g_running_flag.store(false); }

/// What a serving gateway records about itself after binding.
struct GatewayRuntimeRecord {
    pid_t pid{0};
    int bound_port{0};
    std::string model_identifier;
};

/// ~/.infergate/gateway.state
std::filesystem::path gatewayStatePath();

/// Throws GatewayError(kInvalidConfig) when the record cannot be written.
void writeGatewayRuntimeRecord(const std::filesystem::path& path, const GatewayRuntimeRecord& record);

/// std::nullopt when the file is missing or incomplete.
std::optional<GatewayRuntimeRecord> readGatewayRuntimeRecord(const std::filesystem::path& path);

void removeGatewayRuntimeRecord(const std::filesystem::path& path);

/// True when the recorded process still exists.
bool isRecordedProcessAlive(const GatewayRuntimeRecord& record);

}  // namespace infergate
