#pragma once

#include <filesystem>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace infergate {

/// Gateway port and model bound at initial setup.
struct PortAssignment {
    int port{0};
    std::string model_identifier;
};

struct GatewayConfig {
    std::string model_identifier{"llama3.2:1b"};
    int gateway_port{0};  // 0 = no port assigned yet
    std::string bind_address{"0.0.0.0"};
    std::string backend_host{"127.0.0.1"};
    int backend_port{11434};
    int port_range_low{11000};
    int port_range_high{12000};
    std::string worker_dir;  // compose project of the container worker (empty = not installed)
    std::string compose_command{"docker compose"};
    std::string daemon_unit{"ollama"};
    std::string daemon_command{"ollama serve"};
    std::string log_dir;
    std::string model_cache_dir;

    bool hasPortAssignment() const { return gateway_port > 0; }
    PortAssignment portAssignment() const { return {gateway_port, model_identifier}; }
};

/// ~/.infergate
std::filesystem::path dataDir();

/// INFERGATE_CONFIG or ~/.infergate/config
std::filesystem::path configPath();

/// Parse `key=value` lines. Blank lines and `#` comments are skipped,
/// surrounding whitespace is trimmed and the last occurrence of a key wins.
std::map<std::string, std::string> parseKeyValueLines(std::istream& in);

GatewayConfig loadGatewayConfig();
std::pair<GatewayConfig, std::string> loadGatewayConfigWithLog();
std::pair<GatewayConfig, std::string> loadGatewayConfigWithLog(const std::filesystem::path& path);

/// The assignment as persisted in the file, ignoring environment overrides.
/// std::nullopt when the file is missing or holds no valid gateway port.
std::optional<PortAssignment> readPortAssignment(const std::filesystem::path& path);

/// Write a fresh configuration holding the assignment. Throws GatewayError(kInvalidConfig)
/// when the port is out of range or the file cannot be written.
void savePortAssignment(const std::filesystem::path& path, const PortAssignment& assignment);

/// Append one `key=value` line (later reconfiguration steps).
void appendConfigValue(const std::filesystem::path& path, const std::string& key, const std::string& value);

}  // namespace infergate
