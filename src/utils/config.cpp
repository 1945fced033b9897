#include "utils/config.h"
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "core/gateway_error.h"
#include "utils/file_lock.h"

namespace infergate {

namespace {

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::optional<int> parsePort(const std::string& text) {
    try {
        size_t pos = 0;
        int v = std::stoi(text, &pos);
        if (pos != text.size() || v < 1 || v > 65535) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string homeDir() {
    return getEnvValue("HOME").value_or("/tmp");
}

/// Look up a key, falling back to a deprecated name written by older installers.
std::optional<std::string> lookupWithFallback(const std::map<std::string, std::string>& kv,
                                              const std::string& key,
                                              const std::string& legacy_key) {
    if (auto it = kv.find(key); it != kv.end()) return it->second;
    if (auto it = kv.find(legacy_key); it != kv.end()) {
        spdlog::warn("Config key '{}' is deprecated, use '{}' instead", legacy_key, key);
        return it->second;
    }
    return std::nullopt;
}

void applyPort(const std::string& key, const std::string& value, int& target, std::ostringstream& log) {
    if (auto port = parsePort(value)) {
        target = *port;
    } else {
        spdlog::warn("Ignoring invalid {} value '{}'", key, value);
        log << "invalid:" << key << " ";
    }
}

void applyKeyValues(GatewayConfig& cfg, const std::map<std::string, std::string>& kv, std::ostringstream& log) {
    if (auto v = lookupWithFallback(kv, "model_identifier", "MODEL_NAME")) {
        cfg.model_identifier = *v;
    }
    if (auto v = lookupWithFallback(kv, "gateway_port", "OLLAMA_PORT")) {
        applyPort("gateway_port", *v, cfg.gateway_port, log);
    }
    if (auto it = kv.find("bind_address"); it != kv.end()) cfg.bind_address = it->second;
    if (auto it = kv.find("backend_host"); it != kv.end()) cfg.backend_host = it->second;
    if (auto it = kv.find("backend_port"); it != kv.end()) {
        applyPort("backend_port", it->second, cfg.backend_port, log);
    }
    if (auto it = kv.find("port_range_low"); it != kv.end()) {
        applyPort("port_range_low", it->second, cfg.port_range_low, log);
    }
    if (auto it = kv.find("port_range_high"); it != kv.end()) {
        applyPort("port_range_high", it->second, cfg.port_range_high, log);
    }
    if (auto it = kv.find("worker_dir"); it != kv.end()) cfg.worker_dir = it->second;
    if (auto it = kv.find("compose_command"); it != kv.end()) cfg.compose_command = it->second;
    if (auto it = kv.find("daemon_unit"); it != kv.end()) cfg.daemon_unit = it->second;
    if (auto it = kv.find("daemon_command"); it != kv.end()) cfg.daemon_command = it->second;
    if (auto it = kv.find("log_dir"); it != kv.end()) cfg.log_dir = it->second;
    if (auto it = kv.find("model_cache_dir"); it != kv.end()) cfg.model_cache_dir = it->second;
}

bool readKeyValuesWithLock(const std::filesystem::path& path, std::map<std::string, std::string>& out) {
    if (!std::filesystem::exists(path)) return false;
    FileLock lock(path, FileLock::Mode::Shared);
    std::ifstream ifs(path);
    if (!ifs.is_open()) return false;
    out = parseKeyValueLines(ifs);
    return true;
}

}  // namespace

std::filesystem::path dataDir() {
    return std::filesystem::path(homeDir()) / ".infergate";
}

std::filesystem::path configPath() {
    if (auto env = getEnvValue("INFERGATE_CONFIG")) {
        return *env;
    }
    return dataDir() / "config";
}

std::map<std::string, std::string> parseKeyValueLines(std::istream& in) {
    std::map<std::string, std::string> kv;
    std::string line;
    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        auto eq = t.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        std::string key = trim(t.substr(0, eq));
        std::string value = trim(t.substr(eq + 1));
        // shell consumers may quote values
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        kv[key] = value;
    }
    return kv;
}

std::pair<GatewayConfig, std::string> loadGatewayConfigWithLog(const std::filesystem::path& path) {
    GatewayConfig cfg;
    cfg.log_dir = (dataDir() / "logs").string();
    cfg.model_cache_dir = (std::filesystem::path(homeDir()) / ".ollama" / "models").string();
    std::ostringstream log;
    bool used_env = false;
    bool used_file = false;

    if (!path.empty()) {
        std::map<std::string, std::string> kv;
        if (readKeyValuesWithLock(path, kv)) {
            applyKeyValues(cfg, kv, log);
            log << "file=" << path << " ";
            used_file = true;
        }
    }

    if (auto v = getEnvValue("INFERGATE_MODEL")) {
        cfg.model_identifier = *v;
        log << "env:MODEL=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("INFERGATE_PORT")) {
        if (auto port = parsePort(*v)) {
            cfg.gateway_port = *port;
            log << "env:PORT=" << *port << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("INFERGATE_BACKEND_HOST")) {
        cfg.backend_host = *v;
        log << "env:BACKEND_HOST=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("INFERGATE_BACKEND_PORT")) {
        if (auto port = parsePort(*v)) {
            cfg.backend_port = *port;
            log << "env:BACKEND_PORT=" << *port << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("INFERGATE_WORKER_DIR")) {
        cfg.worker_dir = *v;
        log << "env:WORKER_DIR=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("INFERGATE_LOG_DIR")) {
        cfg.log_dir = *v;
        log << "env:LOG_DIR=" << *v << " ";
        used_env = true;
    }

    if (cfg.port_range_low > cfg.port_range_high) {
        spdlog::warn("Port range {}-{} is inverted, using defaults", cfg.port_range_low, cfg.port_range_high);
        cfg.port_range_low = 11000;
        cfg.port_range_high = 12000;
    }

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

std::pair<GatewayConfig, std::string> loadGatewayConfigWithLog() {
    return loadGatewayConfigWithLog(configPath());
}

GatewayConfig loadGatewayConfig() {
    auto info = loadGatewayConfigWithLog();
    return info.first;
}

std::optional<PortAssignment> readPortAssignment(const std::filesystem::path& path) {
    std::map<std::string, std::string> kv;
    if (path.empty() || !readKeyValuesWithLock(path, kv)) return std::nullopt;
    GatewayConfig cfg;
    std::ostringstream ignored;
    applyKeyValues(cfg, kv, ignored);
    if (!cfg.hasPortAssignment()) return std::nullopt;
    return cfg.portAssignment();
}

void savePortAssignment(const std::filesystem::path& path, const PortAssignment& assignment) {
    if (assignment.port < 1 || assignment.port > 65535) {
        throw GatewayError(ErrorCode::kInvalidConfig,
                           "gateway port out of range: " + std::to_string(assignment.port));
    }
    if (assignment.model_identifier.empty()) {
        throw GatewayError(ErrorCode::kInvalidConfig, "model identifier must not be empty");
    }
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    FileLock lock(path, FileLock::Mode::Exclusive);
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs.is_open()) {
        throw GatewayError(ErrorCode::kInvalidConfig, "cannot write config file: " + path.string());
    }
    ofs << "# written by infergate setup\n";
    ofs << "model_identifier=" << assignment.model_identifier << "\n";
    ofs << "gateway_port=" << assignment.port << "\n";
    if (!ofs) {
        throw GatewayError(ErrorCode::kInvalidConfig, "failed writing config file: " + path.string());
    }
    spdlog::info("Saved port assignment port={} model={} to {}", assignment.port,
                 assignment.model_identifier, path.string());
}

void appendConfigValue(const std::filesystem::path& path, const std::string& key, const std::string& value) {
    if (key.empty() || key.find('=') != std::string::npos || value.find('\n') != std::string::npos) {
        throw GatewayError(ErrorCode::kInvalidConfig, "invalid config entry: " + key);
    }
    FileLock lock(path, FileLock::Mode::Exclusive);
    std::ofstream ofs(path, std::ios::app);
    if (!ofs.is_open()) {
        throw GatewayError(ErrorCode::kInvalidConfig, "cannot append to config file: " + path.string());
    }
    ofs << key << "=" << value << "\n";
}

}  // namespace infergate
