#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <sstream>
#include <unordered_map>
#include <unistd.h>

#include "core/gateway_error.h"
#include "utils/config.h"

using namespace infergate;
namespace fs = std::filesystem;

class EnvGuard {
public:
    EnvGuard(const std::vector<std::string>& keys) : keys_(keys) {
        for (const auto& k : keys_) {
            const char* v = std::getenv(k.c_str());
            if (v) saved_[k] = v;
            unsetenv(k.c_str());
        }
    }
    ~EnvGuard() {
        for (const auto& k : keys_) {
            if (auto it = saved_.find(k); it != saved_.end()) {
                setenv(k.c_str(), it->second.c_str(), 1);
            } else {
                unsetenv(k.c_str());
            }
        }
    }
private:
    std::vector<std::string> keys_;
    std::unordered_map<std::string, std::string> saved_;
};

namespace {

const std::vector<std::string> kConfigEnv = {"INFERGATE_CONFIG", "INFERGATE_MODEL", "INFERGATE_PORT",
                                             "INFERGATE_BACKEND_HOST", "INFERGATE_BACKEND_PORT",
                                             "INFERGATE_WORKER_DIR", "INFERGATE_LOG_DIR"};

fs::path tempConfig(const std::string& name) {
    auto path = fs::temp_directory_path() / ("infergate-" + name + "-" + std::to_string(::getpid()));
    fs::remove(path);
    return path;
}

}  // namespace

TEST(UtilsConfigTest, ParsesKeyValueLines) {
    std::istringstream in(
        "# comment\n"
        "\n"
        "  model_identifier = llama3.2:1b  \n"
        "gateway_port=11001\n"
        "quoted=\"with spaces\"\n"
        "novalue\n"
        "gateway_port=11002\n");
    auto kv = parseKeyValueLines(in);
    EXPECT_EQ(kv["model_identifier"], "llama3.2:1b");
    EXPECT_EQ(kv["gateway_port"], "11002");
    EXPECT_EQ(kv["quoted"], "with spaces");
    EXPECT_EQ(kv.count("novalue"), 0u);
}

TEST(UtilsConfigTest, DefaultsWithoutFile) {
    EnvGuard guard(kConfigEnv);
    auto [cfg, log] = loadGatewayConfigWithLog(tempConfig("missing"));
    EXPECT_EQ(cfg.model_identifier, "llama3.2:1b");
    EXPECT_FALSE(cfg.hasPortAssignment());
    EXPECT_EQ(cfg.backend_port, 11434);
    EXPECT_EQ(cfg.port_range_low, 11000);
    EXPECT_EQ(cfg.port_range_high, 12000);
    EXPECT_NE(log.find("sources=default"), std::string::npos);
}

TEST(UtilsConfigTest, LoadsFileWithLegacyKeys) {
    EnvGuard guard(kConfigEnv);
    auto path = tempConfig("legacy");
    std::ofstream(path) << "MODEL_NAME=phi3:mini\nOLLAMA_PORT=11077\nworker_dir=/srv/worker\n";

    auto [cfg, log] = loadGatewayConfigWithLog(path);
    EXPECT_EQ(cfg.model_identifier, "phi3:mini");
    EXPECT_EQ(cfg.gateway_port, 11077);
    EXPECT_EQ(cfg.worker_dir, "/srv/worker");
    EXPECT_NE(log.find("file="), std::string::npos);
    fs::remove(path);
}

TEST(UtilsConfigTest, EnvOverridesFile) {
    EnvGuard guard(kConfigEnv);
    auto path = tempConfig("env");
    std::ofstream(path) << "model_identifier=a\ngateway_port=11010\n";
    setenv("INFERGATE_MODEL", "b", 1);
    setenv("INFERGATE_LOG_DIR", "/tmp/infergate-test-logs", 1);

    auto [cfg, log] = loadGatewayConfigWithLog(path);
    EXPECT_EQ(cfg.model_identifier, "b");
    EXPECT_EQ(cfg.gateway_port, 11010);
    EXPECT_EQ(cfg.log_dir, "/tmp/infergate-test-logs");
    EXPECT_NE(log.find("sources=env,file"), std::string::npos);
    fs::remove(path);
}

TEST(UtilsConfigTest, PersistedAssignmentIgnoresEnvironment) {
    EnvGuard guard(kConfigEnv);
    auto path = tempConfig("persisted");
    std::ofstream(path) << "model_identifier=llama3.2:1b\ngateway_port=11002\n";
    setenv("INFERGATE_PORT", "11555", 1);
    setenv("INFERGATE_MODEL", "phi3:mini", 1);

    EXPECT_EQ(loadGatewayConfigWithLog(path).first.gateway_port, 11555);
    auto assignment = readPortAssignment(path);
    ASSERT_TRUE(assignment.has_value());
    EXPECT_EQ(assignment->port, 11002);
    EXPECT_EQ(assignment->model_identifier, "llama3.2:1b");
    fs::remove(path);
}

TEST(UtilsConfigTest, NoPersistedAssignmentWithoutPort) {
    EnvGuard guard(kConfigEnv);
    setenv("INFERGATE_PORT", "11555", 1);
    auto path = tempConfig("noport");
    EXPECT_FALSE(readPortAssignment(path).has_value());

    std::ofstream(path) << "model_identifier=llama3.2:1b\n";
    EXPECT_FALSE(readPortAssignment(path).has_value());
    fs::remove(path);
}

TEST(UtilsConfigTest, InvalidPortIsIgnored) {
    EnvGuard guard(kConfigEnv);
    auto path = tempConfig("badport");
    std::ofstream(path) << "gateway_port=99999\nbackend_port=nope\n";

    auto [cfg, log] = loadGatewayConfigWithLog(path);
    EXPECT_EQ(cfg.gateway_port, 0);
    EXPECT_EQ(cfg.backend_port, 11434);
    EXPECT_NE(log.find("invalid:gateway_port"), std::string::npos);
    fs::remove(path);
}

TEST(UtilsConfigTest, SaveThenAppendLastValueWins) {
    EnvGuard guard(kConfigEnv);
    auto path = tempConfig("save");
    savePortAssignment(path, {11005, "llama3.2:1b"});

    auto first = loadGatewayConfigWithLog(path).first;
    EXPECT_EQ(first.portAssignment().port, 11005);
    EXPECT_EQ(first.portAssignment().model_identifier, "llama3.2:1b");

    appendConfigValue(path, "gateway_port", "11006");
    auto second = loadGatewayConfigWithLog(path).first;
    EXPECT_EQ(second.gateway_port, 11006);
    EXPECT_EQ(second.model_identifier, "llama3.2:1b");
    fs::remove(path);
}

TEST(UtilsConfigTest, SaveRejectsInvalidAssignment) {
    auto path = tempConfig("reject");
    try {
        savePortAssignment(path, {0, "m"});
        FAIL() << "expected GatewayError";
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kInvalidConfig);
    }
    EXPECT_THROW(savePortAssignment(path, {11000, ""}), GatewayError);
    EXPECT_THROW(appendConfigValue(path, "bad=key", "v"), GatewayError);
    fs::remove(path);
}

TEST(UtilsConfigTest, ConfigPathFollowsEnv) {
    EnvGuard guard(kConfigEnv);
    setenv("INFERGATE_CONFIG", "/tmp/custom-infergate-config", 1);
    EXPECT_EQ(configPath(), fs::path("/tmp/custom-infergate-config"));
    unsetenv("INFERGATE_CONFIG");
    EXPECT_EQ(configPath().filename(), "config");
}
