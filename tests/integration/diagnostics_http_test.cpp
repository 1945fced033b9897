#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <thread>

#include "api/gateway_endpoints.h"
#include "api/http_server.h"
#include "diagnostics/diagnostics_aggregator.h"

using namespace infergate;

namespace {

constexpr uint16_t kBackendPort = 18534;
constexpr uint16_t kGatewayPort = 18580;
constexpr uint16_t kClosedPort = 18599;

class DiagnosticsHttpTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_.Get("/api/tags", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"models":[{"name":"llama3.2:1b"},{"name":"phi3:mini"}]})", "application/json");
        });
        backend_.Post("/api/generate", [](const httplib::Request&, httplib::Response& res) {
            nlohmann::json out = {
                {"model", "llama3.2:1b"},
                {"created_at", "2024-05-01T10:00:00Z"},
                {"response", "Circuits hum softly thinking in light"},
                {"done", true},
                {"eval_count", 40},
                {"eval_duration", 2000000000},
            };
            res.set_content(out.dump(), "application/json");
        });
        backend_thread_ = std::thread([this] { backend_.listen("127.0.0.1", kBackendPort); });
        for (int i = 0; i < 500 && !backend_.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        config_.model_identifier = "llama3.2:1b";
        config_.backend_host = "127.0.0.1";
        config_.backend_port = kBackendPort;
        config_.gateway_port = kGatewayPort;
    }

    void TearDown() override {
        if (gateway_) gateway_->stop();
        backend_.stop();
        if (backend_thread_.joinable()) backend_thread_.join();
    }

    void startGateway() {
        TranslatorOptions opts;
        opts.model_identifier = config_.model_identifier;
        opts.backend_port = kBackendPort;
        endpoints_ = std::make_unique<GatewayEndpoints>(opts);
        gateway_ = std::make_unique<HttpServer>(*endpoints_, "127.0.0.1");
        ASSERT_TRUE(gateway_->bind(kGatewayPort));
        gateway_->start();
    }

    // Runs one named check of the standard set directly.
    CheckOutcome runCheck(const std::string& name, const DiagnosticsOptions& options = {}) {
        auto aggregator = buildStandardDiagnostics(config_, nullptr, options);
        for (const auto& check : aggregator.checks()) {
            if (check.name == name) return check.run();
        }
        ADD_FAILURE() << "no check named " << name;
        return {};
    }

    GatewayConfig config_;
    httplib::Server backend_;
    std::thread backend_thread_;
    std::unique_ptr<GatewayEndpoints> endpoints_;
    std::unique_ptr<HttpServer> gateway_;
};

}  // namespace

TEST_F(DiagnosticsHttpTest, BackendCheckCountsModels) {
    auto o = runCheck("backend");
    EXPECT_EQ(o.result.status, CheckStatus::Pass);
    EXPECT_NE(o.result.detail.find("2 model(s)"), std::string::npos);
}

TEST_F(DiagnosticsHttpTest, BackendCheckFailsWhenDown) {
    config_.backend_port = kClosedPort;
    auto o = runCheck("backend");
    EXPECT_EQ(o.result.status, CheckStatus::Fail);
    EXPECT_EQ(o.result.code, ErrorCode::kBackendUnreachable);
    EXPECT_FALSE(o.result.hint.empty());
}

TEST_F(DiagnosticsHttpTest, GatewayAndInferencePassThroughRunningGateway) {
    startGateway();
    auto gateway = runCheck("gateway");
    EXPECT_EQ(gateway.result.status, CheckStatus::Pass);

    auto inference = runCheck("inference");
    EXPECT_EQ(inference.result.status, CheckStatus::Pass);
    EXPECT_NE(inference.result.detail.find("Circuits hum softly"), std::string::npos);
}

TEST_F(DiagnosticsHttpTest, GatewayCheckFailsWhenNotListening) {
    auto o = runCheck("gateway");
    EXPECT_EQ(o.result.status, CheckStatus::Fail);
    EXPECT_EQ(o.result.code, ErrorCode::kBackendUnreachable);
    EXPECT_EQ(o.result.hint, "Run: infergate start");
}

TEST_F(DiagnosticsHttpTest, BenchmarkSkippedUnlessRequested) {
    auto o = runCheck("benchmark");
    EXPECT_EQ(o.result.status, CheckStatus::Skipped);
    EXPECT_FALSE(o.benchmark.has_value());
}

TEST_F(DiagnosticsHttpTest, BenchmarkMeasuresThroughput) {
    DiagnosticsOptions options;
    options.run_benchmark = true;
    auto o = runCheck("benchmark", options);
    EXPECT_EQ(o.result.status, CheckStatus::Pass);
    ASSERT_TRUE(o.benchmark.has_value());
    EXPECT_EQ(o.benchmark->word_count, 6u);
    ASSERT_TRUE(o.benchmark->tokens_per_second.has_value());
    EXPECT_DOUBLE_EQ(*o.benchmark->tokens_per_second, 20.0);
    EXPECT_NE(o.result.detail.find("tokens/s"), std::string::npos);
}

TEST_F(DiagnosticsHttpTest, FullRunReportsEveryCheck) {
    startGateway();
    DiagnosticsOptions options;
    options.check_deadline = std::chrono::seconds(20);
    auto report = buildStandardDiagnostics(config_, nullptr, options).run();
    ASSERT_EQ(report.checks.size(), 6u);
    EXPECT_EQ(report.find("backend")->status, CheckStatus::Pass);
    EXPECT_EQ(report.find("gateway")->status, CheckStatus::Pass);
    EXPECT_EQ(report.find("inference")->status, CheckStatus::Pass);
    EXPECT_EQ(report.find("benchmark")->status, CheckStatus::Skipped);
    EXPECT_TRUE(report.resources.has_value());
}
