#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "api/gateway_endpoints.h"
#include "api/http_server.h"

using namespace infergate;

namespace {

constexpr uint16_t kBackendPort = 18434;
constexpr uint16_t kGatewayPort = 18480;
constexpr uint16_t kClosedPort = 18499;

// In-process stand-in for the Ollama daemon.
class FakeBackend {
public:
    FakeBackend() {
        server_.Get("/api/tags", [this](const httplib::Request&, httplib::Response& res) {
            if (tags_delay.count() > 0) std::this_thread::sleep_for(tags_delay);
            res.status = tags_status;
            res.set_content(tags_body, "application/json");
        });
        server_.Post("/api/generate", [this](const httplib::Request& req, httplib::Response& res) {
            ++generate_calls;
            last_body = req.body;
            if (generate_delay.count() > 0) std::this_thread::sleep_for(generate_delay);
            if (generate_status != 200) {
                res.status = generate_status;
                res.set_content(R"({"error":"model 'llama3.2:1b' not found"})", "application/json");
                return;
            }
            if (!generate_body.empty()) {
                res.set_content(generate_body, "application/json");
                return;
            }
            auto in = nlohmann::json::parse(req.body);
            nlohmann::json out = {
                {"model", in["model"]},
                {"created_at", "2024-05-01T10:00:00Z"},
                {"response", "echo: " + in["prompt"].get<std::string>()},
                {"done", true},
                {"eval_count", 3},
                {"eval_duration", 1500000000},
            };
            res.set_content(out.dump(), "application/json");
        });
    }

    void start(uint16_t port) {
        thread_ = std::thread([this, port] { server_.listen("127.0.0.1", port); });
        for (int i = 0; i < 500 && !server_.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    void stop() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    ~FakeBackend() { stop(); }

    int tags_status{200};
    std::string tags_body{R"({"models":[{"name":"llama3.2:1b"}]})"};
    std::chrono::milliseconds tags_delay{0};
    int generate_status{200};
    // replaces the echo reply when set
    std::string generate_body;
    std::chrono::milliseconds generate_delay{0};
    std::atomic<int> generate_calls{0};
    std::string last_body;

private:
    httplib::Server server_;
    std::thread thread_;
};

class GatewayHttpTest : public ::testing::Test {
protected:
    void SetUp() override { backend.start(kBackendPort); }

    void startGateway(uint16_t backend_port = kBackendPort,
                      std::chrono::milliseconds generate_timeout = std::chrono::seconds(5)) {
        TranslatorOptions opts;
        opts.model_identifier = "llama3.2:1b";
        opts.backend_host = "127.0.0.1";
        opts.backend_port = backend_port;
        opts.generate_timeout = generate_timeout;
        opts.health_timeout = std::chrono::milliseconds(300);
        endpoints = std::make_unique<GatewayEndpoints>(opts);
        server = std::make_unique<HttpServer>(*endpoints, "127.0.0.1");
        ASSERT_TRUE(server->bind(kGatewayPort));
        server->start();
    }

    void TearDown() override {
        if (server) server->stop();
        backend.stop();
    }

    httplib::Client client() {
        httplib::Client cli("127.0.0.1", kGatewayPort);
        cli.set_read_timeout(std::chrono::seconds(10));
        return cli;
    }

    FakeBackend backend;
    std::unique_ptr<GatewayEndpoints> endpoints;
    std::unique_ptr<HttpServer> server;
};

}  // namespace

TEST_F(GatewayHttpTest, HealthReportsBackendAvailable) {
    startGateway();
    auto res = client().Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["status"], "healthy");
    EXPECT_EQ(body["model"], "llama3.2:1b");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
}

TEST_F(GatewayHttpTest, HealthUnavailableOnBackendError) {
    backend.tags_status = 500;
    startGateway();
    auto res = client().Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 503);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["status"], "unavailable");
    EXPECT_EQ(body["error"], "Backend not available");
    EXPECT_EQ(body["backend_status"], 500);
}

TEST_F(GatewayHttpTest, HealthUnavailableOnBackendNotFound) {
    backend.tags_status = 404;
    startGateway();
    auto res = client().Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 503);
}

TEST_F(GatewayHttpTest, HealthUnavailableWhenBackendTooSlow) {
    backend.tags_delay = std::chrono::milliseconds(1500);
    startGateway();
    const auto start = std::chrono::steady_clock::now();
    auto res = client().Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 503);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(1400));
}

TEST_F(GatewayHttpTest, HealthUnavailableWhenBackendDown) {
    startGateway(kClosedPort);
    auto res = client().Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 503);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_FALSE(body.contains("backend_status"));
}

TEST_F(GatewayHttpTest, TranslatesPromptToBackendAndBack) {
    startGateway();
    auto res = client().Post("/", R"({"prompt":"Why is the sky blue?","model":"ignored"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["response"], "echo: Why is the sky blue?");
    EXPECT_EQ(body["model"], "llama3.2:1b");
    EXPECT_EQ(body["created_at"], "2024-05-01T10:00:00Z");
    EXPECT_EQ(body["done"], true);

    auto sent = nlohmann::json::parse(backend.last_body);
    EXPECT_EQ(sent["model"], "llama3.2:1b");
    EXPECT_EQ(sent["prompt"], "Why is the sky blue?");
    EXPECT_EQ(sent["stream"], false);
}

TEST_F(GatewayHttpTest, MissingPromptIsForwardedAsEmpty) {
    startGateway();
    auto res = client().Post("/", "{}", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(nlohmann::json::parse(backend.last_body)["prompt"], "");
}

TEST_F(GatewayHttpTest, BackendErrorBecomes500) {
    backend.generate_status = 404;
    startGateway();
    auto res = client().Post("/", R"({"prompt":"hi"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 500);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["error"], "backend_error");
    EXPECT_EQ(body["backend_status"], 404);
    EXPECT_EQ(body["message"], "Backend error: 404");
}

TEST_F(GatewayHttpTest, UnparseableBodyIsInternalError) {
    startGateway();
    auto res = client().Post("/", "{not json", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 500);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["error"], "internal_error");
    EXPECT_EQ(backend.generate_calls.load(), 0);
}

TEST_F(GatewayHttpTest, UnreachableBackendIsInternalError) {
    startGateway(kClosedPort);
    auto res = client().Post("/", R"({"prompt":"hi"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 500);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["error"], "internal_error");
    EXPECT_EQ(body["code"], "BACKEND_UNREACHABLE");
}

TEST_F(GatewayHttpTest, PreflightAnsweredOnEveryPath) {
    startGateway();
    auto cli = client();
    for (const char* path : {"/", "/health", "/anything/else"}) {
        auto res = cli.Options(path);
        ASSERT_TRUE(res) << path;
        EXPECT_EQ(res->status, 200) << path;
        EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
        EXPECT_NE(res->get_header_value("Access-Control-Allow-Methods").find("POST"), std::string::npos);
        EXPECT_NE(res->get_header_value("Access-Control-Allow-Headers").find("Content-Type"), std::string::npos);
    }
    EXPECT_EQ(backend.generate_calls.load(), 0);
}

TEST_F(GatewayHttpTest, UnknownPathIsJson404) {
    startGateway();
    auto res = client().Get("/v1/models");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(nlohmann::json::parse(res->body)["error"], "not_found");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
}

TEST_F(GatewayHttpTest, ConcurrentRequestsGetTheirOwnAnswers) {
    startGateway();
    constexpr int kClients = 8;
    std::vector<std::thread> threads;
    std::atomic<int> matched{0};
    for (int i = 0; i < kClients; ++i) {
        threads.emplace_back([&, i] {
            httplib::Client cli("127.0.0.1", kGatewayPort);
            cli.set_read_timeout(std::chrono::seconds(10));
            const std::string prompt = "prompt-" + std::to_string(i);
            auto res = cli.Post("/", nlohmann::json{{"prompt", prompt}}.dump(), "application/json");
            if (res && res->status == 200 &&
                nlohmann::json::parse(res->body)["response"] == "echo: " + prompt) {
                ++matched;
            }
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(matched.load(), kClients);
    EXPECT_EQ(backend.generate_calls.load(), kClients);
}

TEST_F(GatewayHttpTest, SecondBindOnSamePortFails) {
    startGateway();
    GatewayEndpoints other(TranslatorOptions{});
    HttpServer second(other, "127.0.0.1");
    EXPECT_FALSE(second.bind(kGatewayPort));
    EXPECT_FALSE(second.isBound());
}

TEST_F(GatewayHttpTest, HealthyOnAnyTagsSuccess) {
    backend.tags_body = "OK";
    startGateway();
    auto res = client().Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(nlohmann::json::parse(res->body)["status"], "healthy");
}

TEST_F(GatewayHttpTest, MissingBackendTextIsRelayedAsEmpty) {
    backend.generate_body = R"({"done":true})";
    startGateway();
    auto res = client().Post("/", R"({"prompt":"hi"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["response"], "");
    EXPECT_EQ(body["done"], true);
}

TEST_F(GatewayHttpTest, MissingCreatedAtIsEmptyString) {
    backend.generate_body = R"({"response":"hello","done":true})";
    startGateway();
    auto res = client().Post("/", R"({"prompt":"hi"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["response"], "hello");
    ASSERT_TRUE(body.contains("created_at"));
    EXPECT_EQ(body["created_at"], "");
}

TEST_F(GatewayHttpTest, SlowGenerationDoesNotBlockHealth) {
    backend.generate_delay = std::chrono::milliseconds(1500);
    startGateway();

    std::thread slow([] {
        httplib::Client cli("127.0.0.1", kGatewayPort);
        cli.set_read_timeout(std::chrono::seconds(10));
        cli.Post("/", R"({"prompt":"take your time"})", "application/json");
    });
    // let the generate request reach the backend first
    for (int i = 0; i < 100 && backend.generate_calls.load() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    const auto start = std::chrono::steady_clock::now();
    auto res = client().Get("/health");
    const auto elapsed = std::chrono::steady_clock::now() - start;
    slow.join();

    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(backend.generate_calls.load(), 1);
    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
}

TEST_F(GatewayHttpTest, GenerationPastTimeoutIs500) {
    backend.generate_delay = std::chrono::milliseconds(1500);
    startGateway(kBackendPort, std::chrono::milliseconds(300));

    const auto start = std::chrono::steady_clock::now();
    auto res = client().Post("/", R"({"prompt":"hi"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(1400));
    EXPECT_EQ(res->status, 500);
    EXPECT_EQ(nlohmann::json::parse(res->body)["error"], "internal_error");
}

TEST_F(GatewayHttpTest, AccessLogCarriesReturnedRequestId) {
    TranslatorOptions opts;
    opts.model_identifier = "llama3.2:1b";
    opts.backend_port = kBackendPort;
    endpoints = std::make_unique<GatewayEndpoints>(opts);
    server = std::make_unique<HttpServer>(*endpoints, "127.0.0.1");

    std::mutex mu;
    std::vector<std::string> lines;
    server->setLogger([&](const httplib::Request& req, const httplib::Response& res) {
        std::lock_guard<std::mutex> lock(mu);
        lines.push_back(accessLogLine(req, res));
    });
    ASSERT_TRUE(server->bind(kGatewayPort));
    server->start();

    auto res = client().Get("/health");
    ASSERT_TRUE(res);
    const std::string id = res->get_header_value("X-Request-Id");
    ASSERT_FALSE(id.empty());

    std::string line;
    for (int i = 0; i < 100 && line.empty(); ++i) {
        {
            std::lock_guard<std::mutex> lock(mu);
            if (!lines.empty()) line = lines.front();
        }
        if (line.empty()) std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_NE(line.find("GET /health 200"), std::string::npos) << line;
    EXPECT_NE(line.find("request_id=" + id), std::string::npos) << line;
    // the logger refers to locals of this test
    server->stop();
}

TEST_F(GatewayHttpTest, CallerRequestIdIsEchoed) {
    startGateway();
    auto res = client().Get("/health", httplib::Headers{{"X-Request-Id", "trace-123"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->get_header_value("X-Request-Id"), "trace-123");
}
