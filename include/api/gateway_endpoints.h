#pragma once

#include <httplib.h>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "backend/ollama_client.h"

namespace infergate {

/// Fixed at gateway start; never mutated while serving.
struct TranslatorOptions {
    std::string model_identifier;
    std::string backend_host{"127.0.0.1"};
    uint16_t backend_port{11434};
    std::chrono::milliseconds generate_timeout{std::chrono::seconds(60)};
    std::chrono::milliseconds health_timeout{std::chrono::seconds(5)};
};

/// Translates the simplified `POST /` contract into the backend's
/// /api/generate call and relays backend health on `GET /health`.
/// Handlers only read immutable state, so requests run concurrently
/// on the server's worker pool without locking.
class GatewayEndpoints {
public:
    explicit GatewayEndpoints(TranslatorOptions options);

    void registerRoutes(httplib::Server& server);

    const TranslatorOptions& options() const { return options_; }

    /// Prompt of a caller request body. Other fields are ignored and a
    /// missing prompt is the empty string; std::nullopt when the body is
    /// not a JSON object or the prompt is not a string.
    static std::optional<std::string> extractPrompt(const std::string& body, std::string* error = nullptr);

    /// Caller-facing response for a successful backend generation.
    static nlohmann::json toGatewayResponse(const GenerateResult& result, const std::string& model);

private:
    void handleGenerate(const httplib::Request& req, httplib::Response& res) const;
    void handleHealth(const httplib::Request& req, httplib::Response& res) const;

    const TranslatorOptions options_;
    const OllamaClient backend_;
};

}  // namespace infergate
