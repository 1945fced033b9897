#include "api/gateway_endpoints.h"

#include <spdlog/spdlog.h>
#include <utility>

#include "core/gateway_error.h"

namespace infergate {

namespace {

void respondJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void respondInternalError(httplib::Response& res, ErrorCode code, const std::string& message) {
    respondJson(res, 500, {
        {"error", "internal_error"},
        {"code", to_string(code)},
        {"message", "Internal server error: " + message}
    });
}

}  // namespace

GatewayEndpoints::GatewayEndpoints(TranslatorOptions options)
    : options_(std::move(options)), backend_(options_.backend_host, options_.backend_port) {}

void GatewayEndpoints::registerRoutes(httplib::Server& server) {
    server.Post("/", [this](const httplib::Request& req, httplib::Response& res) {
        handleGenerate(req, res);
    });
    server.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handleHealth(req, res);
    });
}

std::optional<std::string> GatewayEndpoints::extractPrompt(const std::string& body, std::string* error) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        if (error) *error = "request body is not a JSON object";
        return std::nullopt;
    }
    if (!json.contains("prompt") || json["prompt"].is_null()) {
        return std::string();
    }
    if (!json["prompt"].is_string()) {
        if (error) *error = "prompt must be a string";
        return std::nullopt;
    }
    return json["prompt"].get<std::string>();
}

nlohmann::json GatewayEndpoints::toGatewayResponse(const GenerateResult& result, const std::string& model) {
    return {
        {"response", result.response},
        {"model", model},
        {"created_at", result.created_at},
        {"done", true}
    };
}

void GatewayEndpoints::handleGenerate(const httplib::Request& req, httplib::Response& res) const {
    try {
        std::string parse_error;
        auto prompt = extractPrompt(req.body, &parse_error);
        if (!prompt) {
            spdlog::warn("Rejected request: {}", parse_error);
            respondJson(res, 500, {
                {"error", "internal_error"},
                {"message", "Internal server error: " + parse_error}
            });
            return;
        }

        auto result = backend_.generate(options_.model_identifier, *prompt, options_.generate_timeout);
        switch (result.error) {
            case BackendError::Success:
                respondJson(res, 200, toGatewayResponse(*result.data, options_.model_identifier));
                return;
            case BackendError::HttpError:
                spdlog::warn("Backend returned status {}: {}", result.status, result.error_message);
                respondJson(res, 500, {
                    {"error", "backend_error"},
                    {"code", to_string(ErrorCode::kBackendError)},
                    {"backend_status", result.status},
                    {"message", "Backend error: " + std::to_string(result.status)}
                });
                return;
            case BackendError::ConnectionError:
                spdlog::error("Backend unreachable: {}", result.error_message);
                respondInternalError(res, ErrorCode::kBackendUnreachable, result.error_message);
                return;
            case BackendError::ParseError:
                spdlog::error("Backend response unusable: {}", result.error_message);
                respondInternalError(res, ErrorCode::kBackendError, result.error_message);
                return;
        }
        respondInternalError(res, ErrorCode::kBackendError, "unexpected backend result");
    } catch (const std::exception& e) {
        spdlog::error("Error processing request: {}", e.what());
        respondInternalError(res, ErrorCode::kBackendError, e.what());
    }
}

void GatewayEndpoints::handleHealth(const httplib::Request&, httplib::Response& res) const {
    auto probe = backend_.listModels(options_.health_timeout);
    if (probe.ok()) {
        respondJson(res, 200, {{"status", "healthy"}, {"model", options_.model_identifier}});
        return;
    }
    spdlog::warn("Health probe failed: {}", probe.error_message);
    nlohmann::json body = {
        {"status", "unavailable"},
        {"error", "Backend not available"},
        {"detail", probe.error_message}
    };
    if (probe.status != 0) body["backend_status"] = probe.status;
    respondJson(res, 503, body);
}

}  // namespace infergate
