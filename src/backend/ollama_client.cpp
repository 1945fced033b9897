#include "backend/ollama_client.h"

#include <httplib.h>
#include <algorithm>
#include <spdlog/spdlog.h>
#include <utility>

namespace infergate {

namespace {

std::string errorMessageFromBody(int status, const std::string& body) {
    if (body.empty()) return "HTTP " + std::to_string(status);
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (!json.is_discarded() && json.is_object() && json.contains("error") && json["error"].is_string()) {
        return json["error"].get<std::string>();
    }
    return body;
}

std::string describeTransportError(httplib::Error err) {
    return "backend unreachable: " + httplib::to_string(err);
}

std::string stringField(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_string() ? it->get<std::string>() : std::string();
}

}  // namespace

std::vector<ModelEntry> parseModelList(const nlohmann::json& tags) {
    std::vector<ModelEntry> out;
    if (!tags.is_object()) return out;
    auto models = tags.find("models");
    if (models == tags.end() || !models->is_array()) return out;

    for (const auto& m : *models) {
        if (!m.is_object()) continue;
        ModelEntry entry;
        entry.name = stringField(m, "name");
        entry.digest = stringField(m, "digest");
        entry.modified_at = stringField(m, "modified_at");
        auto size = m.find("size");
        if (size != m.end() && size->is_number_unsigned()) entry.size = size->get<uint64_t>();
        out.push_back(std::move(entry));
    }
    return out;
}

OllamaClient::OllamaClient(std::string host, uint16_t port)
    : host_(std::move(host)), port_(port) {}

BackendResult<GenerateResult> OllamaClient::generate(const std::string& model,
                                                     const std::string& prompt,
                                                     std::chrono::milliseconds timeout) const {
    httplib::Client client(host_, port_);
    client.set_connection_timeout(connect_timeout_);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);

    nlohmann::json body;
    body["model"] = model;
    body["prompt"] = prompt;
    body["stream"] = false;

    auto res = client.Post("/api/generate", body.dump(), "application/json");

    BackendResult<GenerateResult> result;
    if (!res) {
        result.error = BackendError::ConnectionError;
        result.error_message = describeTransportError(res.error());
        return result;
    }
    result.status = res->status;

    if (res->status != 200) {
        result.error = BackendError::HttpError;
        result.error_message = errorMessageFromBody(res->status, res->body);
        return result;
    }

    auto json = nlohmann::json::parse(res->body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        result.error = BackendError::ParseError;
        result.error_message = "backend returned invalid JSON";
        return result;
    }

    GenerateResult gen;
    // a missing or non-text response is relayed as empty text
    if (json.contains("response") && json["response"].is_string()) {
        gen.response = json["response"].get<std::string>();
    }
    if (json.contains("created_at") && json["created_at"].is_string()) {
        gen.created_at = json["created_at"].get<std::string>();
    }
    if (json.contains("done") && json["done"].is_boolean()) {
        gen.done = json["done"].get<bool>();
    }
    if (json.contains("eval_count") && json["eval_count"].is_number_integer()) {
        gen.eval_count = json["eval_count"].get<int64_t>();
    }
    if (json.contains("eval_duration") && json["eval_duration"].is_number_integer()) {
        gen.eval_duration_ns = json["eval_duration"].get<int64_t>();
    }
    result.data = std::move(gen);
    return result;
}

BackendResult<nlohmann::json> OllamaClient::listModels(std::chrono::milliseconds timeout) const {
    httplib::Client client(host_, port_);
    client.set_connection_timeout(std::min(connect_timeout_, timeout));
    client.set_read_timeout(timeout);

    auto res = client.Get("/api/tags");

    BackendResult<nlohmann::json> result;
    if (!res) {
        result.error = BackendError::ConnectionError;
        result.error_message = describeTransportError(res.error());
        return result;
    }
    result.status = res->status;

    if (res->status != 200) {
        result.error = BackendError::HttpError;
        result.error_message = errorMessageFromBody(res->status, res->body);
        return result;
    }

    // the status is the liveness signal; an unreadable listing is just empty
    auto json = nlohmann::json::parse(res->body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        spdlog::debug("Backend /api/tags body is not a JSON object");
        json = nlohmann::json::object();
    }
    result.data = std::move(json);
    return result;
}

BackendResult<void> OllamaClient::pullModel(const std::string& name, PullProgressCallback progress_cb) const {
    httplib::Client client(host_, port_);
    client.set_connection_timeout(connect_timeout_);
    // a layer may take minutes between progress lines on slow links
    client.set_read_timeout(std::chrono::minutes(10));

    nlohmann::json body;
    body["name"] = name;
    body["stream"] = true;

    std::string pending;
    std::string stream_error;

    auto res = client.Post(
        "/api/pull",
        httplib::Headers{},
        body.dump(),
        "application/json",
        [&](const char* data, size_t len) -> bool {
            pending.append(data, len);
            size_t nl;
            while ((nl = pending.find('\n')) != std::string::npos) {
                std::string line = pending.substr(0, nl);
                pending.erase(0, nl + 1);
                if (line.empty()) continue;

                auto json = nlohmann::json::parse(line, nullptr, false);
                if (json.is_discarded() || !json.is_object()) continue;
                if (json.contains("error") && json["error"].is_string()) {
                    stream_error = json["error"].get<std::string>();
                    return false;
                }
                if (progress_cb) {
                    progress_cb(json.value("status", std::string()),
                                json.value("completed", static_cast<uint64_t>(0)),
                                json.value("total", static_cast<uint64_t>(0)));
                }
            }
            return true;
        });

    BackendResult<void> result;
    if (!stream_error.empty()) {
        result.error = BackendError::HttpError;
        result.status = res ? res->status : 0;
        result.error_message = stream_error;
        return result;
    }
    if (!res) {
        result.error = BackendError::ConnectionError;
        result.error_message = describeTransportError(res.error());
        return result;
    }
    result.status = res->status;
    if (res->status != 200) {
        result.error = BackendError::HttpError;
        result.error_message = errorMessageFromBody(res->status, res->body);
        return result;
    }
    spdlog::debug("Pull of {} completed", name);
    return result;
}

}  // namespace infergate
