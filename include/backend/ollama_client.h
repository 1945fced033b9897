#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace infergate {

/// Error codes for backend calls
enum class BackendError {
    Success = 0,
    ConnectionError = 1,  // refused, timed out, reset
    HttpError = 2,        // backend answered with a non-200 status
    ParseError = 3,       // backend answered 200 with an unusable body
};

/// Result of a backend call
template<typename T>
struct BackendResult {
    BackendError error{BackendError::Success};
    int status{0};
    std::string error_message;
    std::optional<T> data;

    bool ok() const { return error == BackendError::Success; }
};

/// Specialization for void type (no data member)
template<>
struct BackendResult<void> {
    BackendError error{BackendError::Success};
    int status{0};
    std::string error_message;

    bool ok() const { return error == BackendError::Success; }
};

/// Parsed non-streaming /api/generate response
struct GenerateResult {
    std::string response;
    std::string created_at;
    bool done{true};
    std::optional<int64_t> eval_count;
    std::optional<int64_t> eval_duration_ns;
};

/// One entry of an /api/tags listing
struct ModelEntry {
    std::string name;
    std::string digest;
    uint64_t size{0};
    std::string modified_at;
};

/// Entries of an /api/tags body. Entries that are not objects are skipped
/// and fields of the wrong type read as empty.
std::vector<ModelEntry> parseModelList(const nlohmann::json& tags);

/// Callback for pull progress (status line, completed bytes, total bytes)
using PullProgressCallback = std::function<void(const std::string& status, uint64_t completed, uint64_t total)>;

/// HTTP client for the backend inference engine's native API.
/// Every call carries a read timeout; no call blocks indefinitely.
class OllamaClient {
public:
    OllamaClient(std::string host, uint16_t port);

    /// POST /api/generate {model, prompt, stream:false}
    BackendResult<GenerateResult> generate(const std::string& model,
                                           const std::string& prompt,
                                           std::chrono::milliseconds timeout) const;

    /// GET /api/tags, the low-cost liveness signal. Any 200 succeeds; data
    /// is an empty object when the body is not a JSON object.
    BackendResult<nlohmann::json> listModels(std::chrono::milliseconds timeout) const;

    /// POST /api/pull {name, stream:true}; progress is reported per NDJSON line
    BackendResult<void> pullModel(const std::string& name, PullProgressCallback progress_cb = nullptr) const;

    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }

private:
    std::string host_;
    uint16_t port_;
    std::chrono::milliseconds connect_timeout_{std::chrono::seconds(3)};
};

}  // namespace infergate
