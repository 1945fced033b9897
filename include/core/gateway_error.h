#pragma once

#include <stdexcept>
#include <string>

namespace infergate {

enum class ErrorCode : int {
    kOk = 0,
    kPortRangeExhausted = 1,
    kPortBindExhausted = 2,
    kBackendUnreachable = 3,
    kBackendError = 4,
    kStartFailed = 5,
    kStopFailed = 6,
    kIndeterminate = 7,
    kConfigDrift = 8,
    kBenchmarkFailed = 9,
    kInvalidConfig = 10,
    // a diagnostic check could not produce a result
    kCheckFailed = 11,
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return "OK";
        case ErrorCode::kPortRangeExhausted:
            return "PORT_RANGE_EXHAUSTED";
        case ErrorCode::kPortBindExhausted:
            return "PORT_BIND_EXHAUSTED";
        case ErrorCode::kBackendUnreachable:
            return "BACKEND_UNREACHABLE";
        case ErrorCode::kBackendError:
            return "BACKEND_ERROR";
        case ErrorCode::kStartFailed:
            return "START_FAILED";
        case ErrorCode::kStopFailed:
            return "STOP_FAILED";
        case ErrorCode::kIndeterminate:
            return "INDETERMINATE";
        case ErrorCode::kConfigDrift:
            return "CONFIG_DRIFT";
        case ErrorCode::kBenchmarkFailed:
            return "BENCHMARK_FAILED";
        case ErrorCode::kInvalidConfig:
            return "INVALID_CONFIG";
        case ErrorCode::kCheckFailed:
            return "CHECK_FAILED";
    }
    return "UNKNOWN";
}

// Error thrown by the port negotiator and the configuration store.
class GatewayError : public std::runtime_error {
public:
    GatewayError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

}  // namespace infergate
