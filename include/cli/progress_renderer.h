#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace infergate {
namespace cli {

/// Single-line progress display for `infergate pull` (ollama-style).
/// Each backend status line either updates the current phase in place
/// or, when the phase changes, finishes the previous line.
class ProgressRenderer {
public:
    explicit ProgressRenderer(std::ostream& out);

    /// Feed one progress record (status text, completed bytes, total bytes).
    void update(const std::string& status, uint64_t completed, uint64_t total);

    /// Mark as completed
    void complete();

    /// Mark as failed
    /// @param error_message Error message to display
    void fail(const std::string& error_message);

    /// Get progress bar string
    /// @return Progress bar string (e.g., " 45% [=========>          ]")
    static std::string formatProgressBar(uint64_t completed, uint64_t total, int width = 20);

    /// Format speed as human-readable string (e.g., "45.2 MB/s")
    static std::string formatSpeed(double bps);

    /// Format duration as human-readable string (e.g., "2m 30s", "45s")
    static std::string formatDuration(double seconds);

private:
    void clearAndPrint(const std::string& content);

    std::ostream& out_;
    std::string phase_;
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point phase_start_;
    size_t last_length_{0};
    bool finished_{false};
};

}  // namespace cli
}  // namespace infergate
