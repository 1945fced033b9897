#include "cli/progress_renderer.h"
#include <iomanip>
#include <ostream>
#include <sstream>
#include <cmath>

#include "system/resource_monitor.h"

namespace infergate {
namespace cli {

ProgressRenderer::ProgressRenderer(std::ostream& out)
    : out_(out)
    , start_time_(std::chrono::steady_clock::now())
    , phase_start_(start_time_)
{
}

void ProgressRenderer::update(const std::string& status, uint64_t completed, uint64_t total) {
    if (finished_) {
        return;
    }

    const auto now = std::chrono::steady_clock::now();
    if (status != phase_) {
        if (!phase_.empty()) {
            out_ << "\n";
            last_length_ = 0;
        }
        phase_ = status;
        phase_start_ = now;
    }

    std::ostringstream oss;
    oss << phase_;

    // Progress bar (if total is known)
    if (total > 0) {
        oss << " " << formatProgressBar(completed, total);
        oss << " " << formatBytes(completed) << "/" << formatBytes(total);

        const double elapsed = std::chrono::duration<double>(now - phase_start_).count();
        if (elapsed > 0.5 && completed > 0) {
            const double speed_bps = static_cast<double>(completed) / elapsed;
            oss << " " << formatSpeed(speed_bps);
            if (completed < total) {
                oss << " ETA " << formatDuration(static_cast<double>(total - completed) / speed_bps);
            }
        }
    }

    clearAndPrint(oss.str());
}

void ProgressRenderer::complete() {
    if (finished_) {
        return;
    }
    finished_ = true;

    const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();
    if (!phase_.empty()) {
        out_ << "\n";
    }
    out_ << "success";
    if (seconds >= 1.0) {
        out_ << " in " << formatDuration(seconds);
    }
    out_ << std::endl;
}

void ProgressRenderer::fail(const std::string& error_message) {
    if (finished_) {
        return;
    }
    finished_ = true;

    if (!phase_.empty()) {
        out_ << "\n";
    }
    out_ << "Error: " << error_message << std::endl;
}

std::string ProgressRenderer::formatProgressBar(uint64_t completed, uint64_t total, int width) {
    if (total == 0) {
        return "";
    }

    double progress = static_cast<double>(completed) / static_cast<double>(total);
    if (progress > 1.0) progress = 1.0;
    int filled = static_cast<int>(progress * width);

    std::ostringstream oss;
    int percent = static_cast<int>(progress * 100);
    oss << std::setw(3) << percent << "% [";

    for (int i = 0; i < width; ++i) {
        if (i < filled) {
            oss << "=";
        } else if (i == filled) {
            oss << ">";
        } else {
            oss << " ";
        }
    }

    oss << "]";
    return oss.str();
}

std::string ProgressRenderer::formatSpeed(double bps) {
    const char* units[] = {"B/s", "KB/s", "MB/s", "GB/s"};
    int unit_index = 0;
    double speed = bps;

    while (speed >= 1024.0 && unit_index < 3) {
        speed /= 1024.0;
        ++unit_index;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << speed << " " << units[unit_index];
    return oss.str();
}

std::string ProgressRenderer::formatDuration(double seconds) {
    std::ostringstream oss;

    if (seconds < 60) {
        oss << static_cast<int>(std::ceil(seconds)) << "s";
    } else if (seconds < 3600) {
        int minutes = static_cast<int>(seconds / 60);
        int secs = static_cast<int>(seconds) % 60;
        oss << minutes << "m " << secs << "s";
    } else {
        int hours = static_cast<int>(seconds / 3600);
        int minutes = (static_cast<int>(seconds) % 3600) / 60;
        oss << hours << "h " << minutes << "m";
    }

    return oss.str();
}

void ProgressRenderer::clearAndPrint(const std::string& content) {
    out_ << "\r" << content;

    // Pad with spaces to clear any remaining characters from previous output
    if (content.length() < last_length_) {
        out_ << std::string(last_length_ - content.length(), ' ');
        out_ << "\r" << content;
    }
    last_length_ = content.length();

    out_.flush();
}

}  // namespace cli
}  // namespace infergate
