// logger.h - lightweight logging wrapper around spdlog
#pragma once

#include <spdlog/spdlog.h>
#include <cstddef>
#include <string>
#include <vector>

namespace infergate::logger {

// Convert textual level to spdlog level (case-insensitive). Unknown -> info.
spdlog::level::level_enum parse_level(const std::string& level_text);

// Get the log directory path (~/.infergate/logs by default).
std::string get_log_dir();

// Structured log file of a component (<log dir>/<component>.jsonl).
std::string get_log_file_path(const std::string& component);

// Initialize default logger with optional pattern and file sink.
// additional_sinks is mainly for testing (e.g., ostream sink injection).
void init(const std::string& level = "info",
          const std::string& pattern = "[%Y-%m-%d %T.%e] [%l] %v",
          const std::string& file_path = "",
          std::vector<spdlog::sink_ptr> additional_sinks = {});

// Initialize using environment variables:
// INFERGATE_LOG_DIR (log directory, default: ~/.infergate/logs)
// INFERGATE_LOG_LEVEL (trace|debug|info|warn|error|critical|off)
// Legacy: LOG_LEVEL is still supported.
// with_file=false keeps CLI invocations on stdout only.
void init_from_env(const std::string& component, bool with_file = true);

// Last max_lines lines of a text file; empty when the file is missing.
std::vector<std::string> tail_lines(const std::string& path, size_t max_lines);

// Keep only the last keep_lines lines of a file. Returns false when the file
// is missing or could not be rewritten.
bool truncate_to_last_lines(const std::string& path, size_t keep_lines);

}  // namespace infergate::logger
