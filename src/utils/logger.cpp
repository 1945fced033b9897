#include "utils/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace infergate::logger {

namespace {
    constexpr const char* DEFAULT_DATA_DIR = ".infergate";
    constexpr const char* LOG_SUBDIR = "logs";

    constexpr const char* LOG_DIR_ENV = "INFERGATE_LOG_DIR";
    constexpr const char* LOG_LEVEL_ENV = "INFERGATE_LOG_LEVEL";
    constexpr const char* LEGACY_LEVEL_ENV = "LOG_LEVEL";

    std::string get_home_dir() {
        if (const char* home = std::getenv("HOME")) {
            return home;
        }
        return "/tmp";
    }
}  // namespace

spdlog::level::level_enum parse_level(const std::string& level_text) {
    std::string lower = level_text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical" || lower == "fatal") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::info;
}

std::string get_log_dir() {
    if (const char* env = std::getenv(LOG_DIR_ENV)) {
        return env;
    }
    return (fs::path(get_home_dir()) / DEFAULT_DATA_DIR / LOG_SUBDIR).string();
}

std::string get_log_file_path(const std::string& component) {
    return (fs::path(get_log_dir()) / (component + ".jsonl")).string();
}

void init(const std::string& level,
          const std::string& pattern,
          const std::string& file_path,
          std::vector<spdlog::sink_ptr> additional_sinks) {
    std::vector<spdlog::sink_ptr> sinks = std::move(additional_sinks);

    if (!file_path.empty() && sinks.empty()) {
        sinks.push_back(
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false));
    }

    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>("infergate", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    if (!pattern.empty()) {
        spdlog::set_pattern(pattern);
    }
    spdlog::set_level(parse_level(level));
    spdlog::flush_on(spdlog::level::info);
}

void init_from_env(const std::string& component, bool with_file) {
    std::string level = with_file ? "info" : "warn";
    if (const char* env = std::getenv(LOG_LEVEL_ENV)) {
        level = env;
    } else if (const char* env = std::getenv(LEGACY_LEVEL_ENV)) {
        level = env;
    }

    std::vector<spdlog::sink_ptr> sinks;

    auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    stdout_sink->set_pattern("[%Y-%m-%d %T.%e] [%l] %v");
    sinks.push_back(stdout_sink);

    std::string log_path;
    std::string sink_error;
    if (with_file) {
        std::error_code ec;
        fs::create_directories(get_log_dir(), ec);
        log_path = get_log_file_path(component);
        try {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
            file_sink->set_pattern(R"({"ts":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            // stdout only; a detached spawn still redirects stdout into the unit log
            sink_error = e.what();
            log_path.clear();
        }
    }

    // Preserve per-sink patterns (stdout human-readable, file JSON).
    init(level, "", "", sinks);

    if (!sink_error.empty()) {
        spdlog::warn("{} file log unavailable: {}", component, sink_error);
    } else if (!log_path.empty()) {
        spdlog::info("{} logs initialized: {}", component, log_path);
    }
}

std::vector<std::string> tail_lines(const std::string& path, size_t max_lines) {
    std::ifstream file(path);
    if (!file.is_open() || max_lines == 0) return {};

    std::deque<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(std::move(line));
        if (lines.size() > max_lines) lines.pop_front();
    }
    return {lines.begin(), lines.end()};
}

bool truncate_to_last_lines(const std::string& path, size_t keep_lines) {
    if (!fs::exists(path)) return false;
    auto kept = tail_lines(path, keep_lines);

    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) return false;
        for (const auto& l : kept) out << l << '\n';
        if (!out) return false;
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

}  // namespace infergate::logger
