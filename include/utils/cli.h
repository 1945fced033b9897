#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace infergate {

/// Subcommand types for the infergate CLI
enum class Subcommand {
    None,       // No subcommand (print usage)
    Serve,      // serve
    Setup,      // setup [--force] [--port N] [--model NAME]
    Start,      // start [UNIT]
    Stop,       // stop [UNIT] [--force]
    Status,     // status
    Restart,    // restart [UNIT]
    Logs,       // logs [--lines N]
    Test,       // test
    Models,     // models
    Pull,       // pull <model>
    Ports,      // ports
    Doctor,     // doctor [--auto] [--benchmark]
};

/// Options for serve command
struct ServeOptions {
    std::optional<uint16_t> port;   // --port overrides the persisted assignment
    std::string host;               // --host overrides bind_address
};

/// Options for setup command
struct SetupOptions {
    bool force{false};
    uint16_t port{0};     // 0 = negotiate
    std::string model;    // empty = configured default
};

/// Options for start/stop/restart
struct UnitOptions {
    std::string unit;     // daemon|gateway|worker; empty = all
    bool force{false};    // stop only: SIGKILL when graceful stop does not finish
};

/// Options for logs command
struct LogsOptions {
    size_t lines{20};
};

/// Options for pull command
struct PullOptions {
    std::string model;
};

/// Options for doctor command
struct DoctorOptions {
    bool auto_mode{false};
    bool benchmark{false};
    bool json{false};
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (e.g., after --help or --version)
    bool should_exit{false};

    /// Exit code to use if should_exit is true
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    /// Parsed subcommand
    Subcommand subcommand{Subcommand::None};

    ServeOptions serve_options;
    SetupOptions setup_options;
    UnitOptions unit_options;
    LogsOptions logs_options;
    PullOptions pull_options;
    DoctorOptions doctor_options;
};

/// Parse command line arguments
///
/// @param argc Number of arguments
/// @param argv Argument values
/// @return CliResult indicating whether to continue or exit
CliResult parseCliArgs(int argc, char* argv[]);

/// Get the help message for the CLI
///
/// @return Help message string
std::string getHelpMessage();

/// Get the version message for the CLI
///
/// @return Version message string
std::string getVersionMessage();

/// Convert subcommand enum to string
std::string subcommandToString(Subcommand cmd);

}  // namespace infergate
