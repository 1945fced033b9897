// CLI command function declarations
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "supervisor/supervisor.h"
#include "utils/cli.h"
#include "utils/config.h"

namespace infergate {
namespace cli {
namespace commands {

// Note: 'serve' is implemented in main.cpp as it owns the server
// lifecycle and signal handling.

/// Execute the 'setup' command
/// @param options Setup options (force, port, model)
/// @return Exit code (0=success, 1=error)
int setup(const SetupOptions& options);

/// Execute the 'start' command
/// @param options Unit selection (empty = all units)
/// @return Exit code (0=success, 1=error)
int start(const UnitOptions& options);

/// Execute the 'stop' command
/// @param options Unit selection and force flag
/// @return Exit code (0=success, 1=error)
int stop(const UnitOptions& options);

/// Execute the 'restart' command
/// @param options Unit selection (empty = all units, in dependency order)
/// @return Exit code (0=success, 1=error)
int restart(const UnitOptions& options);

/// Execute the 'status' command
/// @return Exit code (0=success)
int status();

/// Execute the 'logs' command
/// @return Exit code (0=success)
int logs(const LogsOptions& options);

/// Execute the 'test' command
/// @return Exit code (0=success, 1=error, 2=connection error)
int test();

/// Execute the 'models' command
/// @return Exit code (0=success, 1=error, 2=connection error)
int models();

/// Execute the 'pull' command
/// @return Exit code (0=success, 1=error, 2=connection error)
int pull(const PullOptions& options);

/// Execute the 'ports' command
/// @return Exit code (0=success)
int ports();

/// Execute the 'doctor' command
/// @return Exit code (0=healthy or menu exited, 1=failures found)
int doctor(const DoctorOptions& options);

// Shared helpers

/// Configuration for a command; the config source is logged at debug level.
GatewayConfig loadConfig();

/// Supervisor over this host's default units.
std::shared_ptr<Supervisor> makeSupervisor(const GatewayConfig& config);

/// Absolute path of the running executable (used to launch the gateway).
std::string selfExecutablePath();

/// "daemon" | "gateway" | "worker"
std::optional<UnitKind> parseUnitKind(const std::string& name);

}  // namespace commands
}  // namespace cli
}  // namespace infergate
