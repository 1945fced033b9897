#include "cli/commands.h"
#include "utils/logger.h"
#include <iostream>

namespace infergate {
namespace cli {
namespace commands {

/// Execute the 'logs' command
/// @param options Number of trailing lines per unit
/// @return Exit code (0=success)
int logs(const LogsOptions& options) {
    auto supervisor = makeSupervisor(loadConfig());

    for (auto kind : supervisor->kinds()) {
        auto* unit = supervisor->unit(kind);
        std::cout << "=== " << unit->name() << " (" << unit->logPath() << ") ===" << std::endl;
        auto lines = logger::tail_lines(unit->logPath(), options.lines);
        if (lines.empty()) {
            std::cout << "No logs found" << std::endl;
        }
        for (const auto& line : lines) {
            std::cout << line << std::endl;
        }
        std::cout << std::endl;
    }
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace infergate
