#include "cli/commands.h"

#include <iostream>
#include <spdlog/spdlog.h>

#include "core/gateway_error.h"
#include "net/listening_ports.h"
#include "net/port_negotiator.h"

namespace infergate {
namespace cli {
namespace commands {

int setup(const SetupOptions& options) {
    const auto path = configPath();
    auto cfg = loadConfig();

    if (cfg.hasPortAssignment() && !options.force) {
        std::cerr << "Error: gateway port already assigned (" << cfg.gateway_port << ") in " << path.string()
                  << std::endl;
        std::cerr << "Use --force to reconfigure." << std::endl;
        return 1;
    }

    const auto used = listListeningPorts();
    std::cout << "Ports in use:";
    if (used.empty()) {
        std::cout << " (none)";
    }
    for (auto p : used) {
        std::cout << " " << p;
    }
    std::cout << std::endl;

    PortAssignment assignment;
    assignment.model_identifier = options.model.empty() ? cfg.model_identifier : options.model;
    try {
        if (options.port != 0) {
            PortNegotiator negotiator;
            if (!negotiator.isAvailable(options.port)) {
                std::cerr << "Error: port " << options.port << " is already in use" << std::endl;
                return 1;
            }
            assignment.port = options.port;
        } else {
            PortNegotiator negotiator;
            assignment.port = negotiator.findAvailablePort(cfg.port_range_low, cfg.port_range_high);
        }

        if (cfg.hasPortAssignment()) {
            appendConfigValue(path, "gateway_port", std::to_string(assignment.port));
            appendConfigValue(path, "model_identifier", assignment.model_identifier);
        } else {
            savePortAssignment(path, assignment);
        }
    } catch (const GatewayError& e) {
        std::cerr << "Error: " << to_string(e.code()) << " - " << e.what() << std::endl;
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    spdlog::info("Port assignment saved: port={} model={}", assignment.port, assignment.model_identifier);
    std::cout << "Gateway port: " << assignment.port << std::endl;
    std::cout << "Model:        " << assignment.model_identifier << std::endl;
    std::cout << "Saved to:     " << path.string() << std::endl;
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace infergate
