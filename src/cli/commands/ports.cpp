#include "cli/commands.h"
#include "net/listening_ports.h"
#include <iostream>

namespace infergate {
namespace cli {
namespace commands {

int ports() {
    auto cfg = loadConfig();
    const auto listening = listListeningPorts();

    std::cout << "Listening TCP ports:" << std::endl;
    for (auto port : listening) {
        std::cout << "  " << port;
        if (port == cfg.backend_port) {
            std::cout << "  (ollama)";
        } else if (cfg.hasPortAssignment() && port == cfg.gateway_port) {
            std::cout << "  (gateway)";
        }
        std::cout << std::endl;
    }
    if (listening.empty()) {
        std::cout << "  (none)" << std::endl;
    }

    if (cfg.hasPortAssignment() && listening.count(static_cast<uint16_t>(cfg.gateway_port)) == 0) {
        std::cout << std::endl << "Gateway port " << cfg.gateway_port << " is not listening." << std::endl;
    }
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace infergate
