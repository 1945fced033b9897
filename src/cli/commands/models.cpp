// Lists models known to the local Ollama daemon

#include "cli/commands.h"
#include "backend/ollama_client.h"
#include "system/resource_monitor.h"
#include <iostream>
#include <iomanip>
#include <string>

namespace infergate {
namespace cli {
namespace commands {

/// Execute the 'models' command
/// @return Exit code (0=success, 1=error, 2=connection error)
int models() {
    auto cfg = loadConfig();
    OllamaClient client(cfg.backend_host, static_cast<uint16_t>(cfg.backend_port));

    auto result = client.listModels(std::chrono::seconds(10));
    if (result.error == BackendError::ConnectionError) {
        std::cerr << "Error: Could not connect to Ollama at " << cfg.backend_host << ":" << cfg.backend_port
                  << std::endl;
        std::cerr << "Start it with: infergate start daemon" << std::endl;
        return 2;
    }
    if (!result.ok()) {
        std::cerr << "Error: " << result.error_message << std::endl;
        return 1;
    }

    std::cout << std::left
              << std::setw(40) << "NAME"
              << std::setw(16) << "ID"
              << std::setw(12) << "SIZE"
              << std::setw(28) << "MODIFIED"
              << std::endl;

    const auto entries = parseModelList(*result.data);
    if (entries.empty()) {
        std::cout << "(no models installed; try: infergate pull " << cfg.model_identifier << ")" << std::endl;
        return 0;
    }

    for (const auto& model : entries) {
        std::cout << std::left
                  << std::setw(40) << (model.name.empty() ? "unknown" : model.name)
                  << std::setw(16) << model.digest.substr(0, 12)
                  << std::setw(12) << formatBytes(model.size)
                  << std::setw(28) << model.modified_at.substr(0, 19)
                  << std::endl;
    }
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace infergate
