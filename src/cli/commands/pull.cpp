// Downloads a model through the Ollama daemon

#include "cli/commands.h"
#include "backend/ollama_client.h"
#include "cli/progress_renderer.h"
#include <iostream>

namespace infergate {
namespace cli {
namespace commands {

/// Execute the 'pull' command
/// @param options Pull options (model name)
/// @return Exit code (0=success, 1=error, 2=connection error)
int pull(const PullOptions& options) {
    auto cfg = loadConfig();
    OllamaClient client(cfg.backend_host, static_cast<uint16_t>(cfg.backend_port));

    std::cout << "pulling " << options.model << std::endl;
    ProgressRenderer renderer(std::cout);
    auto result = client.pullModel(options.model, [&renderer](const std::string& status, uint64_t completed,
                                                              uint64_t total) {
        renderer.update(status, completed, total);
    });

    if (!result.ok()) {
        renderer.fail(result.error_message);
        return result.error == BackendError::ConnectionError ? 2 : 1;
    }
    renderer.complete();
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace infergate
