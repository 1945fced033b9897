// Calls the gateway health endpoint

#include "cli/commands.h"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace infergate {
namespace cli {
namespace commands {

int test() {
    auto cfg = loadConfig();
    if (!cfg.hasPortAssignment()) {
        std::cerr << "Error: no gateway port assigned (run: infergate setup)" << std::endl;
        return 1;
    }

    httplib::Client client("127.0.0.1", cfg.gateway_port);
    client.set_connection_timeout(5, 0);
    client.set_read_timeout(5, 0);

    std::cout << "Testing gateway on port " << cfg.gateway_port << "..." << std::endl;
    auto res = client.Get("/health");
    if (!res) {
        std::cerr << "Error: Could not connect to gateway: " << httplib::to_string(res.error()) << std::endl;
        std::cerr << "Start it with: infergate start gateway" << std::endl;
        return 2;
    }

    auto body = nlohmann::json::parse(res->body, nullptr, false);
    if (body.is_discarded()) {
        std::cout << res->body << std::endl;
    } else {
        std::cout << body.dump(2) << std::endl;
    }
    return res->status == 200 ? 0 : 1;
}

}  // namespace commands
}  // namespace cli
}  // namespace infergate
