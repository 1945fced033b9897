#include <iostream>
#include <memory>
#include <signal.h>
#include <thread>
#include <chrono>
#include <string>
#include <unistd.h>
#include <spdlog/spdlog.h>

#include "api/gateway_endpoints.h"
#include "api/http_server.h"
#include "core/gateway_error.h"
#include "net/port_negotiator.h"
#include "runtime/state.h"
#include "utils/cli.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/version.h"
#include "cli/commands.h"

int run_gateway(const infergate::GatewayConfig& cfg, uint16_t persisted_port) {
    infergate::g_running_flag.store(true);

    bool server_started = false;
    const auto state_path = infergate::gatewayStatePath();

    try {
        infergate::logger::init_from_env("gateway");

        infergate::TranslatorOptions translator;
        translator.model_identifier = cfg.model_identifier;
        translator.backend_host = cfg.backend_host;
        translator.backend_port = static_cast<uint16_t>(cfg.backend_port);
        spdlog::info("Model: {} via Ollama at {}:{}", translator.model_identifier, translator.backend_host,
                     translator.backend_port);

        infergate::GatewayEndpoints gateway(translator);
        infergate::HttpServer server(gateway, cfg.bind_address.empty() ? std::string("0.0.0.0") : cfg.bind_address);
        server.setLogger(infergate::accessLogger());

        infergate::PortNegotiator negotiator;
        const uint16_t port = infergate::bindWithRetry(
            negotiator, [&server](uint16_t p) { return server.bind(p); }, static_cast<uint16_t>(cfg.gateway_port),
            cfg.port_range_low, cfg.port_range_high);

        if (persisted_port != 0 && port != persisted_port) {
            spdlog::warn("{}: bound port {} differs from assigned port {}",
                         infergate::to_string(infergate::ErrorCode::kConfigDrift), port, persisted_port);
            spdlog::warn("Free port {} or run 'infergate setup --force' to reassign", persisted_port);
        } else if (persisted_port == 0) {
            spdlog::warn("No port assignment found; serving on negotiated port {} (run 'infergate setup')", port);
        }

        server.start();
        server_started = true;

        infergate::writeGatewayRuntimeRecord(state_path, {getpid(), port, cfg.model_identifier});
        spdlog::info("Gateway listening on {}:{}", cfg.bind_address, port);
        std::cout << "Gateway ready on port " << port << std::endl;

        while (infergate::is_running()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        std::cout << "Shutting down..." << std::endl;
        server.stop();
        infergate::removeGatewayRuntimeRecord(state_path);
    } catch (const infergate::GatewayError& e) {
        spdlog::error("{}: {}", infergate::to_string(e.code()), e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        if (server_started) {
            infergate::removeGatewayRuntimeRecord(state_path);
        }
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        if (server_started) {
            infergate::removeGatewayRuntimeRecord(state_path);
        }
        return 1;
    }

    std::cout << "Gateway shutdown complete" << std::endl;
    return 0;
}

void signalHandler(int /*signal*/) {
    infergate::request_shutdown();
}

int main(int argc, char* argv[]) {
    // Parse CLI arguments first
    auto cli_result = infergate::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        if (cli_result.exit_code == 0) {
            std::cout << cli_result.output;
        } else {
            std::cerr << cli_result.output;
        }
        return cli_result.exit_code;
    }

    if (cli_result.subcommand != infergate::Subcommand::Serve) {
        infergate::logger::init_from_env("cli", /*with_file=*/false);
    }

    // Branch based on subcommand
    switch (cli_result.subcommand) {
        case infergate::Subcommand::Serve: {
            signal(SIGINT, signalHandler);
            signal(SIGTERM, signalHandler);

            std::cout << "infergate v" << INFERGATE_VERSION << " starting..." << std::endl;
            auto cfg = infergate::cli::commands::loadConfig();
            // drift is judged against the file, not against INFERGATE_PORT or --port
            const auto persisted = infergate::readPortAssignment(infergate::configPath());
            const auto persisted_port = static_cast<uint16_t>(persisted ? persisted->port : 0);
            if (cli_result.serve_options.port) {
                cfg.gateway_port = *cli_result.serve_options.port;
            }
            if (!cli_result.serve_options.host.empty()) {
                cfg.bind_address = cli_result.serve_options.host;
            }
            return run_gateway(cfg, persisted_port);
        }

        case infergate::Subcommand::Setup:
            return infergate::cli::commands::setup(cli_result.setup_options);

        case infergate::Subcommand::Start:
            return infergate::cli::commands::start(cli_result.unit_options);

        case infergate::Subcommand::Stop:
            return infergate::cli::commands::stop(cli_result.unit_options);

        case infergate::Subcommand::Restart:
            return infergate::cli::commands::restart(cli_result.unit_options);

        case infergate::Subcommand::Status:
            return infergate::cli::commands::status();

        case infergate::Subcommand::Logs:
            return infergate::cli::commands::logs(cli_result.logs_options);

        case infergate::Subcommand::Test:
            return infergate::cli::commands::test();

        case infergate::Subcommand::Models:
            return infergate::cli::commands::models();

        case infergate::Subcommand::Pull:
            return infergate::cli::commands::pull(cli_result.pull_options);

        case infergate::Subcommand::Ports:
            return infergate::cli::commands::ports();

        case infergate::Subcommand::Doctor:
            return infergate::cli::commands::doctor(cli_result.doctor_options);

        case infergate::Subcommand::None:
        default:
            std::cerr << infergate::getHelpMessage();
            return 1;
    }
}
