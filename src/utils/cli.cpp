// CLI argument parser for the gateway and supervisor subcommands
#include "utils/cli.h"
#include "utils/version.h"
#include <sstream>
#include <cctype>
#include <cstring>
#include <cstdlib>
#include <stdexcept>
#include <vector>

namespace infergate {

// Forward declarations for help messages
std::string getServeHelpMessage();
std::string getSetupHelpMessage();
std::string getUnitHelpMessage(const char* verb);
std::string getLogsHelpMessage();
std::string getPullHelpMessage();
std::string getDoctorHelpMessage();
std::string getSimpleHelpMessage(const char* command, const char* summary);

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "infergate " << INFERGATE_VERSION << " - local inference gateway and service supervisor\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    infergate <COMMAND>\n";
    oss << "\n";
    oss << "COMMANDS:\n";
    oss << "    setup      Assign the gateway port and model\n";
    oss << "    serve      Run the gateway (foreground)\n";
    oss << "    start      Start services\n";
    oss << "    stop       Stop services\n";
    oss << "    status     Show service status\n";
    oss << "    restart    Restart services\n";
    oss << "    logs       Show recent service logs\n";
    oss << "    test       Query the gateway health endpoint\n";
    oss << "    models     List models installed in Ollama\n";
    oss << "    pull       Download a model into Ollama\n";
    oss << "    ports      List listening TCP ports\n";
    oss << "    doctor     Diagnose and repair the installation\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -h, --help       Print help information\n";
    oss << "    -V, --version    Print version information\n";
    oss << "\n";
    oss << "Run 'infergate <COMMAND> --help' for more info.\n";
    return oss.str();
}

std::string getServeHelpMessage() {
    std::ostringstream oss;
    oss << "infergate serve - Run the gateway\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    infergate serve [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --port <PORT>         Listen port (default: the port assigned by setup)\n";
    oss << "    --host <HOST>         Bind address (default: 0.0.0.0)\n";
    oss << "    -h, --help            Print help\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    INFERGATE_CONFIG          Config file path (default: ~/.infergate/config)\n";
    oss << "    INFERGATE_MODEL           Model identifier\n";
    oss << "    INFERGATE_PORT            Gateway port\n";
    oss << "    INFERGATE_BACKEND_HOST    Ollama host (default: 127.0.0.1)\n";
    oss << "    INFERGATE_BACKEND_PORT    Ollama port (default: 11434)\n";
    oss << "    INFERGATE_LOG_LEVEL       Log level (trace|debug|info|warn|error)\n";
    oss << "    INFERGATE_LOG_DIR         Log directory (default: ~/.infergate/logs)\n";
    return oss.str();
}

std::string getSetupHelpMessage() {
    std::ostringstream oss;
    oss << "infergate setup - Assign the gateway port and model\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    infergate setup [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --port <PORT>     Use this port instead of negotiating one in 11000-12000\n";
    oss << "    --model <NAME>    Model identifier (default: llama3.2:1b)\n";
    oss << "    --force           Replace an existing assignment\n";
    oss << "    -h, --help        Print help\n";
    return oss.str();
}

std::string getUnitHelpMessage(const char* verb) {
    std::ostringstream oss;
    oss << "infergate " << verb << " - " << static_cast<char>(std::toupper(static_cast<unsigned char>(verb[0]))) << (verb + 1) << " services\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    infergate " << verb << " [UNIT]" << (std::strcmp(verb, "stop") == 0 ? " [--force]" : "") << "\n";
    oss << "\n";
    oss << "ARGUMENTS:\n";
    oss << "    [UNIT]           daemon, gateway or worker (default: all)\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    if (std::strcmp(verb, "stop") == 0) {
        oss << "    --force          Kill processes that ignore the graceful stop\n";
    }
    oss << "    -h, --help       Print help\n";
    return oss.str();
}

std::string getLogsHelpMessage() {
    std::ostringstream oss;
    oss << "infergate logs - Show recent service logs\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    infergate logs [--lines N]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --lines <N>      Lines per log (default: 20)\n";
    oss << "    -h, --help       Print help\n";
    return oss.str();
}

std::string getPullHelpMessage() {
    std::ostringstream oss;
    oss << "infergate pull - Download a model into Ollama\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    infergate pull <MODEL>\n";
    oss << "\n";
    oss << "ARGUMENTS:\n";
    oss << "    <MODEL>          Model name (e.g., llama3.2:1b)\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -h, --help       Print help\n";
    return oss.str();
}

std::string getDoctorHelpMessage() {
    std::ostringstream oss;
    oss << "infergate doctor - Diagnose and repair the installation\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    infergate doctor [OPTIONS]\n";
    oss << "\n";
    oss << "Without --auto an interactive menu is shown. Actions that restart\n";
    oss << "services or delete data ask for confirmation first.\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --auto           Run every check once and exit (read-only)\n";
    oss << "    --benchmark      Include the throughput benchmark (with --auto)\n";
    oss << "    --json           Print the report as JSON (with --auto)\n";
    oss << "    -h, --help       Print help\n";
    return oss.str();
}

std::string getSimpleHelpMessage(const char* command, const char* summary) {
    std::ostringstream oss;
    oss << "infergate " << command << " - " << summary << "\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    infergate " << command << "\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -h, --help       Print help\n";
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "infergate " << INFERGATE_VERSION << "\n";
    return oss.str();
}

// Helper to check for help flag in arguments
bool hasHelpFlag(int argc, char* argv[], int start) {
    for (int i = start; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            return true;
        }
    }
    return false;
}

namespace {

CliResult usageError(CliResult result, const std::string& message, const std::string& usage) {
    result.should_exit = true;
    result.exit_code = 1;
    result.output = "Error: " + message + "\n\nUsage: " + usage + "\n";
    return result;
}

bool parsePortArg(const char* text, uint16_t& out) {
    try {
        size_t pos = 0;
        int v = std::stoi(text, &pos);
        if (text[pos] != '\0' || v < 1 || v > 65535) return false;
        out = static_cast<uint16_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool isUnitName(const char* text) {
    return std::strcmp(text, "daemon") == 0 || std::strcmp(text, "gateway") == 0 ||
           std::strcmp(text, "worker") == 0;
}

}  // namespace

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;

    // No arguments - show help
    if (argc < 2) {
        result.should_exit = true;
        result.exit_code = 1;
        result.subcommand = Subcommand::None;
        result.output = getHelpMessage();
        return result;
    }

    const char* command = argv[1];

    // Global help and version
    if (std::strcmp(command, "-h") == 0 || std::strcmp(command, "--help") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getHelpMessage();
        return result;
    }

    if (std::strcmp(command, "-V") == 0 || std::strcmp(command, "--version") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getVersionMessage();
        return result;
    }

    if (std::strcmp(command, "serve") == 0) {
        result.subcommand = Subcommand::Serve;

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getServeHelpMessage();
            return result;
        }

        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
                uint16_t port = 0;
                if (!parsePortArg(argv[++i], port)) {
                    return usageError(result, std::string("invalid port '") + argv[i] + "'",
                                      "infergate serve [--port <PORT>]");
                }
                result.serve_options.port = port;
            } else if (std::strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
                result.serve_options.host = argv[++i];
            }
        }
        return result;
    }

    if (std::strcmp(command, "setup") == 0) {
        result.subcommand = Subcommand::Setup;

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getSetupHelpMessage();
            return result;
        }

        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--force") == 0) {
                result.setup_options.force = true;
            } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
                if (!parsePortArg(argv[++i], result.setup_options.port)) {
                    return usageError(result, std::string("invalid port '") + argv[i] + "'",
                                      "infergate setup [--port <PORT>]");
                }
            } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
                result.setup_options.model = argv[++i];
            }
        }
        return result;
    }

    if (std::strcmp(command, "start") == 0 || std::strcmp(command, "stop") == 0 ||
        std::strcmp(command, "restart") == 0) {
        if (std::strcmp(command, "start") == 0) {
            result.subcommand = Subcommand::Start;
        } else if (std::strcmp(command, "stop") == 0) {
            result.subcommand = Subcommand::Stop;
        } else {
            result.subcommand = Subcommand::Restart;
        }

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getUnitHelpMessage(command);
            return result;
        }

        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--force") == 0 && result.subcommand == Subcommand::Stop) {
                result.unit_options.force = true;
            } else if (argv[i][0] != '-' && result.unit_options.unit.empty()) {
                if (!isUnitName(argv[i])) {
                    return usageError(result, std::string("unknown unit '") + argv[i] + "'",
                                      std::string("infergate ") + command + " [daemon|gateway|worker]");
                }
                result.unit_options.unit = argv[i];
            }
        }
        return result;
    }

    if (std::strcmp(command, "logs") == 0) {
        result.subcommand = Subcommand::Logs;

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getLogsHelpMessage();
            return result;
        }

        for (int i = 2; i < argc; ++i) {
            if ((std::strcmp(argv[i], "--lines") == 0 || std::strcmp(argv[i], "-n") == 0) && i + 1 < argc) {
                const char* value = argv[++i];
                char* end = nullptr;
                long n = std::strtol(value, &end, 10);
                if (end == value || *end != '\0' || n <= 0) {
                    return usageError(result, std::string("invalid line count '") + value + "'",
                                      "infergate logs [--lines N]");
                }
                result.logs_options.lines = static_cast<size_t>(n);
            }
        }
        return result;
    }

    if (std::strcmp(command, "pull") == 0) {
        result.subcommand = Subcommand::Pull;

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getPullHelpMessage();
            return result;
        }

        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                result.pull_options.model = argv[i];
                break;
            }
        }

        // Model name is required
        if (result.pull_options.model.empty()) {
            return usageError(result, "model name required", "infergate pull <MODEL>");
        }
        return result;
    }

    if (std::strcmp(command, "doctor") == 0) {
        result.subcommand = Subcommand::Doctor;

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getDoctorHelpMessage();
            return result;
        }

        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--auto") == 0) {
                result.doctor_options.auto_mode = true;
            } else if (std::strcmp(argv[i], "--benchmark") == 0) {
                result.doctor_options.benchmark = true;
            } else if (std::strcmp(argv[i], "--json") == 0) {
                result.doctor_options.json = true;
            }
        }
        return result;
    }

    struct Simple {
        const char* name;
        Subcommand subcommand;
        const char* summary;
    };
    static const Simple kSimpleCommands[] = {
        {"status", Subcommand::Status, "Show service status"},
        {"test", Subcommand::Test, "Query the gateway health endpoint"},
        {"models", Subcommand::Models, "List models installed in Ollama"},
        {"ports", Subcommand::Ports, "List listening TCP ports"},
    };
    for (const auto& simple : kSimpleCommands) {
        if (std::strcmp(command, simple.name) != 0) continue;
        result.subcommand = simple.subcommand;
        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getSimpleHelpMessage(simple.name, simple.summary);
        }
        return result;
    }

    // Check for unknown flags (starting with - or --)
    if (command[0] == '-') {
        result.should_exit = true;
        result.exit_code = 1;
        std::ostringstream oss;
        oss << "Unknown option: " << command << "\n\n";
        oss << getHelpMessage();
        result.output = oss.str();
        return result;
    }

    // Unknown command
    result.should_exit = true;
    result.exit_code = 1;
    std::ostringstream oss;
    oss << "Unknown command: " << command << "\n\n";
    oss << getHelpMessage();
    result.output = oss.str();
    return result;
}

std::string subcommandToString(Subcommand subcommand) {
    switch (subcommand) {
        case Subcommand::None: return "none";
        case Subcommand::Serve: return "serve";
        case Subcommand::Setup: return "setup";
        case Subcommand::Start: return "start";
        case Subcommand::Stop: return "stop";
        case Subcommand::Status: return "status";
        case Subcommand::Restart: return "restart";
        case Subcommand::Logs: return "logs";
        case Subcommand::Test: return "test";
        case Subcommand::Models: return "models";
        case Subcommand::Pull: return "pull";
        case Subcommand::Ports: return "ports";
        case Subcommand::Doctor: return "doctor";
        default: return "unknown";
    }
}

}  // namespace infergate
