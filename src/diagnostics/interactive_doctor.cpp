#include "diagnostics/interactive_doctor.h"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <string>
#include <utility>

#include "backend/ollama_client.h"
#include "net/listening_ports.h"
#include "utils/logger.h"

namespace infergate {

InteractiveDoctor::InteractiveDoctor(GatewayConfig config, std::shared_ptr<Supervisor> supervisor,
                                     DiagnosticsOptions options, std::istream& in, std::ostream& out)
    : config_(std::move(config)),
      supervisor_(std::move(supervisor)),
      options_(std::move(options)),
      in_(in),
      out_(out),
      remediator_(supervisor_, config_, streamConfirmer(in, out), out) {}

void InteractiveDoctor::printMenu() const {
    out_ << "\n";
    out_ << "==============================================\n";
    out_ << "         infergate troubleshooter\n";
    out_ << "==============================================\n";
    out_ << "1. Quick status check\n";
    out_ << "2. Full system diagnosis\n";
    out_ << "3. Test connectivity\n";
    out_ << "4. Performance benchmark\n";
    out_ << "5. Restart failing services\n";
    out_ << "6. Clean logs\n";
    out_ << "7. Detailed status\n";
    out_ << "8. Restart all services\n";
    out_ << "9. Clear model cache\n";
    out_ << "0. Exit\n";
    out_ << "\n";
    out_ << "Choose option (0-9): " << std::flush;
}

int InteractiveDoctor::run() {
    std::string line;
    for (;;) {
        printMenu();
        if (!std::getline(in_, line)) {
            out_ << "\n";
            return 0;
        }
        line.erase(std::remove_if(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); }),
                   line.end());
        if (line.size() != 1 || line[0] < '0' || line[0] > '9') {
            out_ << "Invalid option. Please try again.\n";
            continue;
        }
        if (!handle(static_cast<Choice>(line[0] - '0'))) {
            out_ << "Goodbye!\n";
            return 0;
        }
    }
}

bool InteractiveDoctor::handle(Choice choice) {
    switch (choice) {
        case Choice::Exit:
            return false;
        case Choice::QuickStatus:
            quickStatus();
            break;
        case Choice::FullDiagnosis:
            runChecks({}, false);
            break;
        case Choice::Connectivity:
            runChecks({"connectivity"}, false);
            break;
        case Choice::Benchmark:
            runChecks({"performance"}, true);
            break;
        case Choice::RestartFailing:
            remediator_.restartFailing();
            break;
        case Choice::CleanLogs:
            remediator_.cleanLogs();
            break;
        case Choice::DetailedStatus:
            detailedStatus();
            break;
        case Choice::RestartAll:
            remediator_.restartAll();
            break;
        case Choice::ClearModelCache:
            remediator_.clearModelCache();
            break;
    }
    return true;
}

void InteractiveDoctor::quickStatus() {
    out_ << "\n=== Service status ===\n";
    for (const auto& s : supervisor_->statusAll()) {
        out_ << (s.running() ? "[ OK ] " : "[FAIL] ") << s.name << ": " << to_string(s.state);
        if (!s.detail.empty()) out_ << " (" << s.detail << ")";
        out_ << "\n";
    }
}

void InteractiveDoctor::runChecks(const std::vector<std::string>& categories, bool benchmark) {
    auto options = options_;
    options.run_benchmark = benchmark;
    auto full = buildStandardDiagnostics(config_, supervisor_, options);

    DiagnosticsAggregator aggregator(options.check_deadline);
    for (const auto& check : full.checks()) {
        if (categories.empty() ||
            std::find(categories.begin(), categories.end(), check.category) != categories.end()) {
            aggregator.addCheck(check);
        }
    }
    out_ << "\n" << renderReport(aggregator.run());
}

void InteractiveDoctor::detailedStatus() {
    out_ << "\n=== Listening ports ===\n";
    const auto ports = listListeningPorts();
    auto show_port = [&](const std::string& label, int port) {
        if (port <= 0) {
            out_ << "  " << label << ": not assigned\n";
            return;
        }
        const bool up = ports.count(static_cast<uint16_t>(port)) > 0;
        out_ << "  " << label << " " << port << ": " << (up ? "listening" : "not listening") << "\n";
    };
    show_port("ollama", config_.backend_port);
    show_port("gateway", config_.gateway_port);

    out_ << "\n=== Recent logs ===\n";
    for (auto kind : supervisor_->kinds()) {
        auto* unit = supervisor_->unit(kind);
        out_ << "--- " << unit->name() << " (" << unit->logPath() << ") ---\n";
        auto lines = logger::tail_lines(unit->logPath(), 5);
        if (lines.empty()) out_ << "  (no log)\n";
        for (const auto& l : lines) out_ << "  " << l << "\n";
    }

    out_ << "\n=== Installed models ===\n";
    OllamaClient client(config_.backend_host, static_cast<uint16_t>(config_.backend_port));
    auto models = client.listModels(options_.backend_timeout);
    if (!models.ok()) {
        out_ << "  unavailable: " << models.error_message << "\n";
    } else if (models.data) {
        for (const auto& m : parseModelList(*models.data)) {
            out_ << "  " << (m.name.empty() ? "unknown" : m.name) << "\n";
        }
    }

    if (supervisor_->has(UnitKind::ContainerWorker)) {
        out_ << "\n=== Container worker ===\n";
        auto s = supervisor_->status(UnitKind::ContainerWorker);
        out_ << "  " << s.detail << "\n";
    }
}

}  // namespace infergate
