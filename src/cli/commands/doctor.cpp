#include "cli/commands.h"
#include "diagnostics/diagnostics_aggregator.h"
#include "diagnostics/interactive_doctor.h"
#include <iostream>

namespace infergate {
namespace cli {
namespace commands {

int doctor(const DoctorOptions& options) {
    auto cfg = loadConfig();
    auto supervisor = makeSupervisor(cfg);

    DiagnosticsOptions diag;
    diag.run_benchmark = options.benchmark;

    if (!options.auto_mode) {
        InteractiveDoctor menu(cfg, supervisor, diag, std::cin, std::cout);
        return menu.run();
    }

    auto report = buildStandardDiagnostics(cfg, supervisor, diag).run();
    if (options.json) {
        std::cout << report.toJson().dump(2) << std::endl;
    } else {
        std::cout << renderReport(report);
    }
    return report.healthy() ? 0 : 1;
}

}  // namespace commands
}  // namespace cli
}  // namespace infergate
