#pragma once

#include <iosfwd>
#include <memory>

#include "diagnostics/diagnostics_aggregator.h"
#include "diagnostics/remediation.h"

namespace infergate {

/// Numbered troubleshooting menu. Read-only entries run diagnostics;
/// disruptive ones go through Remediator and need a `y`.
class InteractiveDoctor {
public:
    enum class Choice {
        Exit = 0,
        QuickStatus = 1,
        FullDiagnosis = 2,
        Connectivity = 3,
        Benchmark = 4,
        RestartFailing = 5,
        CleanLogs = 6,
        DetailedStatus = 7,
        RestartAll = 8,
        ClearModelCache = 9,
    };

    InteractiveDoctor(GatewayConfig config, std::shared_ptr<Supervisor> supervisor, DiagnosticsOptions options,
                      std::istream& in, std::ostream& out);

    /// Loop until Exit or end of input. Returns 0.
    int run();

    /// Execute one menu entry; false for Exit.
    bool handle(Choice choice);

    void printMenu() const;

private:
    void quickStatus();
    void runChecks(const std::vector<std::string>& categories, bool benchmark);
    void detailedStatus();

    GatewayConfig config_;
    std::shared_ptr<Supervisor> supervisor_;
    DiagnosticsOptions options_;
    std::istream& in_;
    std::ostream& out_;
    Remediator remediator_;
};

}  // namespace infergate
