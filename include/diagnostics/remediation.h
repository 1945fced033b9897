#pragma once

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>

#include "supervisor/supervisor.h"
#include "utils/config.h"

namespace infergate {

/// Asks the operator a yes/no question; true only for an explicit yes.
using Confirmer = std::function<bool(const std::string& question)>;

/// Confirmer that prompts on `out` and accepts only "y" or "Y" from `in`.
Confirmer streamConfirmer(std::istream& in, std::ostream& out);

/// Disruptive repair actions. Each one asks first and does nothing
/// unless the operator confirms.
class Remediator {
public:
    Remediator(std::shared_ptr<Supervisor> supervisor, GatewayConfig config, Confirmer confirm, std::ostream& out);

    /// Restart every unit that is not running. Returns false when a
    /// restart failed or the operator declined.
    bool restartFailing();
    bool restartAll();

    /// Keep the last keep_lines lines of every log under the log directory.
    bool cleanLogs(size_t keep_lines = 1000);

    /// Delete the contents of the model cache directory.
    bool clearModelCache();

private:
    bool report(const std::vector<UnitResult>& results);

    std::shared_ptr<Supervisor> supervisor_;
    GatewayConfig config_;
    Confirmer confirm_;
    std::ostream& out_;
};

}  // namespace infergate
