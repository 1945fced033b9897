#pragma once

#include <cstdint>
#include <functional>
#include <set>
#include <string>

namespace infergate {

/// Finds a free TCP port by probing loopback listeners.
///
/// Availability is only a snapshot: another process may claim the port
/// between the probe and our own bind, so callers bind through
/// bindWithRetry() instead of trusting the result.
class PortNegotiator {
public:
    /// Returns true when something is listening on the port.
    using OccupancyProbe = std::function<bool(uint16_t port)>;

    PortNegotiator();
    explicit PortNegotiator(OccupancyProbe probe);

    /// First free port in [low, high] ascending, skipping `excluded`.
    /// Throws std::invalid_argument for an invalid range and
    /// GatewayError(kPortRangeExhausted) when every port is taken.
    uint16_t findAvailablePort(int low, int high, const std::set<uint16_t>& excluded = {}) const;

    bool isAvailable(uint16_t port) const { return !probe_(port); }

    /// connect() to 127.0.0.1:port; refused (or any failure) means no listener.
    static bool probeLoopback(uint16_t port);

private:
    OccupancyProbe probe_;
};

/// Attempts to bind the chosen port. Returns false when the bind failed.
using BindFunction = std::function<bool(uint16_t port)>;

/// Bind `preferred` (when non-zero) or a negotiated port. A failed bind
/// excludes that port and negotiates again, up to `max_attempts` binds in
/// total. Returns the bound port; throws GatewayError(kPortBindExhausted)
/// when every attempt failed or GatewayError(kPortRangeExhausted) when the
/// range ran out first.
uint16_t bindWithRetry(const PortNegotiator& negotiator,
                       const BindFunction& bind,
                       uint16_t preferred,
                       int low,
                       int high,
                       int max_attempts = 3);

}  // namespace infergate
