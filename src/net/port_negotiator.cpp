#include "net/port_negotiator.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>

#include "core/gateway_error.h"

namespace infergate {

PortNegotiator::PortNegotiator() : probe_(&PortNegotiator::probeLoopback) {}

PortNegotiator::PortNegotiator(OccupancyProbe probe) : probe_(std::move(probe)) {}

bool PortNegotiator::probeLoopback(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return false;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    const bool connected = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    ::close(fd);
    return connected;
}

uint16_t PortNegotiator::findAvailablePort(int low, int high, const std::set<uint16_t>& excluded) const {
    if (low < 1 || high > 65535 || low > high) {
        throw std::invalid_argument("invalid port range " + std::to_string(low) + "-" + std::to_string(high));
    }
    for (int p = low; p <= high; ++p) {
        const auto port = static_cast<uint16_t>(p);
        if (excluded.count(port) > 0) continue;
        if (!probe_(port)) {
            return port;
        }
    }
    throw GatewayError(ErrorCode::kPortRangeExhausted,
                       "no free port in range " + std::to_string(low) + "-" + std::to_string(high));
}

uint16_t bindWithRetry(const PortNegotiator& negotiator,
                       const BindFunction& bind,
                       uint16_t preferred,
                       int low,
                       int high,
                       int max_attempts) {
    std::set<uint16_t> failed;
    uint16_t candidate = preferred;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        if (candidate == 0) {
            candidate = negotiator.findAvailablePort(low, high, failed);
        }
        if (bind(candidate)) {
            if (attempt > 1) {
                spdlog::info("Bound port {} after {} attempts", candidate, attempt);
            }
            return candidate;
        }
        spdlog::warn("Bind to port {} failed (attempt {}/{})", candidate, attempt, max_attempts);
        failed.insert(candidate);
        candidate = 0;
    }
    throw GatewayError(ErrorCode::kPortBindExhausted,
                       "could not bind a port after " + std::to_string(max_attempts) + " attempts");
}

}  // namespace infergate
