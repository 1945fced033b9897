#pragma once

#include <cstdint>
#include <istream>
#include <set>

namespace infergate {

/// Ports in LISTEN state (0A) from a /proc/net/tcp style table.
std::set<uint16_t> parseProcNetTcp(std::istream& in);

/// Listening TCP ports of this host, IPv4 and IPv6 combined.
std::set<uint16_t> listListeningPorts();

}  // namespace infergate
