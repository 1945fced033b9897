#include "net/listening_ports.h"

#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <string>

namespace infergate {

std::set<uint16_t> parseProcNetTcp(std::istream& in) {
    std::set<uint16_t> ports;
    std::string line;
    std::getline(in, line);  // header
    while (std::getline(in, line)) {
        std::istringstream iss(line);
        std::string slot, local, remote, state;
        if (!(iss >> slot >> local >> remote >> state)) continue;
        if (state != "0A") continue;
        auto colon = local.rfind(':');
        if (colon == std::string::npos) continue;
        unsigned long port = std::strtoul(local.c_str() + colon + 1, nullptr, 16);
        if (port > 0 && port <= 65535) ports.insert(static_cast<uint16_t>(port));
    }
    return ports;
}

std::set<uint16_t> listListeningPorts() {
    std::set<uint16_t> ports;
    for (const char* table : {"/proc/net/tcp", "/proc/net/tcp6"}) {
        std::ifstream in(table);
        if (!in.is_open()) continue;
        auto found = parseProcNetTcp(in);
        ports.insert(found.begin(), found.end());
    }
    return ports;
}

}  // namespace infergate
