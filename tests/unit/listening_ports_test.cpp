#include <gtest/gtest.h>
#include <sstream>

#include "net/listening_ports.h"

using namespace infergate;

TEST(ListeningPortsTest, ParsesListenEntriesOnly) {
    std::istringstream in(
        "  sl  local_address rem_address   st tx_queue rx_queue tr tm->when retrnsmt   uid  timeout inode\n"
        "   0: 0100007F:2CAA 00000000:0000 0A 00000000:00000000 00:00000000 00000000   998        0 1 1\n"
        "   1: 00000000:2AF8 00000000:0000 0A 00000000:00000000 00:00000000 00000000     0        0 2 1\n"
        "   2: 0100007F:2CAA 0100007F:D0E2 01 00000000:00000000 00:00000000 00000000   998        0 3 1\n");
    auto ports = parseProcNetTcp(in);
    EXPECT_EQ(ports, (std::set<uint16_t>{11434, 11000}));
}

TEST(ListeningPortsTest, ParsesIpv6Table) {
    std::istringstream in(
        "  sl  local_address                         remote_address                        st\n"
        "   0: 00000000000000000000000000000000:1F90 00000000000000000000000000000000:0000 0A 0 0\n");
    EXPECT_EQ(parseProcNetTcp(in), (std::set<uint16_t>{8080}));
}

TEST(ListeningPortsTest, EmptyOrMalformedInput) {
    std::istringstream empty("");
    EXPECT_TRUE(parseProcNetTcp(empty).empty());

    std::istringstream junk("header\ngarbage line\n");
    EXPECT_TRUE(parseProcNetTcp(junk).empty());
}
