#include <gtest/gtest.h>
#include <set>
#include <stdexcept>
#include <vector>

#include "core/gateway_error.h"
#include "net/port_negotiator.h"

using namespace infergate;

TEST(PortNegotiatorTest, ReturnsFirstFreePortAscending) {
    std::set<uint16_t> occupied = {11000, 11001, 11003};
    PortNegotiator negotiator([&](uint16_t p) { return occupied.count(p) > 0; });
    EXPECT_EQ(negotiator.findAvailablePort(11000, 12000), 11002);
}

TEST(PortNegotiatorTest, SkipsExcludedPorts) {
    PortNegotiator negotiator([](uint16_t) { return false; });
    EXPECT_EQ(negotiator.findAvailablePort(11000, 11005, {11000, 11001}), 11002);
}

TEST(PortNegotiatorTest, ThrowsWhenRangeExhausted) {
    PortNegotiator negotiator([](uint16_t) { return true; });
    try {
        negotiator.findAvailablePort(11000, 11010);
        FAIL() << "expected GatewayError";
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kPortRangeExhausted);
    }
}

TEST(PortNegotiatorTest, RejectsInvalidRange) {
    PortNegotiator negotiator([](uint16_t) { return false; });
    EXPECT_THROW(negotiator.findAvailablePort(12000, 11000), std::invalid_argument);
    EXPECT_THROW(negotiator.findAvailablePort(0, 10), std::invalid_argument);
}

TEST(PortNegotiatorTest, SinglePortRange) {
    PortNegotiator negotiator([](uint16_t) { return false; });
    EXPECT_EQ(negotiator.findAvailablePort(11500, 11500), 11500);
}

TEST(BindWithRetryTest, UsesPreferredPortWhenBindable) {
    PortNegotiator negotiator([](uint16_t) { return false; });
    std::vector<uint16_t> tried;
    auto port = bindWithRetry(negotiator, [&](uint16_t p) {
        tried.push_back(p);
        return true;
    }, 11500, 11000, 12000);
    EXPECT_EQ(port, 11500);
    EXPECT_EQ(tried, (std::vector<uint16_t>{11500}));
}

TEST(BindWithRetryTest, RenegotiatesAfterLostRace) {
    // the probe says free, but another process grabs 11000 before we bind
    PortNegotiator negotiator([](uint16_t) { return false; });
    std::vector<uint16_t> tried;
    auto port = bindWithRetry(negotiator, [&](uint16_t p) {
        tried.push_back(p);
        return p != 11000;
    }, 0, 11000, 12000);
    EXPECT_EQ(port, 11001);
    EXPECT_EQ(tried, (std::vector<uint16_t>{11000, 11001}));
}

TEST(BindWithRetryTest, GivesUpAfterThreeAttempts) {
    PortNegotiator negotiator([](uint16_t) { return false; });
    int attempts = 0;
    try {
        bindWithRetry(negotiator, [&](uint16_t) {
            ++attempts;
            return false;
        }, 11500, 11000, 12000);
        FAIL() << "expected GatewayError";
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kPortBindExhausted);
    }
    EXPECT_EQ(attempts, 3);
}

TEST(BindWithRetryTest, RangeExhaustionSurfacesBeforeAttemptLimit) {
    PortNegotiator negotiator([](uint16_t) { return false; });
    try {
        bindWithRetry(negotiator, [](uint16_t) { return false; }, 0, 11000, 11000);
        FAIL() << "expected GatewayError";
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kPortRangeExhausted);
    }
}

TEST(PortNegotiatorTest, LoopbackProbeSeesNoListenerOnClosedPort) {
    // port 1 is privileged and never listened on in the test environment
    EXPECT_FALSE(PortNegotiator::probeLoopback(1));
}
