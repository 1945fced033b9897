#pragma once

#include <httplib.h>
#include <cstdint>
#include <thread>
#include <atomic>
#include <functional>
#include <string>
#include <utility>

namespace infergate {

class GatewayEndpoints;

using Logger = std::function<void(const httplib::Request&, const httplib::Response&)>;

/// One access-log line, carrying the X-Request-Id returned to the caller.
std::string accessLogLine(const httplib::Request& req, const httplib::Response& res);

/// Logger that writes accessLogLine() at info level.
Logger accessLogger();

class HttpServer {
public:
    explicit HttpServer(GatewayEndpoints& gateway, std::string bind_address = "0.0.0.0");
    ~HttpServer();

    /// Bind the listening socket. Returns false when the port is taken;
    /// may be called again with another port after a failure.
    bool bind(uint16_t port);

    /// Serve on a background thread. bind() must have succeeded.
    void start();
    void stop();

    // Must be set before bind()
    void setLogger(Logger logger) { logger_ = std::move(logger); }

    int port() const { return port_; }
    bool isBound() const { return port_ > 0; }

private:
    void configure();
    void applyCors(httplib::Response& res);

    int port_{0};
    std::string bind_address_;
    GatewayEndpoints& gateway_;
    httplib::Server server_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    bool configured_{false};
    const std::string cors_allow_origin_{"*"};
    const std::string cors_allow_methods_{"GET, POST, OPTIONS"};
    const std::string cors_allow_headers_{"Content-Type"};
    Logger logger_{};
};

}  // namespace infergate
