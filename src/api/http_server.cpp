#include "api/http_server.h"

#include "api/gateway_endpoints.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include "utils/request_id.h"

namespace infergate {

std::string accessLogLine(const httplib::Request& req, const httplib::Response& res) {
    return req.remote_addr + " " + req.method + " " + req.path + " " + std::to_string(res.status) +
           " request_id=" + res.get_header_value("X-Request-Id");
}

Logger accessLogger() {
    return [](const httplib::Request& req, const httplib::Response& res) {
        spdlog::info("{}", accessLogLine(req, res));
    };
}

HttpServer::HttpServer(GatewayEndpoints& gateway, std::string bind_address)
    : bind_address_(std::move(bind_address)), gateway_(gateway) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::applyCors(httplib::Response& res) {
    if (!res.has_header("Access-Control-Allow-Origin"))
        res.set_header("Access-Control-Allow-Origin", cors_allow_origin_.c_str());
    if (!res.has_header("Access-Control-Allow-Methods"))
        res.set_header("Access-Control-Allow-Methods", cors_allow_methods_.c_str());
    if (!res.has_header("Access-Control-Allow-Headers"))
        res.set_header("Access-Control-Allow-Headers", cors_allow_headers_.c_str());
}

void HttpServer::configure() {
    if (configured_) return;
    configured_ = true;

    // CORS preflight for any path, answered before routing
    server_.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        std::string req_id = req.get_header_value("X-Request-Id");
        if (req_id.empty()) req_id = generate_request_id();
        res.set_header("X-Request-Id", req_id);

        if (req.method == "OPTIONS") {
            applyCors(res);
            res.status = 200;
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });

    server_.set_post_routing_handler([this](const httplib::Request&, httplib::Response& res) {
        applyCors(res);
    });

    // Access log
    if (logger_) {
        server_.set_logger([this](const httplib::Request& req, const httplib::Response& res) {
            logger_(req, res);
        });
    }

    // Error handler (404/others)
    server_.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (!res.body.empty()) {
            // respect existing body set by handlers
            if (!res.has_header("Content-Type")) {
                res.set_header("Content-Type", "text/plain");
            }
            return;
        }
        nlohmann::json body = {
            {"error", res.status == 404 ? "not_found" : "http_error"},
            {"status", res.status},
            {"path", req.path}
        };
        res.set_content(body.dump(), "application/json");
    });

    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "unknown";
        if (ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                what = e.what();
            } catch (...) {
                what = "non-standard exception";
            }
        }
        spdlog::error("Unhandled exception on {} {}: {}", req.method, req.path, what);
        nlohmann::json body = {
            {"error", "internal_error"},
            {"path", req.path},
            {"message", "Internal server error: " + what}
        };
        res.status = 500;
        res.set_content(body.dump(), "application/json");
    });

    gateway_.registerRoutes(server_);
}

bool HttpServer::bind(uint16_t port) {
    if (running_ || isBound()) return false;
    configure();
    if (!server_.bind_to_port(bind_address_, port)) {
        return false;
    }
    port_ = port;
    return true;
}

void HttpServer::start() {
    if (running_ || !isBound()) return;

    running_ = true;
    thread_ = std::thread([this]() {
        if (!server_.listen_after_bind()) {
            spdlog::error("HTTP server on port {} stopped listening", port_);
        }
    });
    for (int i = 0; i < 500 && !server_.is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void HttpServer::stop() {
    if (!running_) return;
    server_.stop();
    if (thread_.joinable()) thread_.join();
    running_ = false;
}

}  // namespace infergate
