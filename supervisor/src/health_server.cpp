#include "health_server.hpp"
#include <spdlog/spdlog.h>

HealthServer::HealthServer(const Config& config, HealthService& service)
    : config_(config)
    , service_(service)
    , server_(std::make_unique<httplib::Server>())
{}

HealthServer::~HealthServer() {
    stop();
}

bool HealthServer::start() {
    if (running_) return true;
    
    setup_routes();
    
    // Port 0 picks an ephemeral port
    if (config_.listen_port == 0) {
        port_ = server_->bind_to_any_port(config_.listen_addr.c_str());
    } else if (server_->bind_to_port(config_.listen_addr.c_str(), config_.listen_port)) {
        port_ = config_.listen_port;
    } else {
        port_ = -1;
    }
    
    if (port_ <= 0) {
        spdlog::error("Failed to bind HTTP server to {}:{}",
                      config_.listen_addr, config_.listen_port);
        return false;
    }
    
    running_ = true;
    server_thread_ = std::thread([this]() {
        spdlog::info("Starting health server on {}:{}", config_.listen_addr, port_);
        if (!server_->listen_after_bind()) {
            spdlog::error("Health server stopped listening unexpectedly");
        }
    });
    
    // stop() is a no-op until the listener is accepting
    server_->wait_until_ready();
    
    return true;
}

void HealthServer::stop() {
    if (!running_) return;
    
    running_ = false;
    server_->stop();
    
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    
    spdlog::info("Health server stopped");
}

void HealthServer::send(httplib::Response& res, const HttpReply& reply) {
    res.status = reply.status;
    res.set_content(reply.body.dump(), "application/json");
}

void HealthServer::setup_routes() {
    server_->Get("/",
        [this](const httplib::Request&, httplib::Response& res) {
            send(res, service_.root());
        });
    
    server_->Get("/health",
        [this](const httplib::Request&, httplib::Response& res) {
            send(res, service_.health());
        });
    
    server_->Get("/status",
        [this](const httplib::Request&, httplib::Response& res) {
            send(res, service_.status());
        });
    
    server_->Get("/restart",
        [this](const httplib::Request&, httplib::Response& res) {
            send(res, service_.restart());
        });
    
    // Also runs for handler replies >= 400; keep their bodies
    server_->set_error_handler(
        [](const httplib::Request&, httplib::Response& res) {
            if (!res.body.empty()) return;
            nlohmann::json body = {
                {"status", "error"},
                {"error", res.status == 404 ? "not found" : "request failed"}
            };
            res.set_content(body.dump(), "application/json");
        });
}
