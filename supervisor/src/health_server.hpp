#pragma once

#include "config.hpp"
#include "health_service.hpp"
#include <httplib.h>
#include <atomic>
#include <memory>
#include <thread>

class HealthServer {
public:
    HealthServer(const Config& config, HealthService& service);
    ~HealthServer();
    
    // Binds the listen socket and serves on a background thread.
    // Returns false if the port cannot be bound.
    bool start();
    void stop();
    bool is_running() const { return running_; }
    int port() const { return port_; }
    
private:
    const Config& config_;
    HealthService& service_;
    
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;
    int port_ = 0;
    
    void setup_routes();
    static void send(httplib::Response& res, const HttpReply& reply);
};
