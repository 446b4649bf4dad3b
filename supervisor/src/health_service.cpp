#include "health_service.hpp"
#include <spdlog/spdlog.h>

HealthService::HealthService(const std::string& service_name,
                             HealthState& health,
                             Supervisor& supervisor,
                             const DatabaseProbe& db_probe,
                             const EnvironmentProbe& env_probe)
    : service_name_(service_name)
    , health_(health)
    , supervisor_(supervisor)
    , db_probe_(db_probe)
    , env_probe_(env_probe)
{}

std::vector<std::string> HealthService::endpoints() {
    return {"/health", "/status", "/restart"};
}

HttpReply HealthService::root() const {
    nlohmann::json body = {
        {"service", service_name_},
        {"status", to_string(health_.status())},
        {"uptime", health_.uptime_seconds()},
        {"endpoints", endpoints()}
    };
    return {200, body};
}

HttpReply HealthService::health() {
    try {
        std::string db_status = to_string(db_probe_.check());
        std::string env_status = env_probe_.check().to_string();
        
        supervisor_.maybe_auto_restart();
        
        bool agent_ok = supervisor_.snapshot().retry_count < supervisor_.policy().max_retries;
        auto snap = health_.record_check(db_status, env_status, agent_ok);
        
        // Agent errors alone keep 200 while the supervisor is still recovering
        bool ready = db_status == "healthy" && env_status == "healthy";
        return {ready ? 200 : 503, snap.to_json()};
        
    } catch (const std::exception& e) {
        spdlog::error("Health check error: {}", e.what());
        nlohmann::json body = {
            {"status", "error"},
            {"error", e.what()},
            {"uptime", health_.uptime_seconds()}
        };
        return {503, body};
    }
}

HttpReply HealthService::status() const {
    return {200, health_.to_json()};
}

HttpReply HealthService::restart() {
    try {
        supervisor_.manual_restart();
        nlohmann::json body = {
            {"status", "success"},
            {"message", "Agent restart initiated"}
        };
        return {200, body};
        
    } catch (const std::exception& e) {
        spdlog::error("Manual restart error: {}", e.what());
        nlohmann::json body = {
            {"status", "error"},
            {"error", e.what()}
        };
        return {500, body};
    }
}
