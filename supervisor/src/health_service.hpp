#pragma once

#include "db_probe.hpp"
#include "env_probe.hpp"
#include "health_state.hpp"
#include "supervisor.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct HttpReply {
    int status = 200;
    nlohmann::json body;
};

// Builds the JSON replies for the HTTP surface. Transport-free so the
// handlers can be exercised without a socket.
class HealthService {
public:
    HealthService(const std::string& service_name,
                  HealthState& health,
                  Supervisor& supervisor,
                  const DatabaseProbe& db_probe,
                  const EnvironmentProbe& env_probe);
    
    HttpReply root() const;
    HttpReply health();
    HttpReply status() const;
    HttpReply restart();
    
    static std::vector<std::string> endpoints();
    
private:
    std::string service_name_;
    HealthState& health_;
    Supervisor& supervisor_;
    const DatabaseProbe& db_probe_;
    const EnvironmentProbe& env_probe_;
};
