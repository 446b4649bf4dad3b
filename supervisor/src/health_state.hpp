#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

enum class ServiceStatus {
    Starting,
    Healthy,
    Unhealthy,
    Error
};

enum class AgentPhase {
    Starting,
    Running,
    Stopped,
    FailedToStart
};

std::string to_string(ServiceStatus status);
std::string to_string(AgentPhase phase);

struct HealthSnapshot {
    ServiceStatus status = ServiceStatus::Starting;
    std::string database_status = "unknown";
    std::string environment_status = "unknown";
    AgentPhase agent_phase = AgentPhase::Starting;
    int error_count = 0;
    std::optional<std::string> last_error;
    std::optional<std::string> last_check_time;
    int64_t uptime_s = 0;  // as of the last check
    
    std::string agent_description() const;
    nlohmann::json to_json() const;
};

// Process-wide health record shared by the supervisor and the HTTP handlers.
// Every accessor takes the internal lock; readers get copies.
class HealthState {
public:
    HealthState();
    
    HealthSnapshot snapshot() const;
    nlohmann::json to_json() const;
    ServiceStatus status() const;
    int64_t uptime_seconds() const;
    
    // Supervisor side
    void set_agent_phase(AgentPhase phase);
    int record_failure(const std::string& error);
    void reset_errors();
    
    // Probe side
    HealthSnapshot record_check(const std::string& database_status,
                                const std::string& environment_status,
                                bool agent_ok);
    void mark_startup_failure(const std::string& environment_status);
    
    // Service-level failure, e.g. the HTTP port could not be bound
    void mark_fatal(const std::string& error);
    
private:
    const std::chrono::steady_clock::time_point started_at_;
    
    mutable std::mutex mutex_;
    HealthSnapshot data_;
};
