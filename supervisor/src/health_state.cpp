#include "health_state.hpp"
#include "util.hpp"

std::string to_string(ServiceStatus status) {
    switch (status) {
        case ServiceStatus::Starting: return "starting";
        case ServiceStatus::Healthy: return "healthy";
        case ServiceStatus::Unhealthy: return "unhealthy";
        case ServiceStatus::Error: return "error";
    }
    return "unknown";
}

std::string to_string(AgentPhase phase) {
    switch (phase) {
        case AgentPhase::Starting: return "starting";
        case AgentPhase::Running: return "running";
        case AgentPhase::Stopped: return "stopped";
        case AgentPhase::FailedToStart: return "failed_to_start";
    }
    return "unknown";
}

std::string HealthSnapshot::agent_description() const {
    if (agent_phase == AgentPhase::Stopped) {
        return "stopped (errors: " + std::to_string(error_count) + ")";
    }
    return to_string(agent_phase);
}

nlohmann::json HealthSnapshot::to_json() const {
    nlohmann::json j = {
        {"status", to_string(status)},
        {"database", database_status},
        {"environment", environment_status},
        {"agent", agent_description()},
        {"uptime", uptime_s},
        {"error_count", error_count}
    };
    
    j["last_check"] = last_check_time ? nlohmann::json(*last_check_time) : nlohmann::json(nullptr);
    j["last_error"] = last_error ? nlohmann::json(*last_error) : nlohmann::json(nullptr);
    
    return j;
}

HealthState::HealthState()
    : started_at_(std::chrono::steady_clock::now()) {}

HealthSnapshot HealthState::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
}

nlohmann::json HealthState::to_json() const {
    return snapshot().to_json();
}

ServiceStatus HealthState::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.status;
}

int64_t HealthState::uptime_seconds() const {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_at_).count();
}

void HealthState::set_agent_phase(AgentPhase phase) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.agent_phase = phase;
}

int HealthState::record_failure(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.error_count++;
    data_.last_error = error;
    data_.agent_phase = AgentPhase::Stopped;
    return data_.error_count;
}

void HealthState::reset_errors() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.error_count = 0;
    data_.last_error.reset();
}

HealthSnapshot HealthState::record_check(const std::string& database_status,
                                         const std::string& environment_status,
                                         bool agent_ok) {
    bool overall_healthy = database_status == "healthy" &&
                           environment_status == "healthy" &&
                           agent_ok;
    auto uptime = uptime_seconds();
    auto check_time = util::current_utc_timestamp();
    
    std::lock_guard<std::mutex> lock(mutex_);
    data_.status = overall_healthy ? ServiceStatus::Healthy : ServiceStatus::Unhealthy;
    data_.database_status = database_status;
    data_.environment_status = environment_status;
    data_.last_check_time = check_time;
    data_.uptime_s = uptime;
    return data_;
}

void HealthState::mark_startup_failure(const std::string& environment_status) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.status = ServiceStatus::Unhealthy;
    data_.environment_status = environment_status;
    data_.agent_phase = AgentPhase::FailedToStart;
}

void HealthState::mark_fatal(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.status = ServiceStatus::Error;
    data_.agent_phase = AgentPhase::FailedToStart;
    data_.last_error = error;
}
