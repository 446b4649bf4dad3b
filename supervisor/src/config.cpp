#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <stdexcept>

namespace {

// Durations above this overflow steady_clock arithmetic in the supervisor
constexpr double kMaxSeconds = 1e6;

void require_seconds(const char* name, double value) {
    if (!std::isfinite(value) || value < 0 || value > kMaxSeconds) {
        throw std::runtime_error(std::string(name) + " must be a finite number of seconds between 0 and 1000000");
    }
}

} // namespace

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val || !*val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val || !*val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;
    
    // Render and similar platforms assign PORT
    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("PORT", 8080);
    
    cfg.service_name = get_env("SERVICE_NAME", "LiveKit Moving Agent");
    cfg.log_level = get_env("LOG_LEVEL", "info");
    cfg.log_file = get_env("LOG_FILE", "health.log");
    
    cfg.database_url = get_env("DATABASE_URL");
    cfg.db_connect_timeout_s = get_env_int("DB_CONNECT_TIMEOUT_S", 5);
    
    cfg.agent_command = get_env("AGENT_COMMAND", "python3 agent.py start");
    cfg.agent_kill_grace_s = get_env_int("AGENT_KILL_GRACE_S", 5);
    
    cfg.max_retries = get_env_int("MAX_RETRIES", 5);
    cfg.retry_delay_s = get_env_double("RETRY_DELAY_S", 30.0);
    cfg.retry_backoff_factor = get_env_double("RETRY_BACKOFF_FACTOR", 1.5);
    cfg.retry_delay_max_s = get_env_double("RETRY_DELAY_MAX_S", 300.0);
    cfg.stale_restart_s = get_env_double("STALE_RESTART_S", 300.0);
    cfg.stop_grace_s = get_env_double("STOP_GRACE_S", 2.0);
    cfg.join_timeout_s = get_env_double("JOIN_TIMEOUT_S", 10.0);
    
    return cfg;
}

void Config::validate() const {
    if (listen_port < 0 || listen_port > 65535) {
        throw std::runtime_error("PORT must be between 0 and 65535");
    }
    if (agent_command.empty()) {
        throw std::runtime_error("AGENT_COMMAND is required");
    }
    if (max_retries < 1) {
        throw std::runtime_error("MAX_RETRIES must be at least 1");
    }
    require_seconds("RETRY_DELAY_S", retry_delay_s);
    require_seconds("RETRY_DELAY_MAX_S", retry_delay_max_s);
    require_seconds("STALE_RESTART_S", stale_restart_s);
    require_seconds("STOP_GRACE_S", stop_grace_s);
    require_seconds("JOIN_TIMEOUT_S", join_timeout_s);
    if (retry_delay_max_s < retry_delay_s) {
        throw std::runtime_error("RETRY_DELAY_S must be <= RETRY_DELAY_MAX_S");
    }
    if (!std::isfinite(retry_backoff_factor) || retry_backoff_factor < 1.0 || retry_backoff_factor > 100.0) {
        throw std::runtime_error("RETRY_BACKOFF_FACTOR must be between 1.0 and 100.0");
    }
    if (agent_kill_grace_s < 0 || db_connect_timeout_s < 0) {
        throw std::runtime_error("AGENT_KILL_GRACE_S and DB_CONNECT_TIMEOUT_S must be non-negative");
    }
    
    spdlog::info("Configuration validated successfully");
    spdlog::info("  Agent command: {}", agent_command);
    spdlog::info("  Retry policy: max={}, delay={}s, factor={}, cap={}s",
                 max_retries, retry_delay_s, retry_backoff_factor, retry_delay_max_s);
    spdlog::info("  Auto-restart after {}s of downtime", stale_restart_s);
    if (!database_url.empty()) {
        spdlog::info("  Database: {}", util::redact_dsn(database_url));
    }
}
