#pragma once

#include <string>
#include <cstdlib>

struct Config {
    // HTTP
    std::string listen_addr;
    int listen_port;
    
    // Service
    std::string service_name;
    std::string log_level;
    std::string log_file;
    
    // Database probe
    std::string database_url;
    int db_connect_timeout_s;
    
    // Agent
    std::string agent_command;
    int agent_kill_grace_s;
    
    // Supervision policy
    int max_retries;
    double retry_delay_s;
    double retry_backoff_factor;
    double retry_delay_max_s;
    double stale_restart_s;
    double stop_grace_s;
    double join_timeout_s;
    
    static Config from_env();
    void validate() const;
    
private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
};
