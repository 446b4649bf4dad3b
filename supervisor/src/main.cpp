#include "config.hpp"
#include "db_probe.hpp"
#include "env_probe.hpp"
#include "health_server.hpp"
#include "health_service.hpp"
#include "health_state.hpp"
#include "postgres_checker.hpp"
#include "process_worker.hpp"
#include "supervisor.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level, const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file));
    }

    auto logger = std::make_shared<spdlog::logger>("agent-supervisor", sinks.begin(), sinks.end());

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

int main(int argc, char* argv[]) {
    try {
        auto config = Config::from_env();
        setup_logging(config.log_level, config.log_file);

        spdlog::info("==============================================");
        spdlog::info("Starting {} with health check server", config.service_name);
        spdlog::info("==============================================");

        config.validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // Initialize components
        HealthState health;
        EnvironmentProbe env_probe;
        DatabaseProbe db_probe([&config]() -> std::unique_ptr<ConnectionChecker> {
            return std::make_unique<PostgresChecker>(config.database_url, config.db_connect_timeout_s);
        });

        auto worker = std::make_shared<ProcessWorker>(
            config.agent_command, std::chrono::seconds(config.agent_kill_grace_s));
        Supervisor supervisor(worker, health, SupervisorPolicy::from_config(config));

        HealthService service(config.service_name, health, supervisor, db_probe, env_probe);
        HealthServer server(config, service);

        // Keep serving on a bad environment so the orchestrator can see why
        auto env = env_probe.check();
        if (!env.healthy()) {
            spdlog::error("Environment check failed: {}", env.to_string());
            health.mark_startup_failure(env.to_string());
        } else {
            supervisor.start();
        }

        if (!server.start()) {
            spdlog::error("Failed to start service: cannot bind port {}", config.listen_port);
            health.mark_fatal("cannot bind port " + std::to_string(config.listen_port));
            supervisor.stop();
            return 1;
        }

        // Main loop
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
        }

        spdlog::info("Shutdown requested, stopping services...");
        server.stop();
        supervisor.stop();

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
