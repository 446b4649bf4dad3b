#include "db_probe.hpp"
#include <spdlog/spdlog.h>

std::string to_string(ProbeStatus status) {
    return status == ProbeStatus::Healthy ? "healthy" : "unhealthy";
}

DatabaseProbe::DatabaseProbe(CheckerFactory factory)
    : factory_(std::move(factory)) {}

ProbeStatus DatabaseProbe::check() const {
    try {
        auto checker = factory_();
        if (!checker) {
            spdlog::error("Database health check failed: no checker available");
            return ProbeStatus::Unhealthy;
        }
        return checker->test_connection() ? ProbeStatus::Healthy : ProbeStatus::Unhealthy;
    } catch (const std::exception& e) {
        spdlog::error("Database health check failed: {}", e.what());
        return ProbeStatus::Unhealthy;
    }
}
