#include <catch2/catch_test_macros.hpp>
#include "../src/health_service.hpp"
#include "test_helpers.hpp"
#include <map>

using Step = ScriptedWorker::Step;

namespace {

EnvironmentProbe::Lookup lookup_from(std::map<std::string, std::string> values) {
    return [values](const std::string& key) -> std::optional<std::string> {
        auto it = values.find(key);
        if (it == values.end()) return std::nullopt;
        return it->second;
    };
}

std::map<std::string, std::string> full_env() {
    return {
        {"LIVEKIT_URL", "wss://livekit.example.com"},
        {"LIVEKIT_API_KEY", "key"},
        {"LIVEKIT_API_SECRET", "secret"},
        {"OPENAI_API_KEY", "sk-test"},
        {"DATABASE_URL", "postgresql://agent:pw@localhost:5432/agent"}
    };
}

} // namespace

TEST_CASE("Health endpoint", "[health]") {
    HealthState health;
    auto worker = std::make_shared<ScriptedWorker>(std::vector<Step>{}, Step::Block);
    Supervisor supervisor(worker, health, fast_policy());

    SECTION("All probes healthy returns 200") {
        DatabaseProbe db(fake_checker(FakeChecker::Mode::Up));
        EnvironmentProbe env(EnvironmentProbe::default_required_keys(), lookup_from(full_env()));
        HealthService service("test-agent", health, supervisor, db, env);

        auto reply = service.health();

        REQUIRE(reply.status == 200);
        REQUIRE(reply.body["status"] == "healthy");
        REQUIRE(reply.body["database"] == "healthy");
        REQUIRE(reply.body["environment"] == "healthy");
        REQUIRE(reply.body["error_count"] == 0);
        REQUIRE(reply.body["last_check"].is_string());
        REQUIRE(reply.body["last_error"].is_null());
    }

    SECTION("Missing keys force 503 and are all named") {
        DatabaseProbe db(fake_checker(FakeChecker::Mode::Up));
        EnvironmentProbe env({"A", "B", "C", "D", "E"},
                             lookup_from({{"A", "1"}, {"B", "2"}, {"C", "3"}}));
        HealthService service("test-agent", health, supervisor, db, env);

        auto reply = service.health();

        REQUIRE(reply.status == 503);
        REQUIRE(reply.body["status"] == "unhealthy");
        REQUIRE(reply.body["environment"] == "missing: D, E");
        REQUIRE(reply.body["database"] == "healthy");
    }

    SECTION("Dependency failure is independent of worker failures") {
        DatabaseProbe db(fake_checker(FakeChecker::Mode::Throw));
        EnvironmentProbe env(EnvironmentProbe::default_required_keys(), lookup_from(full_env()));
        HealthService service("test-agent", health, supervisor, db, env);

        auto reply = service.health();

        REQUIRE(reply.status == 503);
        REQUIRE(reply.body["database"] == "unhealthy");
        REQUIRE(reply.body["error_count"] == 0);
        REQUIRE(health.snapshot().error_count == 0);
    }

    SECTION("Polling starts an agent that was never started") {
        DatabaseProbe db(fake_checker(FakeChecker::Mode::Up));
        EnvironmentProbe env(EnvironmentProbe::default_required_keys(), lookup_from(full_env()));
        HealthService service("test-agent", health, supervisor, db, env);

        service.health();

        REQUIRE(wait_until([&] { return worker->active() == 1; }));
        service.health();
        REQUIRE(supervisor.snapshot().generation == 1);
    }
}

TEST_CASE("Health endpoint with an exhausted agent", "[health]") {
    HealthState health;
    auto worker = std::make_shared<ScriptedWorker>(
        std::vector<Step>{Step::Fail, Step::Fail, Step::Fail, Step::Fail, Step::Fail}, Step::Block);
    Supervisor supervisor(worker, health, fast_policy());
    DatabaseProbe db(fake_checker(FakeChecker::Mode::Up));
    EnvironmentProbe env(EnvironmentProbe::default_required_keys(), lookup_from(full_env()));
    HealthService service("test-agent", health, supervisor, db, env);

    REQUIRE(supervisor.start());
    REQUIRE(wait_until([&] { return supervisor.snapshot().exhausted && !supervisor.snapshot().running; }));

    SECTION("Agent errors alone keep 200 but report unhealthy") {
        auto reply = service.health();

        REQUIRE(reply.status == 200);
        REQUIRE(reply.body["status"] == "unhealthy");
        REQUIRE(reply.body["error_count"] == 5);
        REQUIRE(reply.body["agent"] == "stopped (errors: 5)");
        REQUIRE(reply.body["last_error"] == "agent crashed (run 5)");
    }

    SECTION("Restart endpoint resets the error count") {
        auto reply = service.restart();

        REQUIRE(reply.status == 200);
        REQUIRE(reply.body["status"] == "success");
        REQUIRE(reply.body["message"] == "Agent restart initiated");
        REQUIRE(supervisor.snapshot().generation == 2);
        REQUIRE(service.status().body["last_error"].is_null());
    }
}

TEST_CASE("Status and root endpoints", "[health]") {
    HealthState health;
    auto worker = std::make_shared<ScriptedWorker>(std::vector<Step>{}, Step::Block);
    Supervisor supervisor(worker, health, fast_policy());
    DatabaseProbe db(fake_checker(FakeChecker::Mode::Up));
    EnvironmentProbe env(EnvironmentProbe::default_required_keys(), lookup_from(full_env()));
    HealthService service("test-agent", health, supervisor, db, env);

    SECTION("Status before any check reports the initial record") {
        auto reply = service.status();

        REQUIRE(reply.status == 200);
        REQUIRE(reply.body["status"] == "starting");
        REQUIRE(reply.body["database"] == "unknown");
        REQUIRE(reply.body["agent"] == "starting");
        REQUIRE(reply.body["last_check"].is_null());
    }

    SECTION("Status is read-only and stable between polls") {
        REQUIRE(supervisor.start());
        REQUIRE(wait_until([&] { return worker->active() == 1; }));
        service.health();

        auto first = service.status().body.dump();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        auto second = service.status().body.dump();

        REQUIRE(first == second);
        REQUIRE(supervisor.snapshot().generation == 1);
    }

    SECTION("Root lists the service and its endpoints") {
        auto reply = service.root();

        REQUIRE(reply.status == 200);
        REQUIRE(reply.body["service"] == "test-agent");
        REQUIRE(reply.body["status"] == "starting");
        REQUIRE(reply.body["uptime"].is_number_integer());
        REQUIRE(reply.body["endpoints"] == nlohmann::json({"/health", "/status", "/restart"}));
    }
}

TEST_CASE("Startup with a missing environment", "[health]") {
    HealthState health;
    health.mark_startup_failure("missing: OPENAI_API_KEY");

    auto body = health.to_json();

    REQUIRE(body["status"] == "unhealthy");
    REQUIRE(body["agent"] == "failed_to_start");
    REQUIRE(body["environment"] == "missing: OPENAI_API_KEY");
    REQUIRE(body["error_count"] == 0);
}

TEST_CASE("Fatal service failure", "[health]") {
    HealthState health;
    health.mark_fatal("cannot bind port 8080");

    auto body = health.to_json();

    REQUIRE(health.status() == ServiceStatus::Error);
    REQUIRE(body["status"] == "error");
    REQUIRE(body["agent"] == "failed_to_start");
    REQUIRE(body["last_error"] == "cannot bind port 8080");
}
