#pragma once

#include "config.hpp"
#include "health_state.hpp"
#include "worker.hpp"
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

using Seconds = std::chrono::duration<double>;

struct SupervisorPolicy {
    int max_retries = 5;
    Seconds initial_retry_delay{30.0};
    double backoff_factor = 1.5;
    Seconds max_retry_delay{300.0};
    Seconds stale_restart_after{300.0};  // auto-restart staleness threshold
    Seconds stop_grace{2.0};             // manual restart: wait for the old worker
    Seconds join_timeout{10.0};          // bounded join before abandoning

    static SupervisorPolicy from_config(const Config& config);
};

// Multiplicative backoff, capped.
class RetryBackoff {
public:
    explicit RetryBackoff(const SupervisorPolicy& policy);

    Seconds current() const { return current_; }

    // Returns the delay to wait now and grows the next one.
    Seconds advance();

private:
    double factor_;
    Seconds max_;
    Seconds current_;
};

struct SupervisorSnapshot {
    int retry_count = 0;
    Seconds retry_delay{0.0};
    bool running = false;
    bool exhausted = false;
    uint64_t generation = 0;  // worker-runners spawned so far
    std::optional<Seconds> since_last_restart;
};

// Runs one Worker on a background thread, retrying failures with backoff
// until the retry budget is spent, and reports its lifecycle to HealthState.
//
// Locking: control_mutex_ serializes start/restart/stop decisions and owns
// the runner handles; state_mutex_ guards the counters and is the only lock
// a worker-runner takes. Order is control -> state -> HealthState.
class Supervisor {
public:
    Supervisor(std::shared_ptr<Worker> worker, HealthState& health, SupervisorPolicy policy);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // No-op if a runner is live or the retry budget is exhausted.
    bool start();

    // Self-healing hook, called on every health poll. Never re-arms once
    // retry_count has reached max_retries; only manual_restart() does.
    bool maybe_auto_restart();

    // Resets the counters, stops the current worker (bounded wait) and
    // starts a new runner. May block for stop_grace + join_timeout.
    void manual_restart();

    // Shutdown. Cancels and joins every runner, including abandoned ones.
    void stop();

    SupervisorSnapshot snapshot() const;
    const SupervisorPolicy& policy() const { return policy_; }

private:
    struct Runner {
        uint64_t id = 0;
        CancelToken token;
        std::thread thread;
        std::promise<void> done_promise;
        std::shared_future<void> done;

        bool finished() const {
            return done.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        }
    };

    void run_loop(std::shared_ptr<Runner> runner);
    bool handle_failure(Runner& runner, RetryBackoff& backoff, const std::string& error);

    void spawn(bool mark_restart);
    void reap(std::shared_ptr<Runner> runner, Seconds timeout);
    void reap_abandoned();
    bool is_live_locked() const;

    std::shared_ptr<Worker> worker_;
    HealthState& health_;
    const SupervisorPolicy policy_;

    std::mutex control_mutex_;
    std::vector<std::shared_ptr<Runner>> abandoned_;
    bool stopped_ = false;

    mutable std::mutex state_mutex_;
    std::shared_ptr<Runner> current_;
    int retry_count_ = 0;
    Seconds retry_delay_;
    bool exhausted_ = false;
    uint64_t generation_ = 0;
    std::optional<std::chrono::steady_clock::time_point> last_restart_time_;
};
