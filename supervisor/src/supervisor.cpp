#include "supervisor.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <system_error>

namespace {

std::chrono::steady_clock::duration to_steady(Seconds s) {
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(s);
}

} // namespace

SupervisorPolicy SupervisorPolicy::from_config(const Config& config) {
    SupervisorPolicy policy;
    policy.max_retries = config.max_retries;
    policy.initial_retry_delay = Seconds(config.retry_delay_s);
    policy.backoff_factor = config.retry_backoff_factor;
    policy.max_retry_delay = Seconds(config.retry_delay_max_s);
    policy.stale_restart_after = Seconds(config.stale_restart_s);
    policy.stop_grace = Seconds(config.stop_grace_s);
    policy.join_timeout = Seconds(config.join_timeout_s);
    return policy;
}

RetryBackoff::RetryBackoff(const SupervisorPolicy& policy)
    : factor_(policy.backoff_factor)
    , max_(policy.max_retry_delay)
    , current_(policy.initial_retry_delay)
{}

Seconds RetryBackoff::advance() {
    Seconds delay = current_;
    current_ = std::min(current_ * factor_, max_);
    return delay;
}

Supervisor::Supervisor(std::shared_ptr<Worker> worker, HealthState& health, SupervisorPolicy policy)
    : worker_(std::move(worker))
    , health_(health)
    , policy_(policy)
    , retry_delay_(policy.initial_retry_delay)
{}

Supervisor::~Supervisor() {
    stop();
}

bool Supervisor::is_live_locked() const {
    return current_ && !current_->finished();
}

bool Supervisor::start() {
    std::lock_guard<std::mutex> control(control_mutex_);
    if (stopped_) return false;

    std::shared_ptr<Runner> previous;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (is_live_locked()) {
            spdlog::debug("Agent already running, start ignored");
            return false;
        }
        if (retry_count_ >= policy_.max_retries) {
            spdlog::warn("Agent retry budget exhausted ({}/{}), manual restart required",
                         retry_count_, policy_.max_retries);
            return false;
        }
        previous = current_;
    }

    reap(previous, policy_.join_timeout);
    spawn(false);
    return true;
}

bool Supervisor::maybe_auto_restart() {
    // A manual restart holding the lock will spawn a runner itself
    std::unique_lock<std::mutex> control(control_mutex_, std::try_to_lock);
    if (!control.owns_lock() || stopped_) return false;

    std::shared_ptr<Runner> previous;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (is_live_locked()) return false;
        if (retry_count_ >= policy_.max_retries) return false;
        if (last_restart_time_ &&
            std::chrono::steady_clock::now() - *last_restart_time_ <= to_steady(policy_.stale_restart_after)) {
            return false;
        }
        previous = current_;
    }

    spdlog::info("Attempting to restart agent after extended downtime...");
    reap(previous, policy_.join_timeout);
    spawn(true);
    return true;
}

void Supervisor::manual_restart() {
    std::lock_guard<std::mutex> control(control_mutex_);
    if (stopped_) {
        spdlog::warn("Manual restart ignored, supervisor is shutting down");
        return;
    }

    spdlog::info("Manual agent restart requested");

    std::shared_ptr<Runner> previous;
    bool was_live = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        retry_count_ = 0;
        exhausted_ = false;
        health_.reset_errors();

        previous = current_;
        was_live = is_live_locked();
        if (previous) {
            previous->token.cancel();
        }
    }

    if (was_live) {
        previous->done.wait_for(to_steady(policy_.stop_grace));
    }
    reap(previous, policy_.join_timeout);
    spawn(true);
}

void Supervisor::stop() {
    std::lock_guard<std::mutex> control(control_mutex_);
    if (stopped_) return;
    stopped_ = true;

    std::vector<std::shared_ptr<Runner>> runners;
    runners.swap(abandoned_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (current_) {
            if (is_live_locked()) {
                health_.set_agent_phase(AgentPhase::Stopped);
            }
            current_->token.cancel();
            runners.push_back(current_);
            current_.reset();
        }
    }

    for (auto& runner : runners) {
        runner->token.cancel();
        if (runner->done.wait_for(to_steady(policy_.join_timeout)) != std::future_status::ready) {
            spdlog::warn("Still waiting for agent runner #{} to exit", runner->id);
        }
        if (runner->thread.joinable()) {
            runner->thread.join();
        }
    }

    spdlog::info("Supervisor stopped");
}

SupervisorSnapshot Supervisor::snapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    SupervisorSnapshot snap;
    snap.retry_count = retry_count_;
    snap.retry_delay = retry_delay_;
    snap.running = is_live_locked();
    snap.exhausted = exhausted_;
    snap.generation = generation_;
    if (last_restart_time_) {
        snap.since_last_restart = std::chrono::steady_clock::now() - *last_restart_time_;
    }
    return snap;
}

void Supervisor::spawn(bool mark_restart) {
    reap_abandoned();

    auto runner = std::make_shared<Runner>();
    runner->done = runner->done_promise.get_future().share();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        runner->id = ++generation_;
        current_ = runner;
        exhausted_ = false;
        retry_delay_ = policy_.initial_retry_delay;
        if (mark_restart) {
            last_restart_time_ = std::chrono::steady_clock::now();
        }
        health_.set_agent_phase(AgentPhase::Running);
    }

    try {
        runner->thread = std::thread(&Supervisor::run_loop, this, runner);
    } catch (const std::system_error& e) {
        spdlog::error("Failed to start agent thread: {}", e.what());
        std::lock_guard<std::mutex> lock(state_mutex_);
        current_.reset();
        health_.set_agent_phase(AgentPhase::Stopped);
        throw;
    }

    spdlog::info("Agent thread started (runner #{})", runner->id);
}

void Supervisor::reap(std::shared_ptr<Runner> runner, Seconds timeout) {
    if (!runner) return;

    if (runner->done.wait_for(to_steady(timeout)) == std::future_status::ready) {
        if (runner->thread.joinable()) {
            runner->thread.join();
        }
        return;
    }

    // Its token stays cancelled, so it can no longer touch counters or phase
    spdlog::warn("Agent runner #{} did not stop within {:.1f}s, abandoning it",
                 runner->id, timeout.count());
    runner->token.cancel();
    abandoned_.push_back(std::move(runner));
}

void Supervisor::reap_abandoned() {
    auto it = abandoned_.begin();
    while (it != abandoned_.end()) {
        if ((*it)->finished()) {
            if ((*it)->thread.joinable()) {
                (*it)->thread.join();
            }
            spdlog::info("Abandoned agent runner #{} has exited", (*it)->id);
            it = abandoned_.erase(it);
        } else {
            ++it;
        }
    }
}

void Supervisor::run_loop(std::shared_ptr<Runner> runner) {
    RetryBackoff backoff(policy_);
    CancelToken& token = runner->token;

    while (true) {
        int attempt = 0;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (token.cancelled()) break;
            if (retry_count_ >= policy_.max_retries) {
                exhausted_ = true;
                health_.set_agent_phase(AgentPhase::Stopped);
                break;
            }
            attempt = retry_count_ + 1;
            retry_delay_ = backoff.current();
            health_.set_agent_phase(AgentPhase::Running);
        }

        spdlog::info("Starting agent (attempt {}/{})...", attempt, policy_.max_retries);

        try {
            worker_->run(token);

            std::lock_guard<std::mutex> lock(state_mutex_);
            if (token.cancelled()) {
                spdlog::info("Agent stopped on request");
            } else {
                spdlog::info("Agent stopped normally");
                health_.set_agent_phase(AgentPhase::Stopped);
            }
            break;

        } catch (const WorkerCancelled&) {
            spdlog::info("Agent stopped on request");
            break;
        } catch (const std::exception& e) {
            if (!handle_failure(*runner, backoff, e.what())) break;
        } catch (...) {
            if (!handle_failure(*runner, backoff, "unknown error")) break;
        }
    }

    runner->done_promise.set_value();
}

bool Supervisor::handle_failure(Runner& runner, RetryBackoff& backoff, const std::string& error) {
    Seconds delay{0.0};
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (runner.token.cancelled()) {
            spdlog::info("Agent exited after stop request: {}", error);
            return false;
        }

        retry_count_++;
        health_.record_failure(error);
        last_restart_time_ = std::chrono::steady_clock::now();

        spdlog::error("Agent error (attempt {}/{}): {}", retry_count_, policy_.max_retries, error);

        if (retry_count_ >= policy_.max_retries) {
            exhausted_ = true;
            spdlog::error("Maximum retry attempts reached. Agent will not restart automatically.");
            return false;
        }

        delay = backoff.advance();
        retry_delay_ = backoff.current();
    }

    spdlog::info("Restarting agent in {:.1f} seconds...", delay.count());
    if (runner.token.wait_for(to_steady(delay))) {
        spdlog::info("Agent backoff interrupted by stop request");
        return false;
    }
    return true;
}
