#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>

// Cooperative stop signal shared between the supervisor and one worker run.
class CancelToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }
    
    bool cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }
    
    // Returns true if cancelled before the timeout elapsed.
    bool wait_for(std::chrono::steady_clock::duration timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return cancelled_; });
    }
    
private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
};

class WorkerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Thrown by a worker that stops because its token was cancelled.
class WorkerCancelled : public std::runtime_error {
public:
    WorkerCancelled() : std::runtime_error("worker cancelled") {}
};

class Worker {
public:
    virtual ~Worker() = default;
    
    // Blocks until the work ends. Returning means a clean stop; throwing means
    // failure. Must be safe to call again after it returns or throws.
    virtual void run(CancelToken& token) = 0;
};
