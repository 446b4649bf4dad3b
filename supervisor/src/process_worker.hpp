#pragma once

#include "worker.hpp"
#include <chrono>
#include <string>
#include <sys/types.h>

// Runs the agent as a child process via /bin/sh -c. Exit code 0 is a clean
// stop, anything else is a WorkerError. On cancellation the child's process
// group gets SIGTERM, then SIGKILL after kill_grace.
class ProcessWorker : public Worker {
public:
    ProcessWorker(const std::string& command,
                  std::chrono::seconds kill_grace,
                  std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));
    
    void run(CancelToken& token) override;
    
private:
    std::string command_;
    std::chrono::seconds kill_grace_;
    std::chrono::milliseconds poll_interval_;
    
    pid_t launch();
    void terminate(pid_t pid);
    static std::string describe_exit(int status);
};
