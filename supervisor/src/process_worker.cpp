#include "process_worker.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <sys/wait.h>
#include <unistd.h>

ProcessWorker::ProcessWorker(const std::string& command,
                             std::chrono::seconds kill_grace,
                             std::chrono::milliseconds poll_interval)
    : command_(command)
    , kill_grace_(kill_grace)
    , poll_interval_(poll_interval)
{}

pid_t ProcessWorker::launch() {
    pid_t pid = fork();
    if (pid < 0) {
        throw WorkerError(std::string("fork failed: ") + std::strerror(errno));
    }
    
    if (pid == 0) {
        // Own process group so terminate() reaches the shell and its children
        setpgid(0, 0);
        execl("/bin/sh", "sh", "-c", command_.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }
    
    setpgid(pid, pid);
    return pid;
}

void ProcessWorker::run(CancelToken& token) {
    if (token.cancelled()) {
        throw WorkerCancelled();
    }
    
    pid_t pid = launch();
    spdlog::info("Agent process started (pid {}): {}", pid, command_);
    
    int status = 0;
    while (true) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        
        if (r < 0) {
            if (errno == EINTR) continue;
            throw WorkerError(std::string("waitpid failed: ") + std::strerror(errno));
        }
        
        if (token.wait_for(poll_interval_)) {
            spdlog::info("Stopping agent process (pid {})", pid);
            terminate(pid);
            throw WorkerCancelled();
        }
    }
    
    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        spdlog::info("Agent process {} exited cleanly", pid);
        return;
    }
    
    throw WorkerError(describe_exit(status));
}

void ProcessWorker::terminate(pid_t pid) {
    kill(-pid, SIGTERM);
    
    auto deadline = std::chrono::steady_clock::now() + kill_grace_;
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid || (r < 0 && errno != EINTR)) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    
    spdlog::warn("Agent process {} ignored SIGTERM for {}s, sending SIGKILL",
                 pid, kill_grace_.count());
    kill(-pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

std::string ProcessWorker::describe_exit(int status) {
    if (WIFEXITED(status)) {
        return "agent exited with code " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "agent killed by signal " + std::to_string(WTERMSIG(status));
    }
    return "agent exited abnormally (status " + std::to_string(status) + ")";
}
