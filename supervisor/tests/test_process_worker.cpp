#include <catch2/catch_test_macros.hpp>
#include "../src/process_worker.hpp"
#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <chrono>
#include <fstream>
#include <string>
#include <thread>

TEST_CASE("Process worker", "[process_worker]") {
    CancelToken token;
    
    SECTION("Exit code 0 is a clean stop") {
        ProcessWorker worker("exit 0", std::chrono::seconds(1), std::chrono::milliseconds(10));
        REQUIRE_NOTHROW(worker.run(token));
    }
    
    SECTION("Non-zero exit is a failure carrying the code") {
        ProcessWorker worker("exit 3", std::chrono::seconds(1), std::chrono::milliseconds(10));
        try {
            worker.run(token);
            FAIL("expected WorkerError");
        } catch (const WorkerError& e) {
            REQUIRE(std::string(e.what()) == "agent exited with code 3");
        }
    }
    
    SECTION("Cancellation terminates the child") {
        ProcessWorker worker("sleep 30", std::chrono::seconds(1), std::chrono::milliseconds(10));
        std::thread canceller([&token]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            token.cancel();
        });
        
        auto begin = std::chrono::steady_clock::now();
        REQUIRE_THROWS_AS(worker.run(token), WorkerCancelled);
        auto elapsed = std::chrono::steady_clock::now() - begin;
        canceller.join();
        
        REQUIRE(elapsed < std::chrono::seconds(5));
    }
    
    SECTION("A child ignoring SIGTERM is killed after the grace period") {
        std::string pid_file = "/tmp/agent_supervisor_test_" + std::to_string(getpid()) + ".pid";
        ProcessWorker worker("trap '' TERM; echo $$ > " + pid_file + "; sleep 30",
                             std::chrono::seconds(1), std::chrono::milliseconds(10));
        std::thread canceller([&token]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            token.cancel();
        });
        
        auto begin = std::chrono::steady_clock::now();
        REQUIRE_THROWS_AS(worker.run(token), WorkerCancelled);
        auto elapsed = std::chrono::steady_clock::now() - begin;
        canceller.join();
        
        // SIGTERM alone would have ended the run right after cancellation
        REQUIRE(elapsed >= std::chrono::milliseconds(1200));
        REQUIRE(elapsed < std::chrono::seconds(5));
        
        pid_t child = 0;
        std::ifstream(pid_file) >> child;
        std::remove(pid_file.c_str());
        REQUIRE(child > 0);
        REQUIRE(kill(child, 0) == -1);
        REQUIRE(errno == ESRCH);
    }
    
    SECTION("An already cancelled token never launches") {
        token.cancel();
        ProcessWorker worker("exit 1", std::chrono::seconds(1));
        REQUIRE_THROWS_AS(worker.run(token), WorkerCancelled);
    }
}
