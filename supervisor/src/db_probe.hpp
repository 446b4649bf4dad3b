#pragma once

#include <functional>
#include <memory>
#include <string>

enum class ProbeStatus {
    Healthy,
    Unhealthy
};

std::string to_string(ProbeStatus status);

class ConnectionChecker {
public:
    virtual ~ConnectionChecker() = default;
    
    // May throw; DatabaseProbe maps any exception to Unhealthy.
    virtual bool test_connection() = 0;
};

class DatabaseProbe {
public:
    using CheckerFactory = std::function<std::unique_ptr<ConnectionChecker>()>;
    
    explicit DatabaseProbe(CheckerFactory factory);
    
    // A fresh checker is built for every call. Never throws.
    ProbeStatus check() const;
    
private:
    CheckerFactory factory_;
};
