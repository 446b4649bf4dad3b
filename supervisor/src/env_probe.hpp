#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

struct EnvCheckResult {
    std::vector<std::string> missing;  // in declaration order
    
    bool healthy() const { return missing.empty(); }
    std::string to_string() const;
};

// Verifies that every required configuration key is present and non-empty.
class EnvironmentProbe {
public:
    using Lookup = std::function<std::optional<std::string>(const std::string&)>;
    
    EnvironmentProbe();
    EnvironmentProbe(std::vector<std::string> required_keys, Lookup lookup);
    
    EnvCheckResult check() const;
    const std::vector<std::string>& required_keys() const { return required_keys_; }
    
    static std::vector<std::string> default_required_keys();
    static Lookup process_env();
    
private:
    std::vector<std::string> required_keys_;
    Lookup lookup_;
};
