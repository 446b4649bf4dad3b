#include "env_probe.hpp"
#include <cstdlib>

std::string EnvCheckResult::to_string() const {
    if (missing.empty()) return "healthy";
    
    std::string out = "missing: ";
    for (size_t i = 0; i < missing.size(); i++) {
        if (i > 0) out += ", ";
        out += missing[i];
    }
    return out;
}

EnvironmentProbe::EnvironmentProbe()
    : EnvironmentProbe(default_required_keys(), process_env()) {}

EnvironmentProbe::EnvironmentProbe(std::vector<std::string> required_keys, Lookup lookup)
    : required_keys_(std::move(required_keys)), lookup_(std::move(lookup)) {}

std::vector<std::string> EnvironmentProbe::default_required_keys() {
    return {
        "LIVEKIT_URL",
        "LIVEKIT_API_KEY",
        "LIVEKIT_API_SECRET",
        "OPENAI_API_KEY",
        "DATABASE_URL"
    };
}

EnvironmentProbe::Lookup EnvironmentProbe::process_env() {
    return [](const std::string& key) -> std::optional<std::string> {
        const char* val = std::getenv(key.c_str());
        if (!val) return std::nullopt;
        return std::string(val);
    };
}

EnvCheckResult EnvironmentProbe::check() const {
    EnvCheckResult result;
    for (const auto& key : required_keys_) {
        auto val = lookup_(key);
        if (!val || val->empty()) {
            result.missing.push_back(key);
        }
    }
    return result;
}
