#include "config.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int64_t Config::get_env_int(const char* name, int64_t default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoll(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.scenario_path = get_env("SCENARIO_PATH");

    cfg.min_lock_up_seconds = get_env_int("MIN_LOCK_UP_SECONDS", 86400);
    cfg.registry_dust_floor = get_env("REGISTRY_DUST_FLOOR", "1000000000");
    cfg.sibling_lock_seconds = get_env_int("SIBLING_LOCK_SECONDS", 3600);

    cfg.service_name = get_env("SERVICE_NAME", "vault_sim");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (scenario_path.empty()) {
        throw std::runtime_error("SCENARIO_PATH is required");
    }
    if (min_lock_up_seconds < 0 || sibling_lock_seconds < 0) {
        throw std::runtime_error("Lock periods cannot be negative");
    }
    if (registry_dust_floor.empty() ||
        registry_dust_floor.find_first_not_of("0123456789") != std::string::npos) {
        throw std::runtime_error("REGISTRY_DUST_FLOOR must be an integer amount in base units");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Scenario: {}", scenario_path);
    spdlog::info("  Lock-up: vault={}s, sibling={}s", min_lock_up_seconds, sibling_lock_seconds);
    spdlog::info("  Registry dust floor: {}", registry_dust_floor);
}
