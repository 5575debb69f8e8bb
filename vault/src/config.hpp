#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>

struct Config {
    // Scenario
    std::string scenario_path;

    // Vault parameters
    int64_t min_lock_up_seconds;
    std::string registry_dust_floor;   // base units
    int64_t sibling_lock_seconds;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int64_t get_env_int(const char* name, int64_t default_val);
};
