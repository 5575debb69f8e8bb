#include "config.hpp"
#include "scenario.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fstream>
#include <iostream>

void setup_logging(const std::string& service_name, const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(service_name, console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

nlohmann::json load_scenario(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open scenario file " + path);
    }
    nlohmann::json scenario = nlohmann::json::parse(in);
    if (!scenario.contains("setup")) {
        throw std::runtime_error("Scenario " + path + " has no setup section");
    }
    return scenario;
}

int main(int argc, char* argv[]) {
    try {
        auto config = Config::from_env();
        if (argc > 1) {
            config.scenario_path = argv[1];
        }
        setup_logging(config.service_name, config.log_level);

        spdlog::info("==============================================");
        spdlog::info("StakeVault Simulator v1.0");
        spdlog::info("==============================================");

        config.validate();

        WorldParams params;
        params.min_lock_up_seconds = config.min_lock_up_seconds;
        params.registry_dust_floor = units::parse(config.registry_dust_floor, 0);
        params.sibling_lock_seconds = config.sibling_lock_seconds;

        auto scenario = load_scenario(config.scenario_path);
        auto world = World::from_json(scenario.at("setup"), params);

        ScenarioRunner runner(*world);
        nlohmann::json commands = scenario.contains("commands")
            ? scenario.at("commands")
            : nlohmann::json::array();

        size_t failed = 0;
        for (const auto& cmd : commands) {
            auto reply = runner.run_command(cmd);
            if (!reply.value("ok", false)) ++failed;
            std::cout << reply.dump() << std::endl;
        }

        spdlog::info("Scenario finished: {} command(s), {} rejected", commands.size(), failed);
        return 0;

    } catch (const VaultError& e) {
        spdlog::error("Scenario setup rejected: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
