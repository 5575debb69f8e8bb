#include <catch2/catch.hpp>
#include "../src/config.hpp"
#include "../src/scenario.hpp"
#include <cstdlib>

namespace {

nlohmann::json scenario_setup() {
    return nlohmann::json::parse(R"({
        "start_time": 1700000000,
        "owner": "owner",
        "settlement_asset": "usd",
        "receipt_asset": "susd",
        "registry": {"rate": "1", "withdraw_fee_bps": 0},
        "feeds": {"weth": "2000"},
        "wrappers": [{"unwrapped": "steth", "wrapped": "wsteth", "ratio": "1.1"}],
        "swappers": [{
            "id": "dex",
            "rates": [
                {"in": "weth", "out": "usd", "rate": "2000"},
                {"in": "weth", "out": "native", "rate": "1"},
                {"in": "wsteth", "out": "native", "rate": "1.1"}
            ],
            "inventory": {"usd": "100000", "native": "100"}
        }],
        "underlyings": [
            {"asset": "usd", "min_deposit": "1"},
            {"asset": "weth", "min_deposit": "0.01", "deposit_ceiling": "50"},
            {"asset": "wsteth", "min_deposit": "0.01"}
        ],
        "balances": {
            "alice": {"usd": "1000", "weth": "5", "steth": "11"},
            "bob": {"usd": "1000", "native": "5"}
        },
        "sibling": {"asset": "usd"}
    })");
}

nlohmann::json command(const std::string& name, const std::string& from, nlohmann::json args) {
    return {
        {"cmd", name},
        {"corr_id", name + "-1"},
        {"from", {{"account", from}}},
        {"args", args}
    };
}

}

TEST_CASE("Scenario world setup", "[scenario]") {
    auto world = World::from_json(scenario_setup(), WorldParams());

    REQUIRE(world->now == 1700000000);
    REQUIRE(world->vault->strategy()->account() == "strategy-v1");
    REQUIRE(world->vault->min_lock_up_period() == 86400);
    REQUIRE(world->sibling);
    REQUIRE(world->bank->balance_of("usd", "swapper:dex") == units::parse("100000"));

    auto strategy = world->vault->strategy();
    std::vector<Asset> holdings = {"usd", "susd", "native", "weth", "wsteth"};
    REQUIRE(strategy->holding_assets() == holdings);
    REQUIRE(strategy->default_swapper("weth", "native") == "dex");
    REQUIRE(strategy->underlying_config("weth").deposit_ceiling == units::parse("50"));
}

TEST_CASE("Scenario dust floor is read as decimal", "[scenario]") {
    auto setup = scenario_setup();
    setup["registry_dust_floor"] = "0100";
    auto world = World::from_json(setup, WorldParams());
    REQUIRE(world->strategy_config.registry_dust_floor == Amount(100));

    setup["registry_dust_floor"] = "09";
    world = World::from_json(setup, WorldParams());
    REQUIRE(world->strategy_config.registry_dust_floor == Amount(9));

    REQUIRE(units::parse("0100", 0) == Amount(100));
}

TEST_CASE("Scenario runner replies", "[scenario]") {
    auto world = World::from_json(scenario_setup(), WorldParams());
    ScenarioRunner runner(*world);

    SECTION("Deposit reports minted shares") {
        auto reply = runner.run_command(command("deposit", "alice", {{"asset", "usd"}, {"amount", "100"}}));

        REQUIRE(reply["ok"] == true);
        REQUIRE(reply["corr_id"] == "deposit-1");
        REQUIRE(reply["data"]["shares"] == "100.000000000000000000");
        REQUIRE(reply["data"]["locked_until"] == 1700000000 + 86400);
        REQUIRE(reply.contains("ts"));
    }

    SECTION("Wrapped deposits count at the wrapper rate") {
        auto reply = runner.run_command(command("deposit", "alice", {{"asset", "steth"}, {"amount", "11"}}));

        REQUIRE(reply["ok"] == true);
        REQUIRE(reply["data"]["shares"] == "11.000000000000000000");
    }

    SECTION("Vault errors carry their name") {
        runner.run_command(command("deposit", "alice", {{"asset", "usd"}, {"amount", "100"}}));
        auto reply = runner.run_command(command("withdraw", "alice", {{"shares", "all"}}));

        REQUIRE(reply["ok"] == false);
        REQUIRE(reply["error"] == "ComeBackLater");

        reply = runner.run_command(command("deposit", "alice", {{"asset", "weth"}, {"amount", "51"}}));
        REQUIRE(reply["error"] == "InsufficientBalance");
    }

    SECTION("Lock expires after advancing time") {
        runner.run_command(command("deposit", "alice", {{"asset", "usd"}, {"amount", "100"}}));
        runner.run_command(command("advance_time", "owner", {{"seconds", 86400}}));
        auto reply = runner.run_command(command("withdraw", "alice", {{"shares", "all"}}));

        REQUIRE(reply["ok"] == true);
        REQUIRE(reply["data"]["settlement_out"] == "100.000000000000000000");
        REQUIRE(world->bank->balance_of("usd", "alice") == units::parse("1000"));
    }

    SECTION("Donations do not move the share price") {
        runner.run_command(command("deposit", "alice", {{"asset", "usd"}, {"amount", "100"}}));
        runner.run_command(command("donate", "bob", {{"asset", "usd"}, {"amount", "500"}}));
        auto snap = runner.run_command(command("snapshot", "owner", nlohmann::json::object()));

        REQUIRE(snap["data"]["total_assets"] == "100.000000000000000000");
        REQUIRE(snap["data"]["share_price"] == "1.000000000000000000");
        REQUIRE(snap["data"]["reserves"]["susd"] == "100.000000000000000000");
    }

    SECTION("Donations to the vault account are ignored too") {
        runner.run_command(command("deposit", "alice", {{"asset", "usd"}, {"amount", "100"}}));
        auto reply = runner.run_command(command("donate", "bob",
            {{"asset", "usd"}, {"amount", "250"}, {"to", "vault"}}));

        REQUIRE(reply["ok"] == true);
        REQUIRE(reply["data"]["to"] == "vault");
        REQUIRE(reply["data"]["total_assets"] == "100.000000000000000000");
        REQUIRE(world->bank->balance_of("usd", "vault") == units::parse("250"));

        reply = runner.run_command(command("deposit", "bob", {{"asset", "usd"}, {"amount", "100"}}));
        REQUIRE(reply["data"]["shares"] == "100.000000000000000000");
    }

    SECTION("Rate changes show up in the snapshot") {
        runner.run_command(command("deposit", "alice", {{"asset", "weth"}, {"amount", "1"}}));
        auto reply = runner.run_command(command("set_rate", "owner", {{"asset", "weth"}, {"rate", "2500"}}));

        REQUIRE(reply["ok"] == true);
        REQUIRE(reply["data"]["total_assets"] == "2500.000000000000000000");

        reply = runner.run_command(command("set_rate", "owner", {{"asset", "doge"}, {"rate", "1"}}));
        REQUIRE(reply["error"] == "UnknownAsset");
    }

    SECTION("Native rejection and retry") {
        runner.run_command(command("deposit", "alice", {{"asset", "weth"}, {"amount", "1"}}));
        runner.run_command(command("advance_time", "owner", {{"seconds", 86400}}));
        runner.run_command(command("reject_native", "alice", nlohmann::json::object()));

        auto reply = runner.run_command(command("withdraw", "alice", {{"shares", "all"}}));
        REQUIRE(reply["error"] == "FailedToSendETH");

        runner.run_command(command("reject_native", "alice", {{"reject", false}}));
        reply = runner.run_command(command("withdraw", "alice", {{"shares", "all"}}));
        REQUIRE(reply["ok"] == true);
        REQUIRE(reply["data"]["native_out"] == "1.000000000000000000");
    }

    SECTION("Manager swap and strategy switch") {
        runner.run_command(command("deposit", "alice", {{"asset", "weth"}, {"amount", "2"}}));

        auto reply = runner.run_command(command("invoke_swap", "owner",
            {{"swapper", "dex"}, {"in", "weth"}, {"amount", "1"}, {"out", "usd"}, {"min_out", "1999"}}));
        REQUIRE(reply["ok"] == true);
        REQUIRE(reply["data"]["amount_out"] == "2000.000000000000000000");

        reply = runner.run_command(command("set_strategy", "owner", {{"account", "strategy-v2"}}));
        REQUIRE(reply["ok"] == true);
        REQUIRE(reply["data"]["total_assets"] == "4000.000000000000000000");
        REQUIRE(world->vault->strategy()->account() == "strategy-v2");

        reply = runner.run_command(command("set_strategy", "alice", {{"account", "strategy-v3"}}));
        REQUIRE(reply["error"] == "Unauthorized");
    }

    SECTION("Sibling vault commands") {
        auto reply = runner.run_command(command("sibling_deposit", "alice", {{"amount", "100"}}));
        REQUIRE(reply["data"]["shares"] == "100.000000000000000000");

        reply = runner.run_command(command("swap_native_for_asset", "bob", {{"amount", "5"}}));
        REQUIRE(reply["data"]["asset_out"] == "5.000000000000000000");

        reply = runner.run_command(command("sibling_withdraw", "alice", nlohmann::json::object()));
        REQUIRE(reply["error"] == "ComeBackLater");

        runner.run_command(command("advance_time", "owner", {{"seconds", 3600}}));
        reply = runner.run_command(command("sibling_withdraw", "alice", nlohmann::json::object()));
        REQUIRE(reply["data"]["asset_out"] == "95.000000000000000000");
        REQUIRE(reply["data"]["native_out"] == "5.000000000000000000");
    }

    SECTION("Unknown and malformed commands") {
        auto reply = runner.run_command(command("teleport", "alice", nlohmann::json::object()));
        REQUIRE(reply["ok"] == false);
        REQUIRE(reply["error"] == "InvalidCommand");

        reply = runner.run_command(command("deposit", "alice", {{"asset", "usd"}}));
        REQUIRE(reply["ok"] == false);
        REQUIRE(reply["error"] == "InvalidCommand");
    }

    SECTION("run_all answers every command in order") {
        nlohmann::json commands = nlohmann::json::array({
            command("fund", "owner", {{"account", "carol"}, {"asset", "usd"}, {"amount", "10"}}),
            command("deposit", "carol", {{"asset", "usd"}, {"amount", "10"}}),
            command("accrue", "owner", {{"rate", "1.5"}}),
            command("snapshot", "owner", nlohmann::json::object())
        });
        auto replies = runner.run_all(commands);

        REQUIRE(replies.size() == 4);
        REQUIRE(replies[1]["data"]["shares"] == "10.000000000000000000");
        REQUIRE(replies[3]["data"]["total_assets"] == "15.000000000000000000");
    }
}

TEST_CASE("Config from environment", "[config]") {
    setenv("SCENARIO_PATH", "scenarios/donation.json", 1);
    setenv("MIN_LOCK_UP_SECONDS", "120", 1);
    setenv("REGISTRY_DUST_FLOOR", "500", 1);
    unsetenv("SIBLING_LOCK_SECONDS");

    Config cfg = Config::from_env();
    REQUIRE(cfg.scenario_path == "scenarios/donation.json");
    REQUIRE(cfg.min_lock_up_seconds == 120);
    REQUIRE(cfg.registry_dust_floor == "500");
    REQUIRE(cfg.sibling_lock_seconds == 3600);
    REQUIRE_NOTHROW(cfg.validate());

    cfg.registry_dust_floor = "1e9";
    REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);

    cfg.registry_dust_floor = "500";
    cfg.scenario_path.clear();
    REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
}
