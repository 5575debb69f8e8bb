#pragma once

#include "price_feed.hpp"
#include "ratio_wrapper.hpp"
#include "single_asset_vault.hpp"
#include "staking_registry.hpp"
#include "strategy.hpp"
#include "swapper.hpp"
#include "vault.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

struct WorldParams {
    int64_t min_lock_up_seconds = 86400;
    Amount registry_dust_floor = Amount(1000000000ULL);
    int64_t sibling_lock_seconds = 3600;
};

struct SwapRoute {
    Asset token_in;
    Asset token_out;
    std::string swapper_id;
    bool is_default;
};

struct UnderlyingEntry {
    Asset asset;
    UnderlyingAssetConfig config;
};

// Everything one scenario runs against: the bank, the simulated external
// collaborators, the vault, its strategies and the sibling vault.
struct World {
    int64_t now = 0;
    Account owner;

    std::shared_ptr<StateJournal> journal;
    std::shared_ptr<TokenBank> bank;
    std::shared_ptr<Valuation> valuation;
    std::shared_ptr<StakingRegistry> registry;
    std::map<Asset, std::shared_ptr<PriceFeed>> feeds;
    std::map<Asset, std::shared_ptr<RatioWrapper>> wrappers;   // by wrapped asset
    std::map<std::string, std::shared_ptr<FixedRateSwapper>> swappers;
    std::vector<SwapRoute> routes;
    std::vector<UnderlyingEntry> underlyings;
    StrategyConfig strategy_config;

    std::shared_ptr<Vault> vault;
    std::shared_ptr<SingleAssetVault> sibling;
    std::map<Account, std::shared_ptr<Strategy>> strategies;

    static std::unique_ptr<World> from_json(const nlohmann::json& setup, const WorldParams& params);

    util::Clock clock();

    // Builds a strategy wired like every other one in this world and bound
    // to the vault. Does not point the vault at it.
    std::shared_ptr<Strategy> make_strategy(const Account& account);
};

// Replays commands in the envelope
// {"cmd", "corr_id", "from": {"account"}, "args": {...}} and answers each
// with {"corr_id", "ok", "message", "error", "data", "ts"}.
class ScenarioRunner {
public:
    explicit ScenarioRunner(World& world);

    nlohmann::json run_command(const nlohmann::json& cmd);
    std::vector<nlohmann::json> run_all(const nlohmann::json& commands);

private:
    World& world_;

    nlohmann::json handle_deposit(const Account& from, const nlohmann::json& args);
    nlohmann::json handle_withdraw(const Account& from, const nlohmann::json& args);
    nlohmann::json handle_invoke_swap(const Account& from, const nlohmann::json& args);
    nlohmann::json handle_donate(const Account& from, const nlohmann::json& args);
    nlohmann::json handle_set_rate(const nlohmann::json& args);
    nlohmann::json handle_set_strategy(const Account& from, const nlohmann::json& args);
    nlohmann::json handle_sibling(const std::string& cmd, const Account& from,
                                  const nlohmann::json& args);
    nlohmann::json snapshot() const;
};
