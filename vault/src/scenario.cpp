#include "scenario.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace {

std::string full(const Amount& value) {
    return units::format(value, UNIT_DECIMALS);
}

Amount amount_arg(const nlohmann::json& args, const char* key) {
    if (!args.contains(key)) {
        throw std::invalid_argument(std::string("missing argument '") + key + "'");
    }
    return units::parse(args.at(key).get<std::string>());
}

nlohmann::json section(const nlohmann::json& setup, const char* key, nlohmann::json fallback) {
    return setup.contains(key) ? setup.at(key) : fallback;
}

}

util::Clock World::clock() {
    return [this]() { return now; };
}

std::unique_ptr<World> World::from_json(const nlohmann::json& setup, const WorldParams& params) {
    auto world = std::make_unique<World>();

    world->now = setup.value("start_time", util::current_timestamp_s());
    world->owner = setup.value("owner", std::string("owner"));

    Asset settlement = setup.at("settlement_asset").get<std::string>();
    Asset receipt = setup.at("receipt_asset").get<std::string>();

    world->journal = std::make_shared<StateJournal>();
    world->bank = std::make_shared<TokenBank>(world->journal);
    world->valuation = std::make_shared<Valuation>(settlement);

    // Registry
    nlohmann::json reg = section(setup, "registry", nlohmann::json::object());
    world->registry = std::make_shared<StakingRegistry>(
        "registry", settlement, receipt, world->bank,
        units::parse(reg.value("rate", std::string("1"))));
    world->registry->set_withdraw_fee_bps(reg.value("withdraw_fee_bps", 0));
    world->registry->set_withdraw_limits(units::parse(reg.value("min_withdrawal", std::string("0"))),
                                         units::parse(reg.value("max_withdrawal", std::string("0"))));
    world->valuation->set_rate_provider(receipt, world->registry);

    // Oracle-priced assets
    nlohmann::json feeds = section(setup, "feeds", nlohmann::json::object());
    for (const auto& [asset, rate] : feeds.items()) {
        auto feed = std::make_shared<PriceFeed>(units::parse(rate.get<std::string>()));
        world->feeds[asset] = feed;
        world->valuation->set_rate_provider(asset, feed);
    }

    // Wrapped derivatives
    nlohmann::json wrappers = section(setup, "wrappers", nlohmann::json::array());
    for (const auto& w : wrappers) {
        Asset unwrapped = w.at("unwrapped").get<std::string>();
        Asset wrapped = w.at("wrapped").get<std::string>();

        std::shared_ptr<IRateProvider> unwrapped_rate;
        auto feed = world->feeds.find(unwrapped);
        if (feed != world->feeds.end()) unwrapped_rate = feed->second;

        auto wrapper = std::make_shared<RatioWrapper>(
            "wrapper:" + wrapped, unwrapped, wrapped, world->bank,
            units::parse(w.value("ratio", std::string("1"))), unwrapped_rate);
        world->wrappers[wrapped] = wrapper;
        world->valuation->set_rate_provider(wrapped, wrapper);
    }

    // Swap venues
    nlohmann::json swappers = section(setup, "swappers", nlohmann::json::array());
    for (const auto& s : swappers) {
        std::string id = s.at("id").get<std::string>();
        auto swapper = std::make_shared<FixedRateSwapper>(id, "swapper:" + id, world->bank);

        nlohmann::json rates = section(s, "rates", nlohmann::json::array());
        for (const auto& r : rates) {
            SwapRoute route;
            route.token_in = r.at("in").get<std::string>();
            route.token_out = r.at("out").get<std::string>();
            route.swapper_id = id;
            route.is_default = r.value("default", true);
            swapper->set_rate(route.token_in, route.token_out, units::parse(r.at("rate").get<std::string>()));
            world->routes.push_back(route);
        }

        nlohmann::json inventory = section(s, "inventory", nlohmann::json::object());
        for (const auto& [asset, amount] : inventory.items()) {
            world->bank->mint(asset, swapper->account(), units::parse(amount.get<std::string>()));
        }
        world->swappers[id] = swapper;
    }

    nlohmann::json underlyings = section(setup, "underlyings", nlohmann::json::array());
    for (const auto& u : underlyings) {
        UnderlyingEntry entry;
        entry.asset = u.at("asset").get<std::string>();
        entry.config.min_deposit = units::parse(u.value("min_deposit", std::string("0")));
        entry.config.deposit_ceiling = units::parse(u.value("deposit_ceiling", std::string("0")));
        world->underlyings.push_back(entry);
    }

    nlohmann::json balances = section(setup, "balances", nlohmann::json::object());
    for (const auto& [account, holdings] : balances.items()) {
        for (const auto& [asset, amount] : holdings.items()) {
            world->bank->mint(asset, account, units::parse(amount.get<std::string>()));
        }
    }

    nlohmann::json rejecters = section(setup, "reject_native", nlohmann::json::array());
    for (const auto& account : rejecters) {
        world->bank->set_rejects_native(account.get<std::string>(), true);
    }

    world->strategy_config.registry_dust_floor = params.registry_dust_floor;
    if (setup.contains("registry_dust_floor")) {
        world->strategy_config.registry_dust_floor =
            units::parse(setup.at("registry_dust_floor").get<std::string>(), 0);
    }

    world->vault = std::make_shared<Vault>(
        "vault", world->owner, world->journal, world->bank, world->clock(),
        setup.value("min_lock_up_seconds", params.min_lock_up_seconds));

    auto strategy = world->make_strategy(setup.value("strategy", std::string("strategy-v1")));
    world->vault->set_strategy(world->owner, strategy);

    if (setup.contains("sibling")) {
        const auto& sib = setup.at("sibling");
        world->sibling = std::make_shared<SingleAssetVault>(
            "sibling", world->owner, sib.value("asset", settlement), world->journal, world->bank,
            world->clock(), sib.value("lock_seconds", params.sibling_lock_seconds),
            units::parse(sib.value("min_deposit", std::string("0"))));
    }

    spdlog::info("World ready: {} feed(s), {} wrapper(s), {} swapper(s), {} underlying(s)",
                 world->feeds.size(), world->wrappers.size(), world->swappers.size(),
                 world->underlyings.size());
    return world;
}

std::shared_ptr<Strategy> World::make_strategy(const Account& account) {
    auto strategy = std::make_shared<Strategy>(account, owner, journal, bank, valuation,
                                               registry, strategy_config);
    strategy->set_vault(owner, vault->account());

    for (const auto& [wrapped, wrapper] : wrappers) {
        strategy->add_wrapper(owner, wrapper);
    }
    for (const auto& route : routes) {
        strategy->add_swapper(owner, route.token_in, route.token_out, swappers.at(route.swapper_id));
        if (route.is_default) {
            strategy->set_default_swapper(owner, route.token_in, route.token_out, route.swapper_id);
        }
    }
    for (const auto& entry : underlyings) {
        strategy->set_underlying_asset(owner, entry.asset, entry.config);
    }

    strategies[account] = strategy;
    return strategy;
}

ScenarioRunner::ScenarioRunner(World& world) : world_(world) {}

std::vector<nlohmann::json> ScenarioRunner::run_all(const nlohmann::json& commands) {
    std::vector<nlohmann::json> replies;
    for (const auto& cmd : commands) {
        replies.push_back(run_command(cmd));
    }
    return replies;
}

nlohmann::json ScenarioRunner::run_command(const nlohmann::json& cmd) {
    std::string name = cmd.value("cmd", std::string());
    std::string corr_id = cmd.value("corr_id", std::string());
    Account from;
    if (cmd.contains("from")) {
        from = cmd.at("from").value("account", std::string());
    }
    nlohmann::json args = cmd.contains("args") ? cmd.at("args") : nlohmann::json::object();

    nlohmann::json reply = {
        {"corr_id", corr_id},
        {"cmd", name},
        {"ts", util::current_iso8601()}
    };

    try {
        nlohmann::json data;

        if (name == "deposit") {
            data = handle_deposit(from, args);
        } else if (name == "withdraw") {
            data = handle_withdraw(from, args);
        } else if (name == "invoke_swap") {
            data = handle_invoke_swap(from, args);
        } else if (name == "donate") {
            data = handle_donate(from, args);
        } else if (name == "advance_time") {
            world_.now += args.at("seconds").get<int64_t>();
            data = {{"now", world_.now}};
        } else if (name == "set_rate") {
            data = handle_set_rate(args);
        } else if (name == "accrue") {
            world_.registry->accrue(amount_arg(args, "rate"));
            data = {{"rate", full(world_.registry->settlement_rate())}};
        } else if (name == "set_strategy") {
            data = handle_set_strategy(from, args);
        } else if (name == "swap_native_for_asset" || name == "sibling_deposit" ||
                   name == "sibling_withdraw") {
            data = handle_sibling(name, from, args);
        } else if (name == "reject_native") {
            Account account = args.value("account", from);
            bool reject = args.value("reject", true);
            world_.bank->set_rejects_native(account, reject);
            data = {{"account", account}, {"reject", reject}};
        } else if (name == "fund") {
            Account account = args.value("account", from);
            Asset asset = args.at("asset").get<std::string>();
            world_.bank->mint(asset, account, amount_arg(args, "amount"));
            data = {{"balance", full(world_.bank->balance_of(asset, account))}};
        } else if (name == "snapshot") {
            data = snapshot();
        } else {
            throw std::invalid_argument("unknown command '" + name + "'");
        }

        reply["ok"] = true;
        reply["message"] = data.is_object() && data.contains("message")
            ? data["message"].get<std::string>()
            : name + " ok";
        if (data.is_object()) data.erase("message");
        reply["data"] = data;

    } catch (const VaultError& e) {
        spdlog::warn("Command {} ({}) failed: {}", name, corr_id, e.what());
        reply["ok"] = false;
        reply["error"] = errc_name(e.code());
        reply["message"] = e.detail();
    } catch (const std::exception& e) {
        spdlog::error("Failed to handle {} ({}): {}", name, corr_id, e.what());
        reply["ok"] = false;
        reply["error"] = "InvalidCommand";
        reply["message"] = e.what();
    }

    return reply;
}

nlohmann::json ScenarioRunner::handle_deposit(const Account& from, const nlohmann::json& args) {
    Asset asset = args.at("asset").get<std::string>();
    Amount amount = amount_arg(args, "amount");
    bool sell = args.value("sell", false);

    Amount shares = world_.vault->deposit(from, asset, amount, sell);

    return {
        {"message", fmt::format("Deposited {} {}, minted {} shares",
                                units::format(amount), asset, units::format(shares))},
        {"shares", full(shares)},
        {"total_assets", full(world_.vault->total_assets())},
        {"total_supply", full(world_.vault->total_supply())},
        {"locked_until", world_.vault->locked_until(from)}
    };
}

nlohmann::json ScenarioRunner::handle_withdraw(const Account& from, const nlohmann::json& args) {
    std::string shares_arg = args.value("shares", std::string("all"));
    Amount shares = shares_arg == "all" ? world_.vault->balance_of(from) : units::parse(shares_arg);
    Account recipient = args.value("recipient", from);

    WithdrawResult result = world_.vault->withdraw(from, shares, recipient);

    return {
        {"message", fmt::format("Withdrew {} shares: {} settlement + {} native",
                                units::format(shares), units::format(result.settlement_out),
                                units::format(result.native_out))},
        {"shares", full(shares)},
        {"settlement_out", full(result.settlement_out)},
        {"native_out", full(result.native_out)},
        {"total_assets", full(world_.vault->total_assets())},
        {"total_supply", full(world_.vault->total_supply())}
    };
}

nlohmann::json ScenarioRunner::handle_invoke_swap(const Account& from, const nlohmann::json& args) {
    auto strategy = world_.vault->strategy();
    if (!strategy) {
        throw VaultError(Errc::ZeroAddress, "vault has no strategy");
    }

    Amount min_out = args.contains("min_out") ? amount_arg(args, "min_out") : Amount(0);
    Amount out = strategy->invoke_swap(from, args.at("swapper").get<std::string>(),
                                       args.at("in").get<std::string>(), amount_arg(args, "amount"),
                                       args.at("out").get<std::string>(), min_out);
    return {
        {"amount_out", full(out)},
        {"total_assets", full(world_.vault->total_assets())}
    };
}

nlohmann::json ScenarioRunner::handle_donate(const Account& from, const nlohmann::json& args) {
    std::string to = args.value("to", std::string("strategy"));
    if (to == "strategy") {
        auto strategy = world_.vault->strategy();
        if (!strategy) throw VaultError(Errc::ZeroAddress, "vault has no strategy");
        to = strategy->account();
    } else if (to == "vault") {
        to = world_.vault->account();
    }

    Asset asset = args.at("asset").get<std::string>();
    world_.bank->transfer(asset, from, to, amount_arg(args, "amount"));

    return {
        {"to", to},
        {"total_assets", full(world_.vault->total_assets())}
    };
}

nlohmann::json ScenarioRunner::handle_set_rate(const nlohmann::json& args) {
    Asset asset = args.at("asset").get<std::string>();
    Amount rate = amount_arg(args, "rate");

    auto feed = world_.feeds.find(asset);
    auto wrapper = world_.wrappers.find(asset);
    if (feed != world_.feeds.end()) {
        feed->second->set_rate(rate);
    } else if (wrapper != world_.wrappers.end()) {
        wrapper->second->set_ratio(rate);
    } else if (asset == world_.registry->receipt_asset()) {
        world_.registry->accrue(rate);
    } else {
        throw VaultError(Errc::UnknownAsset, "no settable rate for " + asset);
    }

    return {
        {"asset", asset},
        {"rate", full(world_.valuation->rate_of(asset))},
        {"total_assets", full(world_.vault->total_assets())}
    };
}

nlohmann::json ScenarioRunner::handle_set_strategy(const Account& from, const nlohmann::json& args) {
    Account account = args.at("account").get<std::string>();

    auto previous = world_.vault->strategy();
    auto it = world_.strategies.find(account);
    auto next = it != world_.strategies.end() ? it->second : world_.make_strategy(account);

    world_.vault->set_strategy(from, next);

    nlohmann::json old_reserves = nlohmann::json::object();
    if (previous && previous != next) {
        for (const auto& asset : previous->holding_assets()) {
            old_reserves[asset] = full(previous->reserves(asset));
        }
    }

    return {
        {"message", "Strategy switched to " + account},
        {"strategy", account},
        {"previous_reserves", old_reserves},
        {"total_assets", full(world_.vault->total_assets())}
    };
}

nlohmann::json ScenarioRunner::handle_sibling(const std::string& cmd, const Account& from,
                                              const nlohmann::json& args) {
    if (!world_.sibling) {
        throw VaultError(Errc::ZeroAddress, "no single-asset vault configured");
    }
    auto& sibling = *world_.sibling;

    nlohmann::json data = nlohmann::json::object();
    if (cmd == "sibling_deposit") {
        data["shares"] = full(sibling.deposit(from, amount_arg(args, "amount")));
    } else if (cmd == "sibling_withdraw") {
        std::string shares_arg = args.value("shares", std::string("all"));
        Amount shares = shares_arg == "all" ? sibling.balance_of(from) : units::parse(shares_arg);
        WithdrawResult result = sibling.withdraw(from, shares, args.value("recipient", from));
        data["asset_out"] = full(result.settlement_out);
        data["native_out"] = full(result.native_out);
    } else {
        data["asset_out"] = full(sibling.swap_native_for_asset(from, amount_arg(args, "amount")));
    }

    data["total_assets"] = full(sibling.total_assets());
    data["unlock_time"] = sibling.unlock_time();
    return data;
}

nlohmann::json ScenarioRunner::snapshot() const {
    nlohmann::json data = {
        {"now", world_.now},
        {"total_assets", full(world_.vault->total_assets())},
        {"total_supply", full(world_.vault->total_supply())},
        {"share_price", full(world_.vault->share_price())}
    };

    auto strategy = world_.vault->strategy();
    if (strategy) {
        nlohmann::json reserves = nlohmann::json::object();
        for (const auto& asset : strategy->holding_assets()) {
            reserves[asset] = full(strategy->reserves(asset));
        }
        data["strategy"] = strategy->account();
        data["reserves"] = reserves;
    }
    return data;
}
