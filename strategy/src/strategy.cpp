#include "strategy.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

Strategy::Strategy(const Account& account,
                   const Account& owner,
                   std::shared_ptr<StateJournal> journal,
                   std::shared_ptr<TokenBank> bank,
                   std::shared_ptr<Valuation> valuation,
                   std::shared_ptr<IStakingRegistry> registry,
                   StrategyConfig config)
    : account_(account)
    , owner_(owner)
    , manager_(owner)
    , config_(config)
    , journal_(journal)
    , bank_(bank)
    , valuation_(valuation)
    , registry_(registry)
    , ledger_(journal)
{
    if (account_.empty() || owner_.empty()) {
        throw VaultError(Errc::ZeroAddress, "strategy account and owner are required");
    }
    if (!journal_ || !bank_ || !valuation_ || !registry_) {
        throw VaultError(Errc::ZeroAddress, "strategy " + account_ + " missing a dependency");
    }

    settlement_asset_ = registry_->settlement_asset();
    receipt_asset_ = registry_->receipt_asset();

    if (valuation_->settlement_asset() != settlement_asset_) {
        throw VaultError(Errc::UnknownAsset,
                         "valuation settles in " + valuation_->settlement_asset() +
                         ", registry in " + settlement_asset_);
    }
    if (!valuation_->has_rate(receipt_asset_)) {
        valuation_->set_rate_provider(receipt_asset_, registry_);
    }

    // Enumeration order is fixed from here: settlement, receipt, native, then
    // underlyings as they are enabled.
    holding_assets_.insert(settlement_asset_);
    holding_assets_.insert(receipt_asset_);
    holding_assets_.insert(NATIVE_COIN);
}

void Strategy::require_owner(const Account& caller, const char* op) const {
    if (caller != owner_) {
        throw VaultError(Errc::Unauthorized, std::string(op) + " is owner-only, caller " + caller);
    }
}

void Strategy::require_manager(const Account& caller, const char* op) const {
    if (caller != manager_) {
        throw VaultError(Errc::Unauthorized, std::string(op) + " is manager-only, caller " + caller);
    }
}

void Strategy::require_vault(const Account& caller, const char* op) const {
    if (vault_.empty() || caller != vault_) {
        throw VaultError(Errc::Unauthorized, std::string(op) + " is vault-only, caller " + caller);
    }
}

void Strategy::add_holding_asset(const Asset& asset) {
    if (holding_assets_.contains(asset)) return;
    OrderedSet<Asset> next = holding_assets_;
    next.insert(asset);
    journal_->assign(holding_assets_, next);
}

Amount Strategy::asset_value(const Asset& asset, const Amount& quantity) const {
    return valuation_->asset_value(asset, quantity);
}

Amount Strategy::total_assets() const {
    Amount total = 0;
    for (const auto& asset : holding_assets_.items()) {
        Amount quantity = ledger_.reserves(asset);
        if (quantity == 0) continue;
        total += valuation_->asset_value(asset, quantity);
    }
    return total;
}

UnderlyingAssetConfig Strategy::underlying_config(const Asset& asset) const {
    auto it = underlying_configs_.find(asset);
    if (it == underlying_configs_.end()) return UnderlyingAssetConfig();
    return it->second;
}

bool Strategy::is_swapper_enabled(const Asset& token_in, const Asset& token_out,
                                  const std::string& swapper_id) const {
    auto it = enabled_swappers_.find(BindingKey(token_in, token_out, swapper_id));
    return it != enabled_swappers_.end() && it->second;
}

std::string Strategy::default_swapper(const Asset& token_in, const Asset& token_out) const {
    auto it = default_swappers_.find(PairKey(token_in, token_out));
    if (it == default_swappers_.end()) return "";
    return it->second;
}

Amount Strategy::deposit(const Account& caller, const Asset& asset, const Amount& amount,
                         bool sell_for_settlement) {
    require_vault(caller, "deposit");

    TxScope tx(*journal_);
    ReentrancyLock lock(guard_, "Strategy::deposit");

    Asset canonical = asset;
    Amount credited = amount;

    auto wrapper = wrappers_.find(asset);
    if (wrapper != wrappers_.end() && wrapper->second) {
        credited = wrapper->second->wrap(account_, amount);
        canonical = wrapper->second->wrapped_asset();
        spdlog::debug("Wrapped {} {} into {} {}", units::format(amount), asset,
                      units::format(credited), canonical);
    }

    // Book first, then validate; a failed check unwinds the booking with the scope
    ledger_.credit(canonical, credited);

    if (!underlying_assets_.contains(canonical)) {
        throw VaultError(Errc::UnknownAsset, canonical + " is not an accepted underlying");
    }

    const auto& cfg = underlying_configs_.at(canonical);
    if (credited < cfg.min_deposit) {
        throw VaultError(Errc::TooSmall,
                         fmt::format("{} {} below minimum {}", units::format(credited),
                                     canonical, units::format(cfg.min_deposit)));
    }
    if (cfg.deposit_ceiling != 0 && ledger_.reserves(canonical) > cfg.deposit_ceiling) {
        throw VaultError(Errc::ExceedsDepositCeiling,
                         fmt::format("{} reserve {} over ceiling {}", canonical,
                                     units::format(ledger_.reserves(canonical)),
                                     units::format(cfg.deposit_ceiling)));
    }

    if (canonical == settlement_asset_) {
        stake_settlement(credited);
    } else if (sell_for_settlement) {
        Amount proceeds = swap_token_for_token(canonical, credited, settlement_asset_);
        stake_settlement(proceeds);
    }

    tx.commit();

    spdlog::info("Strategy {} deposit {} {} (sell={})", account_, units::format(credited),
                 canonical, sell_for_settlement);
    return credited;
}

WithdrawResult Strategy::withdraw(const Account& caller, const Amount& share_amount,
                                  const Amount& total_supply, const Account& recipient) {
    require_vault(caller, "withdraw");

    if (recipient.empty()) {
        throw VaultError(Errc::ZeroAddress, "withdraw recipient");
    }
    if (share_amount == 0 || total_supply == 0) {
        throw VaultError(Errc::TooSmall, "withdraw of zero shares");
    }
    if (share_amount > total_supply) {
        throw VaultError(Errc::InsufficientBalance,
                         share_amount.str() + " shares of " + total_supply.str());
    }

    TxScope tx(*journal_);
    ReentrancyLock lock(guard_, "Strategy::withdraw");

    WithdrawResult result;
    const std::vector<Asset> assets = holding_assets_.items();

    for (const auto& asset : assets) {
        // Floor division: rounding stays in the pool
        Amount amount_to_withdraw = units::mul_div(ledger_.reserves(asset), share_amount, total_supply);
        if (amount_to_withdraw == 0) continue;

        if (asset == settlement_asset_) {
            result.settlement_out += amount_to_withdraw;
        } else if (asset == receipt_asset_) {
            if (amount_to_withdraw < config_.registry_dust_floor) {
                spdlog::debug("Receipt leg {} below dust floor, left in reserve",
                              units::format(amount_to_withdraw));
                continue;
            }
            if (!registry_->can_withdraw(account_, amount_to_withdraw)) {
                throw VaultError(Errc::WithdrawNotEligible,
                                 "registry refused " + units::format(amount_to_withdraw) + " " + asset);
            }

            Amount before = bank_->balance_of(settlement_asset_, account_);
            registry_->withdraw(account_, account_, amount_to_withdraw);
            Amount received = units::checked_sub(bank_->balance_of(settlement_asset_, account_),
                                                 before, "registry proceeds");

            // Credit what arrived, debit what was asked for. Any shortfall is
            // not reconciled against the receipt reserve.
            ledger_.credit(settlement_asset_, received);
            ledger_.debit(receipt_asset_, amount_to_withdraw);
            result.settlement_out += received;
        } else if (asset == NATIVE_COIN) {
            result.native_out += amount_to_withdraw;
        } else {
            result.native_out += swap_token_for_token(asset, amount_to_withdraw, NATIVE_COIN);
        }
    }

    if (result.settlement_out > 0) {
        ledger_.debit(settlement_asset_, result.settlement_out);
        bank_->transfer(settlement_asset_, account_, recipient, result.settlement_out);
    }
    if (result.native_out > 0) {
        ledger_.debit(NATIVE_COIN, result.native_out);
        bank_->transfer(NATIVE_COIN, account_, recipient, result.native_out);
    }

    tx.commit();

    spdlog::info("Strategy {} withdraw {}/{} shares to {}: {} {} + {} native", account_,
                 share_amount.str(), total_supply.str(), util::short_id(recipient),
                 units::format(result.settlement_out), settlement_asset_,
                 units::format(result.native_out));
    return result;
}

Amount Strategy::invoke_swap(const Account& caller, const std::string& swapper_id,
                             const Asset& token_in, const Amount& amount_in,
                             const Asset& token_out, const Amount& min_amount_out) {
    require_manager(caller, "invoke_swap");

    TxScope tx(*journal_);
    ReentrancyLock lock(guard_, "Strategy::invoke_swap");

    if (!is_swapper_enabled(token_in, token_out, swapper_id)) {
        throw VaultError(Errc::InvalidSwapper,
                         swapper_id + " not enabled for " + token_in + " -> " + token_out);
    }
    if (!holding_assets_.contains(token_out)) {
        throw VaultError(Errc::UnknownAsset, token_out + " is not a holding asset");
    }

    Amount amount_out = execute_swap(*swappers_.at(swapper_id), token_in, amount_in,
                                     token_out, min_amount_out);
    if (token_out == settlement_asset_) {
        stake_settlement(amount_out);
    }

    tx.commit();
    return amount_out;
}

MigrationManifest Strategy::migrate_funds(const Account& caller, const Account& new_strategy) {
    require_vault(caller, "migrate_funds");

    if (new_strategy.empty()) {
        throw VaultError(Errc::ZeroAddress, "migration target");
    }

    TxScope tx(*journal_);
    ReentrancyLock lock(guard_, "Strategy::migrate_funds");

    MigrationManifest manifest;
    const std::vector<Asset> assets = holding_assets_.items();

    for (const auto& asset : assets) {
        Amount amount = ledger_.reserves(asset);
        if (amount == 0) continue;

        if (asset == receipt_asset_ && !registry_->can_withdraw(account_, amount)) {
            throw VaultError(Errc::WithdrawNotEligible,
                             "registry refused moving " + units::format(amount) + " " + asset);
        }

        ledger_.debit(asset, amount);
        bank_->transfer(asset, account_, new_strategy, amount);
        manifest.push_back({asset, amount});
    }

    tx.commit();

    spdlog::info("Strategy {} migrated {} asset(s) to {}", account_, manifest.size(), new_strategy);
    return manifest;
}

void Strategy::accept_migration(const Account& caller, const Account& prev_strategy,
                                const MigrationManifest& manifest) {
    require_vault(caller, "accept_migration");

    TxScope tx(*journal_);
    ReentrancyLock lock(guard_, "Strategy::accept_migration");

    for (const auto& entry : manifest) {
        add_holding_asset(entry.asset);
        ledger_.credit(entry.asset, entry.amount);
    }

    tx.commit();

    spdlog::info("Strategy {} accepted migration from {} ({} asset(s))", account_,
                 prev_strategy, manifest.size());
}

void Strategy::stake_settlement(const Amount& amount) {
    if (amount == 0) return;

    Amount minted = registry_->deposit(account_, account_, amount);
    ledger_.debit(settlement_asset_, amount);
    ledger_.credit(receipt_asset_, minted);

    spdlog::debug("Staked {} {} for {} {}", units::format(amount), settlement_asset_,
                  units::format(minted), receipt_asset_);
}

Amount Strategy::swap_token_for_token(const Asset& token_in, const Amount& amount_in,
                                      const Asset& token_out) {
    std::string swapper_id = default_swapper(token_in, token_out);
    if (swapper_id.empty()) {
        throw VaultError(Errc::NotSupportedSwapper,
                         "no default swapper for " + token_in + " -> " + token_out);
    }
    // Automated routes run without slippage protection
    return execute_swap(*swappers_.at(swapper_id), token_in, amount_in, token_out, 0);
}

Amount Strategy::execute_swap(ISwapper& swapper, const Asset& token_in, const Amount& amount_in,
                              const Asset& token_out, const Amount& min_amount_out) {
    ledger_.debit(token_in, amount_in);
    Amount amount_out = swapper.swap(account_, token_in, amount_in, token_out, min_amount_out);
    ledger_.credit(token_out, amount_out);

    spdlog::info("Swapped {} {} -> {} {} via {}", units::format(amount_in), token_in,
                 units::format(amount_out), token_out, swapper.id());
    return amount_out;
}

void Strategy::set_vault(const Account& caller, const Account& vault) {
    require_owner(caller, "set_vault");
    if (vault.empty()) {
        throw VaultError(Errc::ZeroAddress, "vault");
    }
    if (!vault_.empty() && vault_ != vault) {
        throw VaultError(Errc::Unauthorized, "strategy " + account_ + " already bound to " + vault_);
    }
    TxScope tx(*journal_);
    journal_->assign(vault_, vault);
    tx.commit();
}

void Strategy::set_manager(const Account& caller, const Account& manager) {
    require_owner(caller, "set_manager");
    if (manager.empty()) {
        throw VaultError(Errc::ZeroAddress, "manager");
    }
    TxScope tx(*journal_);
    journal_->assign(manager_, manager);
    tx.commit();
    spdlog::info("Strategy {} manager set to {}", account_, manager);
}

void Strategy::set_underlying_asset(const Account& caller, const Asset& asset,
                                    const UnderlyingAssetConfig& config) {
    require_owner(caller, "set_underlying_asset");
    if (asset.empty()) {
        throw VaultError(Errc::ZeroAddress, "underlying asset");
    }
    if (!valuation_->has_rate(asset)) {
        throw VaultError(Errc::UnknownAsset, "no rate provider for " + asset);
    }

    TxScope tx(*journal_);
    journal_->assign(underlying_configs_[asset], config);
    if (!underlying_assets_.contains(asset)) {
        OrderedSet<Asset> next = underlying_assets_;
        next.insert(asset);
        journal_->assign(underlying_assets_, next);
    }
    add_holding_asset(asset);
    tx.commit();

    spdlog::info("Strategy {} accepts {} (min {}, ceiling {})", account_, asset,
                 units::format(config.min_deposit), units::format(config.deposit_ceiling));
}

void Strategy::remove_underlying_asset(const Account& caller, const Asset& asset) {
    require_owner(caller, "remove_underlying_asset");
    if (!underlying_assets_.contains(asset)) {
        throw VaultError(Errc::UnknownAsset, asset + " is not an underlying");
    }

    TxScope tx(*journal_);
    OrderedSet<Asset> next = underlying_assets_;
    next.erase(asset);
    journal_->assign(underlying_assets_, next);

    // Still held assets stay enumerable so withdrawals keep paying them out
    bool core = asset == settlement_asset_ || asset == receipt_asset_ || asset == NATIVE_COIN;
    if (!core && ledger_.reserves(asset) == 0) {
        OrderedSet<Asset> holdings = holding_assets_;
        holdings.erase(asset);
        journal_->assign(holding_assets_, holdings);
    }
    tx.commit();
}

void Strategy::set_min_deposit(const Account& caller, const Asset& asset, const Amount& min_deposit) {
    require_owner(caller, "set_min_deposit");
    if (!underlying_assets_.contains(asset)) {
        throw VaultError(Errc::UnknownAsset, asset + " is not an underlying");
    }
    TxScope tx(*journal_);
    journal_->assign(underlying_configs_[asset].min_deposit, min_deposit);
    tx.commit();
}

void Strategy::set_deposit_ceiling(const Account& caller, const Asset& asset, const Amount& ceiling) {
    require_owner(caller, "set_deposit_ceiling");
    if (!underlying_assets_.contains(asset)) {
        throw VaultError(Errc::UnknownAsset, asset + " is not an underlying");
    }
    TxScope tx(*journal_);
    journal_->assign(underlying_configs_[asset].deposit_ceiling, ceiling);
    tx.commit();
}

void Strategy::add_wrapper(const Account& caller, std::shared_ptr<IWrapper> wrapper) {
    require_owner(caller, "add_wrapper");
    if (!wrapper) {
        throw VaultError(Errc::ZeroAddress, "wrapper");
    }
    if (!valuation_->has_rate(wrapper->wrapped_asset())) {
        valuation_->set_rate_provider(wrapper->wrapped_asset(), wrapper);
    }
    TxScope tx(*journal_);
    journal_->assign(wrappers_[wrapper->unwrapped_asset()], wrapper);
    tx.commit();
}

void Strategy::add_swapper(const Account& caller, const Asset& token_in, const Asset& token_out,
                           std::shared_ptr<ISwapper> swapper) {
    require_owner(caller, "add_swapper");
    if (!swapper) {
        throw VaultError(Errc::ZeroAddress, "swapper");
    }

    TxScope tx(*journal_);
    journal_->assign(swappers_[swapper->id()], swapper);
    journal_->assign(enabled_swappers_[BindingKey(token_in, token_out, swapper->id())], true);
    tx.commit();

    spdlog::info("Strategy {} enabled swapper {} for {} -> {}", account_, swapper->id(),
                 token_in, token_out);
}

void Strategy::remove_swapper(const Account& caller, const Asset& token_in, const Asset& token_out,
                              const std::string& swapper_id) {
    require_owner(caller, "remove_swapper");
    if (!is_swapper_enabled(token_in, token_out, swapper_id)) {
        throw VaultError(Errc::NotSupportedSwapper,
                         swapper_id + " not enabled for " + token_in + " -> " + token_out);
    }
    if (default_swapper(token_in, token_out) == swapper_id) {
        throw VaultError(Errc::SetDefaultSwapperBefore,
                         swapper_id + " is the default for " + token_in + " -> " + token_out);
    }

    TxScope tx(*journal_);
    journal_->assign(enabled_swappers_[BindingKey(token_in, token_out, swapper_id)], false);
    tx.commit();
}

void Strategy::set_default_swapper(const Account& caller, const Asset& token_in,
                                   const Asset& token_out, const std::string& swapper_id) {
    require_owner(caller, "set_default_swapper");
    if (!is_swapper_enabled(token_in, token_out, swapper_id)) {
        throw VaultError(Errc::NotSupportedSwapper,
                         swapper_id + " not enabled for " + token_in + " -> " + token_out);
    }

    TxScope tx(*journal_);
    journal_->assign(default_swappers_[PairKey(token_in, token_out)], swapper_id);
    tx.commit();
}
