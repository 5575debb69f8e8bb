#pragma once

#include "amount.hpp"
#include "capabilities.hpp"
#include "journal.hpp"
#include "ordered_set.hpp"
#include "reentrancy.hpp"
#include "reserve_ledger.hpp"
#include "token_bank.hpp"
#include "valuation.hpp"
#include <map>
#include <memory>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

struct UnderlyingAssetConfig {
    Amount min_deposit = 0;
    Amount deposit_ceiling = 0;   // 0 = no ceiling
};

struct StrategyConfig {
    // Registry receipt legs below this are left in reserve on withdraw
    Amount registry_dust_floor = Amount(1000000000ULL);
};

struct WithdrawResult {
    Amount settlement_out = 0;
    Amount native_out = 0;
};

struct MigratedAmount {
    Asset asset;
    Amount amount;
};

using MigrationManifest = std::vector<MigratedAmount>;

// Holds the vault's assets. Owns the reserve ledger and the swap bindings;
// only the bound vault may move funds in or out.
class Strategy {
public:
    Strategy(const Account& account,
             const Account& owner,
             std::shared_ptr<StateJournal> journal,
             std::shared_ptr<TokenBank> bank,
             std::shared_ptr<Valuation> valuation,
             std::shared_ptr<IStakingRegistry> registry,
             StrategyConfig config = StrategyConfig());

    // Vault-only. The asset must already sit in this strategy's bank account.
    // Returns the canonical amount credited to the ledger.
    Amount deposit(const Account& caller, const Asset& asset, const Amount& amount,
                   bool sell_for_settlement);

    // Vault-only. Pays recipient share_amount/total_supply of every holding.
    WithdrawResult withdraw(const Account& caller, const Amount& share_amount,
                            const Amount& total_supply, const Account& recipient);

    // Manager-only. Uses an explicitly enabled binding and honours min_amount_out.
    Amount invoke_swap(const Account& caller, const std::string& swapper_id,
                       const Asset& token_in, const Amount& amount_in,
                       const Asset& token_out, const Amount& min_amount_out);

    // Vault-only. Moves every reserve to new_strategy and zeroes this ledger.
    MigrationManifest migrate_funds(const Account& caller, const Account& new_strategy);

    // Vault-only. Books what the previous strategy sent over.
    void accept_migration(const Account& caller, const Account& prev_strategy,
                          const MigrationManifest& manifest);

    // Reads
    Amount reserves(const Asset& asset) const { return ledger_.reserves(asset); }
    Amount asset_value(const Asset& asset, const Amount& quantity) const;
    Amount total_assets() const;
    const std::vector<Asset>& holding_assets() const { return holding_assets_.items(); }
    const std::vector<Asset>& underlying_assets() const { return underlying_assets_.items(); }
    bool is_underlying(const Asset& asset) const { return underlying_assets_.contains(asset); }
    UnderlyingAssetConfig underlying_config(const Asset& asset) const;
    bool is_swapper_enabled(const Asset& token_in, const Asset& token_out,
                            const std::string& swapper_id) const;
    std::string default_swapper(const Asset& token_in, const Asset& token_out) const;

    const Account& account() const { return account_; }
    const Account& owner() const { return owner_; }
    const Account& vault() const { return vault_; }
    const Asset& settlement_asset() const { return settlement_asset_; }
    const Asset& receipt_asset() const { return receipt_asset_; }

    // Owner-only administration
    void set_vault(const Account& caller, const Account& vault);
    void set_manager(const Account& caller, const Account& manager);
    void set_underlying_asset(const Account& caller, const Asset& asset,
                              const UnderlyingAssetConfig& config);
    void remove_underlying_asset(const Account& caller, const Asset& asset);
    void set_min_deposit(const Account& caller, const Asset& asset, const Amount& min_deposit);
    void set_deposit_ceiling(const Account& caller, const Asset& asset, const Amount& ceiling);
    void add_wrapper(const Account& caller, std::shared_ptr<IWrapper> wrapper);
    void add_swapper(const Account& caller, const Asset& token_in, const Asset& token_out,
                     std::shared_ptr<ISwapper> swapper);
    void remove_swapper(const Account& caller, const Asset& token_in, const Asset& token_out,
                        const std::string& swapper_id);
    void set_default_swapper(const Account& caller, const Asset& token_in,
                             const Asset& token_out, const std::string& swapper_id);

private:
    using BindingKey = std::tuple<Asset, Asset, std::string>;
    using PairKey = std::pair<Asset, Asset>;

    Account account_;
    Account owner_;
    Account manager_;
    Account vault_;
    Asset settlement_asset_;
    Asset receipt_asset_;
    StrategyConfig config_;

    std::shared_ptr<StateJournal> journal_;
    std::shared_ptr<TokenBank> bank_;
    std::shared_ptr<Valuation> valuation_;
    std::shared_ptr<IStakingRegistry> registry_;

    ReserveLedger ledger_;
    ReentrancyGuard guard_;

    OrderedSet<Asset> holding_assets_;
    OrderedSet<Asset> underlying_assets_;
    std::map<Asset, UnderlyingAssetConfig> underlying_configs_;
    std::map<Asset, std::shared_ptr<IWrapper>> wrappers_;
    std::map<std::string, std::shared_ptr<ISwapper>> swappers_;
    std::map<BindingKey, bool> enabled_swappers_;
    std::map<PairKey, std::string> default_swappers_;

    void require_owner(const Account& caller, const char* op) const;
    void require_manager(const Account& caller, const char* op) const;
    void require_vault(const Account& caller, const char* op) const;

    void add_holding_asset(const Asset& asset);

    // Sends settlement into the registry, swapping the ledger leg for receipt.
    void stake_settlement(const Amount& amount);

    // Automatic routing: default binding, no minimum output.
    Amount swap_token_for_token(const Asset& token_in, const Amount& amount_in,
                                const Asset& token_out);

    Amount execute_swap(ISwapper& swapper, const Asset& token_in, const Amount& amount_in,
                        const Asset& token_out, const Amount& min_amount_out);
};
