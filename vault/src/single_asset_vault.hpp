#pragma once

#include "amount.hpp"
#include "journal.hpp"
#include "reentrancy.hpp"
#include "strategy.hpp"
#include "token_bank.hpp"
#include "util.hpp"
#include <map>
#include <memory>

// One-asset vault with a pool-wide time lock. Anyone may swap native coin
// for the held asset at 1:1, which keeps settlement liquidity available
// without a swap venue. Balances are accounted internally; coins sent
// straight to the account do not count.
class SingleAssetVault {
public:
    SingleAssetVault(const Account& account,
                     const Account& owner,
                     const Asset& asset,
                     std::shared_ptr<StateJournal> journal,
                     std::shared_ptr<TokenBank> bank,
                     util::Clock clock,
                     int64_t lock_period,
                     const Amount& min_deposit = 0);

    Amount deposit(const Account& caller, const Amount& amount);

    // Pays pro-rata of both the held asset and accumulated native coin.
    WithdrawResult withdraw(const Account& caller, const Amount& shares, const Account& recipient);

    // Caller pays native, receives the same nominal amount of the asset.
    Amount swap_native_for_asset(const Account& caller, const Amount& native_amount);

    void set_lock_period(const Account& caller, int64_t seconds);
    void set_min_deposit(const Account& caller, const Amount& amount);

    // held asset + native, native at 1:1 nominal
    Amount total_assets() const { return held_ + native_held_; }
    Amount held() const { return held_; }
    Amount native_held() const { return native_held_; }
    Amount min_deposit() const { return min_deposit_; }
    Amount total_supply() const { return total_supply_; }
    Amount balance_of(const Account& holder) const;
    int64_t unlock_time() const { return unlock_time_; }

    const Account& account() const { return account_; }
    const Asset& asset() const { return asset_; }

private:
    Account account_;
    Account owner_;
    Asset asset_;
    std::shared_ptr<StateJournal> journal_;
    std::shared_ptr<TokenBank> bank_;
    util::Clock clock_;
    int64_t lock_period_;
    Amount min_deposit_;
    ReentrancyGuard guard_;

    int64_t unlock_time_ = 0;
    Amount held_ = 0;
    Amount native_held_ = 0;
    Amount total_supply_ = 0;
    std::map<Account, Amount> shares_;
};
