#pragma once

#include "amount.hpp"
#include "journal.hpp"
#include "reentrancy.hpp"
#include "strategy.hpp"
#include "token_bank.hpp"
#include "util.hpp"
#include <map>
#include <memory>

// Multi-asset vault. Issues shares against the strategy's reported total
// value and holds each depositor to a lock-up after every deposit.
class Vault {
public:
    Vault(const Account& account,
          const Account& owner,
          std::shared_ptr<StateJournal> journal,
          std::shared_ptr<TokenBank> bank,
          util::Clock clock,
          int64_t min_lock_up_period);

    // Returns the shares minted to caller.
    Amount deposit(const Account& caller, const Asset& asset, const Amount& amount,
                   bool sell_for_settlement);

    WithdrawResult withdraw(const Account& caller, const Amount& shares, const Account& recipient);

    // Owner-only. Moves funds out of the current strategy (if any) before
    // switching over, all in one call.
    void set_strategy(const Account& caller, std::shared_ptr<Strategy> strategy);
    void set_min_lock_up_period(const Account& caller, int64_t seconds);

    Amount total_assets() const;
    Amount total_supply() const { return total_supply_; }
    Amount balance_of(const Account& holder) const;
    int64_t locked_until(const Account& holder) const;
    bool is_locked(const Account& holder) const;
    Amount convert_to_assets(const Amount& shares) const;
    Amount share_price() const;   // settlement value per whole share, 1e18-scaled

    const Account& account() const { return account_; }
    const Account& owner() const { return owner_; }
    int64_t min_lock_up_period() const { return min_lock_up_period_; }
    std::shared_ptr<Strategy> strategy() const { return strategy_; }

private:
    Account account_;
    Account owner_;
    std::shared_ptr<StateJournal> journal_;
    std::shared_ptr<TokenBank> bank_;
    util::Clock clock_;
    int64_t min_lock_up_period_;

    std::shared_ptr<Strategy> strategy_;
    ReentrancyGuard guard_;

    Amount total_supply_ = 0;
    std::map<Account, Amount> shares_;
    std::map<Account, int64_t> locked_until_;

    void require_strategy() const;
    void mint_shares(const Account& holder, const Amount& shares);
    void burn_shares(const Account& holder, const Amount& shares);
};
