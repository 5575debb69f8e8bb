#include "vault.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

Vault::Vault(const Account& account,
             const Account& owner,
             std::shared_ptr<StateJournal> journal,
             std::shared_ptr<TokenBank> bank,
             util::Clock clock,
             int64_t min_lock_up_period)
    : account_(account)
    , owner_(owner)
    , journal_(journal)
    , bank_(bank)
    , clock_(clock)
    , min_lock_up_period_(min_lock_up_period)
{
    if (account_.empty() || owner_.empty()) {
        throw VaultError(Errc::ZeroAddress, "vault account and owner are required");
    }
    if (!journal_ || !bank_ || !clock_) {
        throw VaultError(Errc::ZeroAddress, "vault " + account_ + " missing a dependency");
    }
    if (min_lock_up_period_ < 0) {
        throw std::invalid_argument("lock-up period cannot be negative");
    }
}

void Vault::require_strategy() const {
    if (!strategy_) {
        throw VaultError(Errc::ZeroAddress, "vault " + account_ + " has no strategy");
    }
}

void Vault::mint_shares(const Account& holder, const Amount& shares) {
    Amount& balance = shares_[holder];
    journal_->assign(balance, Amount(balance + shares));
    journal_->assign(total_supply_, Amount(total_supply_ + shares));
}

void Vault::burn_shares(const Account& holder, const Amount& shares) {
    Amount& balance = shares_[holder];
    journal_->assign(balance, units::checked_sub(balance, shares, "shares of " + holder));
    journal_->assign(total_supply_, units::checked_sub(total_supply_, shares, "total supply"));
}

Amount Vault::deposit(const Account& caller, const Asset& asset, const Amount& amount,
                      bool sell_for_settlement) {
    if (caller.empty()) {
        throw VaultError(Errc::ZeroAddress, "depositor");
    }
    if (amount == 0) {
        throw VaultError(Errc::TooSmall, "deposit of zero " + asset);
    }
    require_strategy();

    TxScope tx(*journal_);
    ReentrancyLock lock(guard_, "Vault::deposit");

    // Price against value before this deposit lands
    Amount prior_total = strategy_->total_assets();

    bank_->transfer(asset, caller, strategy_->account(), amount);
    strategy_->deposit(account_, asset, amount, sell_for_settlement);

    Amount after_total = strategy_->total_assets();
    Amount value = after_total > prior_total ? Amount(after_total - prior_total) : Amount(0);

    if (total_supply_ > 0 && prior_total == 0) {
        throw VaultError(Errc::TooSmall,
                         units::format(total_supply_) + " shares outstanding against no value");
    }

    Amount shares = total_supply_ == 0
        ? value
        : units::mul_div(value, total_supply_, prior_total);
    if (shares == 0) {
        throw VaultError(Errc::TooSmall,
                         "deposit of " + units::format(amount) + " " + asset + " mints no shares");
    }

    mint_shares(caller, shares);
    int64_t& lock_slot = locked_until_[caller];
    journal_->assign(lock_slot, clock_() + min_lock_up_period_);

    tx.commit();

    spdlog::info("Deposit {} {} by {}: value {}, {} shares, locked until {}",
                 units::format(amount), asset, util::short_id(caller), units::format(value),
                 units::format(shares), lock_slot);
    return shares;
}

WithdrawResult Vault::withdraw(const Account& caller, const Amount& shares, const Account& recipient) {
    if (caller.empty() || recipient.empty()) {
        throw VaultError(Errc::ZeroAddress, "withdraw caller/recipient");
    }
    if (shares == 0) {
        throw VaultError(Errc::TooSmall, "withdraw of zero shares");
    }
    if (shares > balance_of(caller)) {
        throw VaultError(Errc::InsufficientBalance,
                         util::short_id(caller) + " holds " + units::format(balance_of(caller)) +
                         " shares, asked " + units::format(shares));
    }

    int64_t now = clock_();
    int64_t until = locked_until(caller);
    if (now < until) {
        throw VaultError(Errc::ComeBackLater,
                         fmt::format("{} locked for another {}s", util::short_id(caller), until - now));
    }
    require_strategy();

    TxScope tx(*journal_);
    ReentrancyLock lock(guard_, "Vault::withdraw");

    WithdrawResult result = strategy_->withdraw(account_, shares, total_supply_, recipient);
    burn_shares(caller, shares);

    tx.commit();

    spdlog::info("Withdraw {} shares by {} to {}", units::format(shares),
                 util::short_id(caller), util::short_id(recipient));
    return result;
}

void Vault::set_strategy(const Account& caller, std::shared_ptr<Strategy> strategy) {
    if (caller != owner_) {
        throw VaultError(Errc::Unauthorized, "set_strategy is owner-only, caller " + caller);
    }
    if (!strategy) {
        throw VaultError(Errc::ZeroAddress, "strategy");
    }
    if (strategy->vault() != account_) {
        throw VaultError(Errc::Unauthorized,
                         "strategy " + strategy->account() + " is not bound to vault " + account_);
    }
    if (strategy_ == strategy) return;

    TxScope tx(*journal_);
    ReentrancyLock lock(guard_, "Vault::set_strategy");

    std::shared_ptr<Strategy> previous = strategy_;
    if (previous) {
        Amount before = previous->total_assets();
        MigrationManifest manifest = previous->migrate_funds(account_, strategy->account());
        strategy->accept_migration(account_, previous->account(), manifest);
        spdlog::info("Migrated {} of value from {} to {}", units::format(before),
                     previous->account(), strategy->account());
    }

    // Pointer moves in the same call as the funds; the old strategy is
    // unreachable from here on.
    journal_->assign(strategy_, strategy);

    tx.commit();
    spdlog::info("Vault {} strategy set to {}", account_, strategy->account());
}

void Vault::set_min_lock_up_period(const Account& caller, int64_t seconds) {
    if (caller != owner_) {
        throw VaultError(Errc::Unauthorized, "set_min_lock_up_period is owner-only, caller " + caller);
    }
    if (seconds < 0) {
        throw std::invalid_argument("lock-up period cannot be negative");
    }
    TxScope tx(*journal_);
    journal_->assign(min_lock_up_period_, seconds);
    tx.commit();
}

Amount Vault::total_assets() const {
    if (!strategy_) return 0;
    return strategy_->total_assets();
}

Amount Vault::balance_of(const Account& holder) const {
    auto it = shares_.find(holder);
    if (it == shares_.end()) return 0;
    return it->second;
}

int64_t Vault::locked_until(const Account& holder) const {
    auto it = locked_until_.find(holder);
    if (it == locked_until_.end()) return 0;
    return it->second;
}

bool Vault::is_locked(const Account& holder) const {
    return clock_() < locked_until(holder);
}

Amount Vault::convert_to_assets(const Amount& shares) const {
    if (total_supply_ == 0) return shares;
    return units::mul_div(shares, total_assets(), total_supply_);
}

Amount Vault::share_price() const {
    return convert_to_assets(ONE_UNIT);
}
