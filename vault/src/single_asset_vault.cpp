#include "single_asset_vault.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

SingleAssetVault::SingleAssetVault(const Account& account,
                                   const Account& owner,
                                   const Asset& asset,
                                   std::shared_ptr<StateJournal> journal,
                                   std::shared_ptr<TokenBank> bank,
                                   util::Clock clock,
                                   int64_t lock_period,
                                   const Amount& min_deposit)
    : account_(account)
    , owner_(owner)
    , asset_(asset)
    , journal_(journal)
    , bank_(bank)
    , clock_(clock)
    , lock_period_(lock_period)
    , min_deposit_(min_deposit)
{
    if (account_.empty() || owner_.empty() || asset_.empty()) {
        throw VaultError(Errc::ZeroAddress, "single-asset vault account, owner and asset are required");
    }
    if (asset_ == NATIVE_COIN) {
        throw VaultError(Errc::UnknownAsset, "single-asset vault cannot hold the native coin");
    }
}

Amount SingleAssetVault::balance_of(const Account& holder) const {
    auto it = shares_.find(holder);
    if (it == shares_.end()) return 0;
    return it->second;
}

Amount SingleAssetVault::deposit(const Account& caller, const Amount& amount) {
    if (caller.empty()) {
        throw VaultError(Errc::ZeroAddress, "depositor");
    }
    if (amount == 0 || amount < min_deposit_) {
        throw VaultError(Errc::TooSmall, "deposit of " + units::format(amount) + " " + asset_ +
                         ", minimum " + units::format(min_deposit_));
    }

    TxScope tx(*journal_);
    ReentrancyLock lock(guard_, "SingleAssetVault::deposit");

    Amount prior_total = total_assets();
    if (total_supply_ > 0 && prior_total == 0) {
        throw VaultError(Errc::TooSmall, account_ + " has shares outstanding against no value");
    }
    Amount shares = total_supply_ == 0
        ? amount
        : units::mul_div(amount, total_supply_, prior_total);
    if (shares == 0) {
        throw VaultError(Errc::TooSmall, "deposit mints no shares");
    }

    bank_->transfer(asset_, caller, account_, amount);
    journal_->assign(held_, Amount(held_ + amount));

    Amount& balance = shares_[caller];
    journal_->assign(balance, Amount(balance + shares));
    journal_->assign(total_supply_, Amount(total_supply_ + shares));
    journal_->assign(unlock_time_, clock_() + lock_period_);

    tx.commit();

    spdlog::info("{} deposit {} {} by {}, pool locked until {}", account_, units::format(amount),
                 asset_, util::short_id(caller), unlock_time_);
    return shares;
}

WithdrawResult SingleAssetVault::withdraw(const Account& caller, const Amount& shares,
                                          const Account& recipient) {
    if (caller.empty() || recipient.empty()) {
        throw VaultError(Errc::ZeroAddress, "withdraw caller/recipient");
    }
    if (shares == 0) {
        throw VaultError(Errc::TooSmall, "withdraw of zero shares");
    }
    if (shares > balance_of(caller)) {
        throw VaultError(Errc::InsufficientBalance, util::short_id(caller) + " share balance too low");
    }
    int64_t now = clock_();
    if (now < unlock_time_) {
        throw VaultError(Errc::ComeBackLater,
                         fmt::format("{} locked for another {}s", account_, unlock_time_ - now));
    }

    TxScope tx(*journal_);
    ReentrancyLock lock(guard_, "SingleAssetVault::withdraw");

    WithdrawResult result;
    result.settlement_out = units::mul_div(held_, shares, total_supply_);
    result.native_out = units::mul_div(native_held_, shares, total_supply_);
    journal_->assign(held_, Amount(held_ - result.settlement_out));
    journal_->assign(native_held_, Amount(native_held_ - result.native_out));

    Amount& balance = shares_[caller];
    journal_->assign(balance, units::checked_sub(balance, shares, "shares of " + caller));
    journal_->assign(total_supply_, units::checked_sub(total_supply_, shares, "total supply"));

    if (result.settlement_out > 0) {
        bank_->transfer(asset_, account_, recipient, result.settlement_out);
    }
    if (result.native_out > 0) {
        bank_->transfer(NATIVE_COIN, account_, recipient, result.native_out);
    }

    tx.commit();

    spdlog::info("{} withdraw {} shares to {}: {} {} + {} native", account_, units::format(shares),
                 util::short_id(recipient), units::format(result.settlement_out), asset_,
                 units::format(result.native_out));
    return result;
}

Amount SingleAssetVault::swap_native_for_asset(const Account& caller, const Amount& native_amount) {
    if (caller.empty()) {
        throw VaultError(Errc::ZeroAddress, "swap caller");
    }
    if (native_amount == 0) {
        throw VaultError(Errc::TooSmall, "swap of zero native");
    }

    TxScope tx(*journal_);
    ReentrancyLock lock(guard_, "SingleAssetVault::swap_native_for_asset");

    if (held_ < native_amount) {
        throw VaultError(Errc::InsufficientBalance,
                         account_ + " holds only " + units::format(held_) + " " + asset_);
    }

    bank_->transfer(NATIVE_COIN, caller, account_, native_amount);
    bank_->transfer(asset_, account_, caller, native_amount);
    journal_->assign(held_, Amount(held_ - native_amount));
    journal_->assign(native_held_, Amount(native_held_ + native_amount));

    tx.commit();

    spdlog::info("{} swapped {} native for {} by {}", account_, units::format(native_amount),
                 asset_, util::short_id(caller));
    return native_amount;
}

void SingleAssetVault::set_lock_period(const Account& caller, int64_t seconds) {
    if (caller != owner_) {
        throw VaultError(Errc::Unauthorized, "set_lock_period is owner-only, caller " + caller);
    }
    if (seconds < 0) {
        throw std::invalid_argument("lock period cannot be negative");
    }
    TxScope tx(*journal_);
    journal_->assign(lock_period_, seconds);
    tx.commit();
}

void SingleAssetVault::set_min_deposit(const Account& caller, const Amount& amount) {
    if (caller != owner_) {
        throw VaultError(Errc::Unauthorized, "set_min_deposit is owner-only, caller " + caller);
    }
    TxScope tx(*journal_);
    journal_->assign(min_deposit_, amount);
    tx.commit();
}
