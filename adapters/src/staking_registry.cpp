#include "staking_registry.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

StakingRegistry::StakingRegistry(const Account& account,
                                 const Asset& settlement_asset,
                                 const Asset& receipt_asset,
                                 std::shared_ptr<TokenBank> bank,
                                 const Amount& initial_rate)
    : account_(account)
    , settlement_asset_(settlement_asset)
    , receipt_asset_(receipt_asset)
    , bank_(bank)
    , rate_(initial_rate)
{
    if (account_.empty() || settlement_asset_.empty() || receipt_asset_.empty()) {
        throw VaultError(Errc::ZeroAddress, "registry account and assets are required");
    }
    if (rate_ == 0) {
        throw VaultError(Errc::TooSmall, "registry rate must be positive");
    }
}

Amount StakingRegistry::deposit(const Account& caller, const Account& owner, const Amount& amount) {
    if (amount == 0) {
        throw VaultError(Errc::TooSmall, "registry deposit of zero");
    }
    if (owner.empty()) {
        throw VaultError(Errc::ZeroAddress, "registry deposit owner");
    }

    Amount minted = units::mul_div(amount, ONE_UNIT, rate_);
    if (minted == 0) {
        throw VaultError(Errc::TooSmall, "registry deposit mints no receipt");
    }

    bank_->transfer(settlement_asset_, caller, account_, amount);
    bank_->mint(receipt_asset_, owner, minted);
    bank_->journal().assign(outstanding_, Amount(outstanding_ + minted));

    spdlog::debug("Registry minted {} {} to {}", units::format(minted), receipt_asset_,
                  util::short_id(owner));
    return minted;
}

Amount StakingRegistry::withdraw(const Account& caller, const Account& recipient, const Amount& amount) {
    if (!can_withdraw(caller, amount)) {
        throw VaultError(Errc::WithdrawNotEligible,
                         util::short_id(caller) + " cannot withdraw " + units::format(amount));
    }

    Amount proceeds = units::mul_div(amount, rate_, ONE_UNIT);
    if (withdraw_fee_bps_ > 0) {
        proceeds -= units::mul_div(proceeds, Amount(withdraw_fee_bps_), Amount(10000));
    }

    bank_->burn(receipt_asset_, caller, amount);
    bank_->journal().assign(outstanding_, units::checked_sub(outstanding_, amount, "registry outstanding"));
    bank_->transfer(settlement_asset_, account_, recipient, proceeds);

    spdlog::debug("Registry redeemed {} {} for {} {}", units::format(amount), receipt_asset_,
                  units::format(proceeds), settlement_asset_);
    return proceeds;
}

bool StakingRegistry::can_withdraw(const Account& owner, const Amount& amount) const {
    if (paused_ || amount == 0) return false;
    if (amount < min_withdrawal_) return false;
    if (max_withdrawal_ != 0 && amount > max_withdrawal_) return false;
    return bank_->balance_of(receipt_asset_, owner) >= amount;
}

void StakingRegistry::accrue(const Amount& new_rate) {
    if (new_rate == 0) {
        throw VaultError(Errc::TooSmall, "registry rate must be positive");
    }
    if (new_rate > rate_) {
        Amount backing = units::mul_div(outstanding_, Amount(new_rate - rate_), ONE_UNIT);
        bank_->mint(settlement_asset_, account_, backing);
    }
    spdlog::info("Registry rate {} -> {}", units::format(rate_), units::format(new_rate));
    rate_ = new_rate;
}

void StakingRegistry::set_withdraw_fee_bps(int fee_bps) {
    if (fee_bps < 0 || fee_bps > 10000) {
        throw std::invalid_argument("withdraw fee must be within 0..10000 bps");
    }
    withdraw_fee_bps_ = fee_bps;
}

void StakingRegistry::set_withdraw_limits(const Amount& min_amount, const Amount& max_amount) {
    min_withdrawal_ = min_amount;
    max_withdrawal_ = max_amount;
}

void StakingRegistry::set_paused(bool paused) {
    paused_ = paused;
}
