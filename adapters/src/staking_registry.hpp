#pragma once

#include "capabilities.hpp"
#include "token_bank.hpp"
#include <memory>

// Stake pool taking settlement asset and minting a receipt whose
// settlement value grows as accrue() raises the exchange rate.
class StakingRegistry : public IStakingRegistry {
public:
    StakingRegistry(const Account& account,
                    const Asset& settlement_asset,
                    const Asset& receipt_asset,
                    std::shared_ptr<TokenBank> bank,
                    const Amount& initial_rate = ONE_UNIT);

    const Asset& settlement_asset() const override { return settlement_asset_; }
    const Asset& receipt_asset() const override { return receipt_asset_; }
    Amount settlement_rate() const override { return rate_; }

    Amount deposit(const Account& caller, const Account& owner, const Amount& amount) override;
    Amount withdraw(const Account& caller, const Account& recipient, const Amount& amount) override;
    bool can_withdraw(const Account& owner, const Amount& amount) const override;

    // Raises the rate and mints the settlement backing the extra value.
    void accrue(const Amount& new_rate);

    void set_withdraw_fee_bps(int fee_bps);
    void set_withdraw_limits(const Amount& min_amount, const Amount& max_amount);
    void set_paused(bool paused);

    const Account& account() const { return account_; }
    Amount outstanding() const { return outstanding_; }

private:
    Account account_;
    Asset settlement_asset_;
    Asset receipt_asset_;
    std::shared_ptr<TokenBank> bank_;

    Amount rate_;
    Amount outstanding_ = 0;
    int withdraw_fee_bps_ = 0;
    Amount min_withdrawal_ = 0;
    Amount max_withdrawal_ = 0;   // 0 = unlimited
    bool paused_ = false;
};
