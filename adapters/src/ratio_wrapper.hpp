#pragma once

#include "capabilities.hpp"
#include "token_bank.hpp"
#include <memory>

// Non-rebasing wrapper around a rebasing derivative.
// ratio = unwrapped units per wrapped unit, 1e18-scaled.
class RatioWrapper : public IWrapper {
public:
    RatioWrapper(const Account& account,
                 const Asset& unwrapped_asset,
                 const Asset& wrapped_asset,
                 std::shared_ptr<TokenBank> bank,
                 const Amount& ratio,
                 std::shared_ptr<IRateProvider> unwrapped_rate = nullptr);

    const Asset& unwrapped_asset() const override { return unwrapped_asset_; }
    const Asset& wrapped_asset() const override { return wrapped_asset_; }

    Amount wrap(const Account& caller, const Amount& amount) override;
    Amount unwrap(const Account& caller, const Amount& amount);

    // ratio times the unwrapped asset's own rate (1:1 when none given)
    Amount settlement_rate() const override;

    void set_ratio(const Amount& ratio);

private:
    Account account_;
    Asset unwrapped_asset_;
    Asset wrapped_asset_;
    std::shared_ptr<TokenBank> bank_;
    Amount ratio_;
    std::shared_ptr<IRateProvider> unwrapped_rate_;
};
