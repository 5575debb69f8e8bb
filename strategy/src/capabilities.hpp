#pragma once

#include "amount.hpp"
#include <string>

// External collaborators the strategy talks to. Concrete versions live in
// adapters/; tests substitute their own.

// Settlement-asset value of one whole unit (1e18 == 1:1).
class IRateProvider {
public:
    virtual ~IRateProvider() = default;
    virtual Amount settlement_rate() const = 0;
};

class ISwapper {
public:
    virtual ~ISwapper() = default;

    virtual std::string id() const = 0;

    // Pulls amount_in of token_in from caller and pays token_out back to it.
    // Must fail with InsufficientOutput if the output is below min_amount_out.
    virtual Amount swap(const Account& caller,
                        const Asset& token_in,
                        const Amount& amount_in,
                        const Asset& token_out,
                        const Amount& min_amount_out) = 0;
};

// Custodian minting a yield-bearing receipt against settlement deposits.
// settlement_rate() is the settlement value of one whole receipt unit.
class IStakingRegistry : public IRateProvider {
public:
    virtual const Asset& settlement_asset() const = 0;
    virtual const Asset& receipt_asset() const = 0;

    // Pulls amount of settlement asset from caller, mints receipt to owner.
    virtual Amount deposit(const Account& caller, const Account& owner, const Amount& amount) = 0;

    // Burns amount of receipt from caller, pays settlement to recipient.
    virtual Amount withdraw(const Account& caller, const Account& recipient, const Amount& amount) = 0;

    // Precheck callers must pass before withdraw or moving the receipt.
    virtual bool can_withdraw(const Account& owner, const Amount& amount) const = 0;
};

// Converts a non-canonical form (rebasing derivative) into the canonical
// wrapped asset the strategy accounts in.
class IWrapper : public IRateProvider {
public:
    virtual const Asset& unwrapped_asset() const = 0;
    virtual const Asset& wrapped_asset() const = 0;

    // Pulls amount of the unwrapped asset from caller, returns the wrapped
    // amount credited to caller.
    virtual Amount wrap(const Account& caller, const Amount& amount) = 0;
};
