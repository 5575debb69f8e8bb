#pragma once

#include "capabilities.hpp"

// Settable rate for assets priced by an oracle rather than a wrapper or
// the registry.
class PriceFeed : public IRateProvider {
public:
    explicit PriceFeed(const Amount& rate = ONE_UNIT);

    Amount settlement_rate() const override { return rate_; }
    void set_rate(const Amount& rate);

private:
    Amount rate_;
};
