#pragma once

#include "amount.hpp"
#include "capabilities.hpp"
#include <map>
#include <memory>

// Converts asset quantities into settlement-asset value. Rates are read
// from the providers on every call; they accrue over time.
class Valuation {
public:
    explicit Valuation(const Asset& settlement_asset);

    void set_rate_provider(const Asset& asset, std::shared_ptr<IRateProvider> provider);
    bool has_rate(const Asset& asset) const;

    // 1e18-scaled settlement value of one whole unit of asset.
    // Settlement asset and native coin are 1:1. UnknownAsset if unpriced.
    Amount rate_of(const Asset& asset) const;

    Amount asset_value(const Asset& asset, const Amount& quantity) const;

    const Asset& settlement_asset() const { return settlement_asset_; }

private:
    Asset settlement_asset_;
    std::map<Asset, std::shared_ptr<IRateProvider>> providers_;
};
