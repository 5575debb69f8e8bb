#include "valuation.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

Valuation::Valuation(const Asset& settlement_asset)
    : settlement_asset_(settlement_asset)
{}

void Valuation::set_rate_provider(const Asset& asset, std::shared_ptr<IRateProvider> provider) {
    if (!provider) {
        throw VaultError(Errc::ZeroAddress, "rate provider for " + asset);
    }
    providers_[asset] = provider;
    spdlog::debug("Rate provider set for {}", asset);
}

bool Valuation::has_rate(const Asset& asset) const {
    return asset == settlement_asset_ || asset == NATIVE_COIN || providers_.count(asset) > 0;
}

Amount Valuation::rate_of(const Asset& asset) const {
    if (asset == settlement_asset_ || asset == NATIVE_COIN) {
        return ONE_UNIT;
    }

    auto it = providers_.find(asset);
    if (it == providers_.end()) {
        throw VaultError(Errc::UnknownAsset, "no rate for " + asset);
    }
    return it->second->settlement_rate();
}

Amount Valuation::asset_value(const Asset& asset, const Amount& quantity) const {
    if (quantity == 0) return 0;
    return units::mul_div(quantity, rate_of(asset), ONE_UNIT);
}
