#include "ratio_wrapper.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

RatioWrapper::RatioWrapper(const Account& account,
                           const Asset& unwrapped_asset,
                           const Asset& wrapped_asset,
                           std::shared_ptr<TokenBank> bank,
                           const Amount& ratio,
                           std::shared_ptr<IRateProvider> unwrapped_rate)
    : account_(account)
    , unwrapped_asset_(unwrapped_asset)
    , wrapped_asset_(wrapped_asset)
    , bank_(bank)
    , ratio_(ratio)
    , unwrapped_rate_(unwrapped_rate)
{
    if (account_.empty() || unwrapped_asset_.empty() || wrapped_asset_.empty()) {
        throw VaultError(Errc::ZeroAddress, "wrapper account and assets are required");
    }
    if (ratio_ == 0) {
        throw VaultError(Errc::TooSmall, "wrapper ratio must be positive");
    }
}

Amount RatioWrapper::wrap(const Account& caller, const Amount& amount) {
    Amount wrapped = units::mul_div(amount, ONE_UNIT, ratio_);
    if (wrapped == 0) {
        throw VaultError(Errc::TooSmall, "wrapping " + units::format(amount) + " yields nothing");
    }

    bank_->transfer(unwrapped_asset_, caller, account_, amount);
    bank_->mint(wrapped_asset_, caller, wrapped);

    spdlog::debug("Wrapped {} {} -> {} {} for {}", units::format(amount), unwrapped_asset_,
                  units::format(wrapped), wrapped_asset_, util::short_id(caller));
    return wrapped;
}

Amount RatioWrapper::unwrap(const Account& caller, const Amount& amount) {
    Amount unwrapped = units::mul_div(amount, ratio_, ONE_UNIT);

    bank_->burn(wrapped_asset_, caller, amount);
    bank_->transfer(unwrapped_asset_, account_, caller, unwrapped);
    return unwrapped;
}

Amount RatioWrapper::settlement_rate() const {
    if (!unwrapped_rate_) return ratio_;
    return units::mul_div(ratio_, unwrapped_rate_->settlement_rate(), ONE_UNIT);
}

void RatioWrapper::set_ratio(const Amount& ratio) {
    if (ratio == 0) {
        throw VaultError(Errc::TooSmall, "wrapper ratio must be positive");
    }
    spdlog::info("{} ratio {} -> {}", wrapped_asset_, units::format(ratio_), units::format(ratio));
    ratio_ = ratio;
}
