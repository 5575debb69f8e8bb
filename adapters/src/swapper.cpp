#include "swapper.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

FixedRateSwapper::FixedRateSwapper(const std::string& id, const Account& account,
                                   std::shared_ptr<TokenBank> bank)
    : id_(id)
    , account_(account)
    , bank_(bank)
{
    if (id_.empty() || account_.empty()) {
        throw VaultError(Errc::ZeroAddress, "swapper id and account are required");
    }
}

void FixedRateSwapper::set_rate(const Asset& token_in, const Asset& token_out, const Amount& rate) {
    rates_[{token_in, token_out}] = rate;
    spdlog::debug("Swapper {} rate {} -> {} = {}", id_, token_in, token_out, units::format(rate));
}

bool FixedRateSwapper::supports(const Asset& token_in, const Asset& token_out) const {
    return rates_.count({token_in, token_out}) > 0;
}

Amount FixedRateSwapper::quote(const Asset& token_in, const Amount& amount_in,
                               const Asset& token_out) const {
    auto it = rates_.find({token_in, token_out});
    if (it == rates_.end()) {
        throw VaultError(Errc::NotSupportedSwapper,
                         id_ + " has no route " + token_in + " -> " + token_out);
    }
    return units::mul_div(amount_in, it->second, ONE_UNIT);
}

Amount FixedRateSwapper::swap(const Account& caller,
                              const Asset& token_in,
                              const Amount& amount_in,
                              const Asset& token_out,
                              const Amount& min_amount_out) {
    if (amount_in == 0) {
        throw VaultError(Errc::TooSmall, "swap of zero " + token_in);
    }

    Amount amount_out = quote(token_in, amount_in, token_out);
    if (amount_out < min_amount_out) {
        throw VaultError(Errc::InsufficientOutput,
                         fmt::format("{} {} out, wanted at least {}", units::format(amount_out),
                                     token_out, units::format(min_amount_out)));
    }

    bank_->transfer(token_in, caller, account_, amount_in);
    bank_->transfer(token_out, account_, caller, amount_out);

    spdlog::debug("{} swapped {} {} for {} {} ({})", id_, units::format(amount_in), token_in,
                  units::format(amount_out), token_out, util::short_id(caller));
    return amount_out;
}
