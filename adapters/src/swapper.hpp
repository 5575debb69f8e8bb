#pragma once

#include "capabilities.hpp"
#include "token_bank.hpp"
#include <map>
#include <memory>
#include <utility>

// Swap venue quoting a fixed rate per pair and paying out of its own
// inventory. Stands in for a DEX or aggregator route.
class FixedRateSwapper : public ISwapper {
public:
    FixedRateSwapper(const std::string& id, const Account& account,
                     std::shared_ptr<TokenBank> bank);

    std::string id() const override { return id_; }
    const Account& account() const { return account_; }

    // token_out per token_in, 1e18 == 1:1
    void set_rate(const Asset& token_in, const Asset& token_out, const Amount& rate);
    bool supports(const Asset& token_in, const Asset& token_out) const;
    Amount quote(const Asset& token_in, const Amount& amount_in, const Asset& token_out) const;

    Amount swap(const Account& caller,
                const Asset& token_in,
                const Amount& amount_in,
                const Asset& token_out,
                const Amount& min_amount_out) override;

private:
    std::string id_;
    Account account_;
    std::shared_ptr<TokenBank> bank_;
    std::map<std::pair<Asset, Asset>, Amount> rates_;
};
