#include "token_bank.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

TokenBank::TokenBank(std::shared_ptr<StateJournal> journal)
    : journal_(journal)
{}

Amount& TokenBank::slot(const Asset& asset, const Account& account) {
    return balances_[{asset, account}];
}

Amount TokenBank::balance_of(const Asset& asset, const Account& account) const {
    auto it = balances_.find({asset, account});
    if (it == balances_.end()) return 0;
    return it->second;
}

void TokenBank::mint(const Asset& asset, const Account& to, const Amount& amount) {
    if (to.empty()) {
        throw VaultError(Errc::ZeroAddress, "mint " + asset + " to empty account");
    }
    Amount& balance = slot(asset, to);
    journal_->assign(balance, Amount(balance + amount));
}

void TokenBank::burn(const Asset& asset, const Account& from, const Amount& amount) {
    Amount& balance = slot(asset, from);
    journal_->assign(balance, units::checked_sub(balance, amount, "burn " + asset + " from " + from));
}

void TokenBank::transfer(const Asset& asset, const Account& from, const Account& to,
                         const Amount& amount) {
    if (from.empty() || to.empty()) {
        throw VaultError(Errc::ZeroAddress, "transfer of " + asset + " with empty account");
    }

    if (asset == NATIVE_COIN) {
        if (rejects_native(to)) {
            throw VaultError(Errc::FailedToSendETH, to + " rejected native transfer");
        }
        if (balance_of(asset, from) < amount) {
            throw VaultError(Errc::FailedToSendETH,
                             from + " cannot send " + units::format(amount) + " native");
        }
    }

    if (amount == 0 || from == to) return;

    Amount& source = slot(asset, from);
    journal_->assign(source, units::checked_sub(source, amount, "transfer " + asset + " from " + from));
    Amount& dest = slot(asset, to);
    journal_->assign(dest, Amount(dest + amount));

    spdlog::debug("Transfer {} {} {} -> {}", units::format(amount), asset,
                  util::short_id(from), util::short_id(to));
}

void TokenBank::set_rejects_native(const Account& account, bool rejects) {
    bool present = native_rejecters_.count(account) > 0;
    if (present == rejects) return;

    if (rejects) {
        native_rejecters_.insert(account);
        journal_->record([this, account]() { native_rejecters_.erase(account); });
    } else {
        native_rejecters_.erase(account);
        journal_->record([this, account]() { native_rejecters_.insert(account); });
    }
}

bool TokenBank::rejects_native(const Account& account) const {
    return native_rejecters_.count(account) > 0;
}
