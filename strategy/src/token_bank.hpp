#pragma once

#include "amount.hpp"
#include "journal.hpp"
#include <map>
#include <memory>
#include <set>
#include <utility>

// Live token and native-coin balances of every account in the world.
// Strategies keep their own ReserveLedger; nothing here feeds share pricing.
class TokenBank {
public:
    explicit TokenBank(std::shared_ptr<StateJournal> journal);

    Amount balance_of(const Asset& asset, const Account& account) const;

    void mint(const Asset& asset, const Account& to, const Amount& amount);
    void burn(const Asset& asset, const Account& from, const Amount& amount);

    // Native coin: FailedToSendETH if the sender is short or the recipient
    // rejects value. Tokens: InsufficientBalance if the sender is short.
    void transfer(const Asset& asset, const Account& from, const Account& to,
                  const Amount& amount);

    void set_rejects_native(const Account& account, bool rejects);
    bool rejects_native(const Account& account) const;

    StateJournal& journal() { return *journal_; }

private:
    std::shared_ptr<StateJournal> journal_;
    std::map<std::pair<Asset, Account>, Amount> balances_;
    std::set<Account> native_rejecters_;

    Amount& slot(const Asset& asset, const Account& account);
};
