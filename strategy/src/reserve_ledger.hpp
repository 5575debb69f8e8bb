#pragma once

#include "amount.hpp"
#include "journal.hpp"
#include <memory>
#include <unordered_map>

// Accounted quantity per asset held by a strategy. This, not the live bank
// balance, is what every proportional calculation reads. Entries are never
// removed; they may sit at zero.
class ReserveLedger {
public:
    explicit ReserveLedger(std::shared_ptr<StateJournal> journal);

    Amount reserves(const Asset& asset) const;

    void credit(const Asset& asset, const Amount& amount);

    // InsufficientBalance if amount exceeds the entry.
    void debit(const Asset& asset, const Amount& amount);

private:
    std::shared_ptr<StateJournal> journal_;
    std::unordered_map<Asset, Amount> entries_;
};
