#include "reserve_ledger.hpp"

ReserveLedger::ReserveLedger(std::shared_ptr<StateJournal> journal)
    : journal_(journal)
{}

Amount ReserveLedger::reserves(const Asset& asset) const {
    auto it = entries_.find(asset);
    if (it == entries_.end()) return 0;
    return it->second;
}

void ReserveLedger::credit(const Asset& asset, const Amount& amount) {
    Amount& entry = entries_[asset];
    journal_->assign(entry, Amount(entry + amount));
}

void ReserveLedger::debit(const Asset& asset, const Amount& amount) {
    Amount& entry = entries_[asset];
    journal_->assign(entry, units::checked_sub(entry, amount, "reserve of " + asset));
}
