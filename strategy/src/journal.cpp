#include "journal.hpp"
#include <spdlog/spdlog.h>

size_t StateJournal::begin() {
    depth_++;
    return undo_log_.size();
}

void StateJournal::commit() {
    if (depth_ > 0) depth_--;

    // Inner commits keep their entries so the outer scope can still undo them
    if (depth_ == 0) {
        undo_log_.clear();
    }
}

void StateJournal::rollback(size_t savepoint) {
    size_t undone = 0;
    while (undo_log_.size() > savepoint) {
        auto undo = std::move(undo_log_.back());
        undo_log_.pop_back();
        undo();
        undone++;
    }
    if (depth_ > 0) depth_--;

    spdlog::debug("Rolled back {} state change(s), depth now {}", undone, depth_);
}

void StateJournal::record(std::function<void()> undo) {
    if (depth_ == 0) return;
    undo_log_.push_back(std::move(undo));
}

TxScope::TxScope(StateJournal& journal)
    : journal_(journal)
    , savepoint_(journal.begin())
    , done_(false)
{}

TxScope::~TxScope() {
    if (!done_) {
        journal_.rollback(savepoint_);
    }
}

void TxScope::commit() {
    if (done_) return;
    journal_.commit();
    done_ = true;
}
