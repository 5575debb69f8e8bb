#pragma once

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

// Undo log shared by every stateful component of one simulated world.
// A call opens a savepoint with TxScope; if the call throws, everything
// recorded after the savepoint is undone in reverse order. Mutations made
// with no scope open are applied directly and never recorded.
class StateJournal {
public:
    size_t begin();
    void commit();
    void rollback(size_t savepoint);

    void record(std::function<void()> undo);

    // slot = value, remembering the previous value.
    // slot must stay addressable until the outermost scope closes.
    template <typename T>
    void assign(T& slot, T value) {
        if (depth_ > 0) {
            T previous = slot;
            undo_log_.push_back([&slot, previous]() { slot = previous; });
        }
        slot = std::move(value);
    }

    size_t depth() const { return depth_; }
    size_t pending() const { return undo_log_.size(); }

private:
    std::vector<std::function<void()>> undo_log_;
    size_t depth_ = 0;
};

class TxScope {
public:
    explicit TxScope(StateJournal& journal);
    ~TxScope();

    TxScope(const TxScope&) = delete;
    TxScope& operator=(const TxScope&) = delete;

    void commit();

private:
    StateJournal& journal_;
    size_t savepoint_;
    bool done_;
};
