#pragma once

#include <unordered_map>
#include <vector>

// Insertion-ordered set: O(1) membership, deterministic enumeration.
// Withdrawals walk holding assets in this order, so erase keeps the
// relative order of the remaining items.
template <typename T>
class OrderedSet {
public:
    bool insert(const T& item) {
        if (contains(item)) return false;
        index_[item] = items_.size();
        items_.push_back(item);
        return true;
    }

    bool erase(const T& item) {
        auto it = index_.find(item);
        if (it == index_.end()) return false;

        items_.erase(items_.begin() + it->second);
        index_.erase(it);
        for (size_t i = 0; i < items_.size(); i++) {
            index_[items_[i]] = i;
        }
        return true;
    }

    bool contains(const T& item) const { return index_.count(item) > 0; }
    size_t size() const { return items_.size(); }
    const std::vector<T>& items() const { return items_; }

private:
    std::vector<T> items_;
    std::unordered_map<T, size_t> index_;
};
