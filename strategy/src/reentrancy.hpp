#pragma once

#include "errors.hpp"
#include <string>

// Call-depth counter for one component. Entry points that hand control to
// a swapper, the registry or a native transfer hold a ReentrancyLock.
class ReentrancyGuard {
public:
    int depth() const { return depth_; }

private:
    friend class ReentrancyLock;
    int depth_ = 0;
};

class ReentrancyLock {
public:
    ReentrancyLock(ReentrancyGuard& guard, const char* entry_point)
        : guard_(guard)
    {
        if (guard_.depth_ > 0) {
            throw VaultError(Errc::ReentrantCall, std::string(entry_point) + " re-entered");
        }
        guard_.depth_++;
    }

    ~ReentrancyLock() { guard_.depth_--; }

    ReentrancyLock(const ReentrancyLock&) = delete;
    ReentrancyLock& operator=(const ReentrancyLock&) = delete;

private:
    ReentrancyGuard& guard_;
};
