#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace util {
    // Seconds since epoch. Vaults take one of these so tests can move time.
    using Clock = std::function<int64_t()>;

    std::string current_iso8601();
    int64_t current_timestamp_s();
    std::string short_id(const std::string& account);
}
