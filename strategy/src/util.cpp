#include "util.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace util {

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_s() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string short_id(const std::string& account) {
    if (account.size() <= 12) return account;
    return account.substr(0, 8) + "...";
}

} // namespace util
