#include "price_feed.hpp"
#include <spdlog/spdlog.h>

PriceFeed::PriceFeed(const Amount& rate) : rate_(rate) {}

void PriceFeed::set_rate(const Amount& rate) {
    spdlog::debug("Feed rate {} -> {}", units::format(rate_), units::format(rate));
    rate_ = rate;
}
