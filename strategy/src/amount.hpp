#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <string>

// Token quantities, share counts and settlement values, in base units.
using Amount = boost::multiprecision::uint256_t;
using Asset = std::string;
using Account = std::string;

// Sentinel asset id for the chain's native coin.
inline const Asset NATIVE_COIN = "native";

constexpr int UNIT_DECIMALS = 18;

// 1e18 - one whole unit, and 1.0 in rate fixed point.
inline const Amount ONE_UNIT = Amount(1000000000000000000ULL);

namespace units {
    // floor(a * b / denominator) with a 512-bit intermediate.
    Amount mul_div(const Amount& a, const Amount& b, const Amount& denominator);

    // a - b, failing with InsufficientBalance instead of wrapping.
    Amount checked_sub(const Amount& a, const Amount& b, const std::string& what);

    // "0.02" -> 20000000000000000
    Amount parse(const std::string& text, int decimals = UNIT_DECIMALS);

    // 20000000000000000 -> "0.020000" (precision 6), truncating.
    std::string format(const Amount& value, int precision = 6,
                       int decimals = UNIT_DECIMALS);
}
