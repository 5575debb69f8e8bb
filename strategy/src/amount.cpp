#include "amount.hpp"
#include "errors.hpp"
#include <cctype>
#include <limits>
#include <stdexcept>

namespace {

using Wide = boost::multiprecision::uint512_t;

Amount pow10(int exponent) {
    Amount result = 1;
    for (int i = 0; i < exponent; i++) {
        result *= 10;
    }
    return result;
}

}

namespace units {

Amount mul_div(const Amount& a, const Amount& b, const Amount& denominator) {
    if (denominator == 0) {
        throw std::domain_error("mul_div: zero denominator");
    }

    Wide wide = Wide(a) * Wide(b);
    wide /= Wide(denominator);

    if (wide > Wide(std::numeric_limits<Amount>::max())) {
        throw std::overflow_error("mul_div: result exceeds 256 bits");
    }
    return Amount(wide);
}

Amount checked_sub(const Amount& a, const Amount& b, const std::string& what) {
    if (b > a) {
        throw VaultError(Errc::InsufficientBalance,
                         what + ": have " + a.str() + ", need " + b.str());
    }
    return a - b;
}

Amount parse(const std::string& text, int decimals) {
    if (text.empty()) {
        throw std::invalid_argument("parse: empty amount");
    }

    auto dot = text.find('.');
    std::string whole = text.substr(0, dot);
    std::string frac = dot == std::string::npos ? "" : text.substr(dot + 1);

    if (whole.empty() && frac.empty()) {
        throw std::invalid_argument("parse: no digits in '" + text + "'");
    }
    if (static_cast<int>(frac.size()) > decimals) {
        throw std::invalid_argument("parse: too many decimals in '" + text + "'");
    }
    for (char c : whole + frac) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("parse: invalid character in '" + text + "'");
        }
    }

    frac.append(decimals - frac.size(), '0');

    // cpp_int reads a leading zero as an octal prefix
    auto digits = [](const std::string& s) {
        auto first = s.find_first_not_of('0');
        return first == std::string::npos ? Amount(0) : Amount(s.substr(first));
    };

    return digits(whole) * pow10(decimals) + digits(frac);
}

std::string format(const Amount& value, int precision, int decimals) {
    Amount scale = pow10(decimals);
    std::string whole = Amount(value / scale).str();
    std::string frac = Amount(value % scale).str();
    frac.insert(0, decimals - frac.size(), '0');

    if (precision <= 0) return whole;
    if (precision < decimals) frac.resize(precision);
    return whole + "." + frac;
}

}
