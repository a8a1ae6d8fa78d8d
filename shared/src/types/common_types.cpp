#include "types/common_types.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace arbguard {
namespace types {

namespace {

bool all_digits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
}

// cpp_int reads a leading zero as an octal prefix
Amount parse_decimal_digits(const std::string& digits) {
    auto first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        return Amount(0);
    }
    return Amount(digits.substr(first).c_str());
}

} // namespace

const Amount& unit() {
    static const Amount value = boost::multiprecision::pow(Amount(10), kFixedDecimals);
    return value;
}

Amount from_units(std::uint64_t whole_units) {
    return Amount(whole_units) * unit();
}

Amount parse_fixed(const std::string& text) {
    auto dot = text.find('.');
    std::string whole = text.substr(0, dot);
    std::string fraction = dot == std::string::npos ? std::string() : text.substr(dot + 1);

    if (!all_digits(whole)) {
        throw std::invalid_argument("Malformed fixed-point amount: '" + text + "'");
    }
    if (dot != std::string::npos && !all_digits(fraction)) {
        throw std::invalid_argument("Malformed fixed-point fraction: '" + text + "'");
    }
    if (fraction.size() > kFixedDecimals) {
        throw std::invalid_argument("More than 18 fractional digits: '" + text + "'");
    }

    fraction.append(kFixedDecimals - fraction.size(), '0');
    try {
        return parse_decimal_digits(whole) * unit() + parse_decimal_digits(fraction);
    } catch (const std::overflow_error&) {
        throw std::invalid_argument("Fixed-point amount out of range: '" + text + "'");
    } catch (const std::range_error&) {
        throw std::invalid_argument("Fixed-point amount out of range: '" + text + "'");
    }
}

std::string to_raw_string(const Amount& amount) {
    return amount.str();
}

std::string format_fixed(const Amount& amount) {
    std::string whole = Amount(amount / unit()).str();
    std::string fraction = Amount(amount % unit()).str();
    if (fraction == "0") {
        return whole;
    }
    fraction.insert(0, kFixedDecimals - fraction.size(), '0');
    fraction.erase(fraction.find_last_not_of('0') + 1);
    return whole + "." + fraction;
}

Amount abs_diff(const Amount& a, const Amount& b) {
    return a > b ? Amount(a - b) : Amount(b - a);
}

} // namespace types
} // namespace arbguard
