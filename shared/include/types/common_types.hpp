#pragma once

#include <string>
#include <cstdint>
#include <boost/multiprecision/cpp_int.hpp>

namespace arbguard {
namespace types {

// Fixed-point amounts carry 18 fractional digits. Overflow and underflow
// throw instead of wrapping.
using Amount = boost::multiprecision::checked_uint256_t;

using Height = std::uint64_t;
using Bps = std::uint64_t;
using SourceId = std::string;
using OpportunityId = std::uint64_t;

constexpr unsigned kFixedDecimals = 18;
constexpr std::uint64_t kBpsDenominator = 10000;

// 10^18, the fixed-point unit
const Amount& unit();

// Whole units to fixed point, e.g. from_units(3000) == 3000 * 10^18
Amount from_units(std::uint64_t whole_units);

// Parses "3000", "3000.25" or "0.000000000000000001".
// Throws std::invalid_argument on malformed input or more than 18 decimals.
Amount parse_fixed(const std::string& text);

// Raw integer representation of an amount (no decimal point)
std::string to_raw_string(const Amount& amount);

// Human readable form with trailing fractional zeros stripped
std::string format_fixed(const Amount& amount);

// Absolute difference of two unsigned amounts
Amount abs_diff(const Amount& a, const Amount& b);

} // namespace types
} // namespace arbguard
