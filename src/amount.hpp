// amount.hpp - arbitrary precision token amounts decoded from eth_call results

#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace supply {

// Raw on-chain magnitude, unscaled. Return data can be wider than 256 bits.
using Amount = boost::multiprecision::cpp_int;

// Decode a big-endian hex byte string. "0x" is the empty return value and
// decodes to 0; the prefix itself is optional. Anything else that is not
// made of hex digits yields nullopt.
std::optional<Amount> parse_hex_amount(std::string_view hex);

// Exact decimal rendering of raw / 10^decimals, e.g. (1234567, 6) -> "1.234567".
// Trailing fractional zeros are dropped.
std::string format_scaled(const Amount& raw, unsigned decimals);

} // namespace supply
