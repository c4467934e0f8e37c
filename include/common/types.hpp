#pragma once
#include <cstdint>
#include <string>
#include <boost/multiprecision/cpp_int.hpp>

// Account and token identifiers are plain address strings ("0x...").
using Address = std::string;

// 18-decimal fixed-point quantity. Overflow and negative results throw
// (std::overflow_error / std::range_error) instead of wrapping.
using Amount = boost::multiprecision::checked_uint256_t;

// Seconds since the Unix epoch.
using Timestamp = uint64_t;
