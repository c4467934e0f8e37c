#pragma once
#include "common/types.hpp"
#include <string>

namespace FixedPoint {
  // 10^exp as an Amount
  Amount Pow10(unsigned exp);
  // whole * 10^decimals
  Amount Units(uint64_t whole, unsigned decimals = 18);
  // Parses a decimal string such as "2000" or "0.125" into an integer scaled by
  // 10^decimals. Digits beyond the scale are truncated. Throws std::invalid_argument.
  Amount Parse(const std::string& text, unsigned decimals = 18);
  // Inverse of Parse; trailing fractional zeros are dropped.
  std::string Format(const Amount& value, unsigned decimals = 18);
}
