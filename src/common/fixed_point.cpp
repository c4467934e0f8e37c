#include "common/fixed_point.hpp"
#include <cctype>
#include <stdexcept>

namespace FixedPoint {
  Amount Pow10(unsigned exp) {
    Amount v = 1;
    for (unsigned i = 0; i < exp; ++i) v *= 10;
    return v;
  }

  Amount Units(uint64_t whole, unsigned decimals) {
    return Amount(whole) * Pow10(decimals);
  }

  Amount Parse(const std::string& text, unsigned decimals) {
    if (text.empty()) throw std::invalid_argument("empty amount");
    std::string whole = text;
    std::string frac;
    auto dot = text.find('.');
    if (dot != std::string::npos) {
      whole = text.substr(0, dot);
      frac = text.substr(dot + 1);
    }
    if (whole.empty() && frac.empty()) throw std::invalid_argument("malformed amount: " + text);
    for (char c : whole) if (!std::isdigit(static_cast<unsigned char>(c))) throw std::invalid_argument("malformed amount: " + text);
    for (char c : frac) if (!std::isdigit(static_cast<unsigned char>(c))) throw std::invalid_argument("malformed amount: " + text);
    if (frac.size() > decimals) frac.resize(decimals);
    frac.append(decimals - frac.size(), '0');
    std::string digits = whole + frac;
    size_t first = digits.find_first_not_of('0');
    if (first == std::string::npos) return Amount(0);
    try {
      return Amount(digits.substr(first).c_str());
    } catch (const std::runtime_error&) {
      throw std::invalid_argument("amount out of range: " + text);
    }
  }

  std::string Format(const Amount& value, unsigned decimals) {
    std::string digits = value.str();
    if (decimals == 0) return digits;
    if (digits.size() <= decimals) digits.insert(0, decimals - digits.size() + 1, '0');
    std::string whole = digits.substr(0, digits.size() - decimals);
    std::string frac = digits.substr(digits.size() - decimals);
    auto last = frac.find_last_not_of('0');
    if (last == std::string::npos) return whole;
    return whole + "." + frac.substr(0, last + 1);
  }
}
