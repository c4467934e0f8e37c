#define BOOST_TEST_MODULE fixed_point_tests
#include <boost/test/unit_test.hpp>

#include "common/fixed_point.hpp"
#include <limits>
#include <stdexcept>

BOOST_AUTO_TEST_SUITE(fixed_point)

BOOST_AUTO_TEST_CASE(parse_whole_and_fractional_amounts) {
  BOOST_TEST(FixedPoint::Parse("2000") == FixedPoint::Units(2000));
  BOOST_TEST(FixedPoint::Parse("0.125") == Amount(125) * FixedPoint::Pow10(15));
  BOOST_TEST(FixedPoint::Parse(".5") == Amount(5) * FixedPoint::Pow10(17));
  BOOST_TEST(FixedPoint::Parse("0") == Amount(0));
  BOOST_TEST(FixedPoint::Parse("12.5", 8) == Amount(1250000000ULL));
}

BOOST_AUTO_TEST_CASE(parse_truncates_beyond_scale) {
  BOOST_TEST(FixedPoint::Parse("1.0000000000000000019") == FixedPoint::Units(1) + 1);
  BOOST_TEST(FixedPoint::Parse("0.000000009", 8) == Amount(0));
}

BOOST_AUTO_TEST_CASE(parse_rejects_malformed_input) {
  BOOST_CHECK_THROW(FixedPoint::Parse(""), std::invalid_argument);
  BOOST_CHECK_THROW(FixedPoint::Parse("."), std::invalid_argument);
  BOOST_CHECK_THROW(FixedPoint::Parse("abc"), std::invalid_argument);
  BOOST_CHECK_THROW(FixedPoint::Parse("1.2.3"), std::invalid_argument);
  BOOST_CHECK_THROW(FixedPoint::Parse("-5"), std::invalid_argument);
  BOOST_CHECK_THROW(FixedPoint::Parse(std::string(90, '9')), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(format_drops_trailing_zeros) {
  BOOST_TEST(FixedPoint::Format(FixedPoint::Units(2000)) == "2000");
  BOOST_TEST(FixedPoint::Format(FixedPoint::Parse("0.125")) == "0.125");
  BOOST_TEST(FixedPoint::Format(Amount(0)) == "0");
  BOOST_TEST(FixedPoint::Format(Amount(1)) == "0.000000000000000001");
  BOOST_TEST(FixedPoint::Format(Amount(1250000000ULL), 8) == "12.5");
  BOOST_TEST(FixedPoint::Format(Amount(42), 0) == "42");
}

BOOST_AUTO_TEST_CASE(checked_arithmetic_throws_instead_of_wrapping) {
  Amount top = std::numeric_limits<Amount>::max();
  BOOST_CHECK_THROW(top += 1, std::overflow_error);
  Amount small = 1;
  BOOST_CHECK_THROW(small -= 2, std::range_error);
}

BOOST_AUTO_TEST_SUITE_END()
