#include "filewire/units-parser.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>

#include "filewire/invalid_argument_exception.hpp"

namespace filewire {

TEST(UnitsParser, PlainNumbers) {
  EXPECT_EQ(ParseNumberOfBytes("0"), 0U);
  EXPECT_EQ(ParseNumberOfBytes("1024"), 1024U);
  EXPECT_EQ(ParseNumberOfBytes("18446744073709551615"), UINT64_MAX);
}

TEST(UnitsParser, DecimalAndBinarySuffixes) {
  EXPECT_EQ(ParseNumberOfBytes("1k"), 1000U);
  EXPECT_EQ(ParseNumberOfBytes("1K"), 1000U);
  EXPECT_EQ(ParseNumberOfBytes("1Ki"), 1024U);
  EXPECT_EQ(ParseNumberOfBytes("64Ki"), 65536U);
  EXPECT_EQ(ParseNumberOfBytes("3M"), 3000000U);
  EXPECT_EQ(ParseNumberOfBytes("2Gi512Mi"), (2ULL << 30) + (512ULL << 20));
  EXPECT_EQ(ParseNumberOfBytes("1Ti"), 1ULL << 40);
}

TEST(UnitsParser, Invalid) {
  EXPECT_THROW(ParseNumberOfBytes(""), invalid_argument);
  EXPECT_THROW(ParseNumberOfBytes("-1"), invalid_argument);
  EXPECT_THROW(ParseNumberOfBytes("Ki"), invalid_argument);
  EXPECT_THROW(ParseNumberOfBytes("1.5M"), invalid_argument);
  EXPECT_THROW(ParseNumberOfBytes("12X"), invalid_argument);
}

TEST(UnitsParser, Overflow) {
  EXPECT_THROW(ParseNumberOfBytes("18446744073709551616"), std::overflow_error);
  EXPECT_THROW(ParseNumberOfBytes("20000000Ti"), std::overflow_error);
}

TEST(UnitsParser, BytesToStr) {
  EXPECT_EQ(BytesToStr(0), "0");
  EXPECT_EQ(BytesToStr(1023), "1023");
  EXPECT_EQ(BytesToStr(1024), "1Ki");
  EXPECT_EQ(BytesToStr(1049600), "1Mi1Ki");
  EXPECT_EQ(BytesToStr(1049600, 1), "1Mi");
  EXPECT_EQ(ParseNumberOfBytes(BytesToStr(123456789)), 123456789U);
}

}  // namespace filewire
