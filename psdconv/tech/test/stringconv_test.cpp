#include "psdconv/stringconv.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>

namespace psdconv {

TEST(StringConv, StringToIntegral) {
  EXPECT_EQ(StringToIntegral<int>("0"), 0);
  EXPECT_EQ(StringToIntegral<int>("-17"), -17);
  EXPECT_EQ(StringToIntegral<uint16_t>("5000"), 5000);
  EXPECT_EQ(StringToIntegral<int64_t>("9223372036854775807"), INT64_MAX);
}

TEST(StringConv, StringToIntegralInvalid) {
  EXPECT_THROW(StringToIntegral<int>(""), std::invalid_argument);
  EXPECT_THROW(StringToIntegral<int>("abc"), std::invalid_argument);
  EXPECT_THROW(StringToIntegral<int>("12a"), std::invalid_argument);
  EXPECT_THROW(StringToIntegral<int>(" 12"), std::invalid_argument);
  EXPECT_THROW(StringToIntegral<uint16_t>("70000"), std::invalid_argument);
  EXPECT_THROW(StringToIntegral<uint32_t>("-1"), std::invalid_argument);
}

}  // namespace psdconv
