#include <gtest/gtest.h>

#include "upgate/util/format.hpp"

using upgate::util::formatMegabytes;

TEST(FormatTest, MegabytesWithOneDecimal) {
  EXPECT_EQ(formatMegabytes(10 * 1024 * 1024), "10.0MB");
  EXPECT_EQ(formatMegabytes(5 * 1024 * 1024 + 512 * 1024), "5.5MB");
  EXPECT_EQ(formatMegabytes(1024 * 1024), "1.0MB");
}

TEST(FormatTest, SmallSizesInBytes) {
  EXPECT_EQ(formatMegabytes(1000), "1000 bytes");
  EXPECT_EQ(formatMegabytes(0), "0 bytes");
  EXPECT_EQ(formatMegabytes(1024 * 1024 - 1), "1048575 bytes");
}
