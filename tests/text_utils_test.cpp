#include <gtest/gtest.h>

#include <cmath>
#include <sstream>
#include <string>
#include <vector>

#include "text_utils.hpp"

using namespace scanplot;

TEST(TextUtils, TrimStripsWhitespaceAndCarriageReturn) {
  EXPECT_EQ(trim("  SCAN\r"), "SCAN");
  EXPECT_EQ(trim("\t \n"), "");
  EXPECT_EQ(trim("a b"), "a b");
}

TEST(TextUtils, SplitFieldsTrimsEveryField) {
  const auto f = splitFields(" X ; ; 1.0 ;2.0 ");
  ASSERT_EQ(f.size(), 4u);
  EXPECT_EQ(f[0], "X");
  EXPECT_EQ(f[1], "");
  EXPECT_EQ(f[2], "1.0");
  EXPECT_EQ(f[3], "2.0");
}

TEST(TextUtils, SplitFieldsKeepsTrailingEmptyField) {
  const auto f = splitFields("a;b;");
  ASSERT_EQ(f.size(), 3u);
  EXPECT_EQ(f[2], "");
  EXPECT_EQ(splitFields("").size(), 1u);
}

TEST(TextUtils, ParseDoubleRequiresWholeField) {
  double v = 0.0;
  EXPECT_TRUE(parseDouble(" 10.5 ", v));
  EXPECT_DOUBLE_EQ(v, 10.5);
  EXPECT_TRUE(parseDouble("-1e3", v));
  EXPECT_DOUBLE_EQ(v, -1000.0);
  EXPECT_FALSE(parseDouble("1.0abc", v));
  EXPECT_FALSE(parseDouble("", v));
  EXPECT_FALSE(parseDouble("abc", v));
  EXPECT_TRUE(parseDouble("nan", v));
  EXPECT_TRUE(std::isnan(v));
}

TEST(TextUtils, TimestampPatternAnchoredAtStart) {
  EXPECT_TRUE(looksLikeTimestamp("2025-05-26T14:58:59"));
  EXPECT_TRUE(looksLikeTimestamp("2025-05-26T14:58:59.123+02:00"));
  EXPECT_FALSE(looksLikeTimestamp("Header"));
  EXPECT_FALSE(looksLikeTimestamp(" 2025-05-26T14:58:59"));
  EXPECT_FALSE(looksLikeTimestamp("2025-05-26 14:58:59"));
  EXPECT_FALSE(looksLikeTimestamp("25-05-26T14:58:59"));
}

TEST(TextUtils, StripByteOrderMark) {
  std::string line = "\xEF\xBB\xBFHeader;a";
  stripByteOrderMark(line);
  EXPECT_EQ(line, "Header;a");
  stripByteOrderMark(line);
  EXPECT_EQ(line, "Header;a");
}

TEST(TextUtils, ParseDoubleIsDecimalOnly) {
  double v = 0.0;
  EXPECT_FALSE(parseDouble("0x10", v));
  EXPECT_FALSE(parseDouble("0X1P3", v));
  EXPECT_FALSE(parseDouble("nan(123)", v));
  EXPECT_FALSE(parseDouble("1e", v));
  EXPECT_TRUE(parseDouble("-Infinity", v));
  EXPECT_TRUE(std::isinf(v));
  EXPECT_TRUE(parseDouble("+2.5E-1", v));
  EXPECT_DOUBLE_EQ(v, 0.25);
}

TEST(TextUtils, ParseCountRejectsSignsAndText) {
  std::size_t n = 7;
  EXPECT_TRUE(parseCount("0", n));
  EXPECT_EQ(n, 0u);
  EXPECT_TRUE(parseCount("25", n));
  EXPECT_EQ(n, 25u);
  EXPECT_FALSE(parseCount("-1", n));
  EXPECT_FALSE(parseCount("+3", n));
  EXPECT_FALSE(parseCount("3 rows", n));
  EXPECT_FALSE(parseCount("", n));
  EXPECT_FALSE(parseCount("99999999999999999999999", n));
  EXPECT_EQ(n, 25u);
}

TEST(TextUtils, ReadLineSplitsOnEveryNewlineConvention) {
  std::istringstream in("a\nb\r\nc\rd");
  std::vector<std::string> lines;
  std::string line;
  while (readLine(in, line)) lines.push_back(line);
  EXPECT_EQ(lines, (std::vector<std::string>{"a", "b", "c", "d"}));
}

TEST(TextUtils, ReadLineKeepsEmptyLines) {
  std::istringstream in("\r\n\rx\n");
  std::vector<std::string> lines;
  std::string line;
  while (readLine(in, line)) lines.push_back(line);
  EXPECT_EQ(lines, (std::vector<std::string>{"", "", "x"}));
}
