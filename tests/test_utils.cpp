#include "utils/utils.hpp"
#include <gtest/gtest.h>

#include <cstdint>
#include <string>

// --- Tests for string_to_number ---
TEST(UtilsTest, StringToNumber) {
  EXPECT_EQ(Utils::string_to_number<int64_t>("9223372036854775807"),
            INT64_MAX);
  EXPECT_EQ(Utils::string_to_number<int32_t>("-3"), -3);
  EXPECT_EQ(Utils::string_to_number<uint32_t>("42"), 42u);
  // Empty values and a bare dash read as zero
  EXPECT_EQ(Utils::string_to_number<uint64_t>(""), 0u);
  EXPECT_EQ(Utils::string_to_number<int64_t>("-"), 0);
  // Invalid inputs
  EXPECT_FALSE(Utils::string_to_number<int32_t>("12abc").has_value());
  EXPECT_FALSE(Utils::string_to_number<uint32_t>("-1").has_value());
  EXPECT_FALSE(Utils::string_to_number<int32_t>("99999999999").has_value());
  EXPECT_FALSE(Utils::string_to_number<int64_t>(" 5").has_value());
}

// --- Tests for trimming ---
TEST(UtilsTest, TrimCopy) {
  EXPECT_EQ(Utils::trim_copy("  events \t"), "events");
  EXPECT_EQ(Utils::trim_copy("\n\n"), "");
  EXPECT_EQ(Utils::trim_copy("a b"), "a b");
}

TEST(UtilsTest, TrimInplace) {
  std::string left = "  left";
  Utils::ltrim_inplace(left);
  EXPECT_EQ(left, "left");

  std::string right = "right \r\n";
  Utils::rtrim_inplace(right);
  EXPECT_EQ(right, "right");

  std::string both = "\t both \t";
  Utils::trim_inplace(both);
  EXPECT_EQ(both, "both");
}

TEST(UtilsTest, CurrentTimeIsEpochMilliseconds) {
  // 2020-09-13, well before any build of this code
  EXPECT_GT(Utils::get_current_time_ms(), 1600000000000ULL);
}
