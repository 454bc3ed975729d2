#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cadence/utils/string.hpp"

using namespace cadence::utils;

class StringUtilsTest : public ::testing::Test {};

TEST_F(StringUtilsTest, ToLower) {
    EXPECT_EQ(toLower("Every DAY at 7"), "every day at 7");
    EXPECT_EQ(toLower(""), "");
}

TEST_F(StringUtilsTest, TrimWhitespace) {
    EXPECT_EQ(trim("  in 5 minutes \n"), "in 5 minutes");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
}

TEST_F(StringUtilsTest, TrimCustomSymbols) {
    EXPECT_EQ(trim("7:30.", ".,;!?"), "7:30");
    EXPECT_EQ(trim("!?5", ".,;!?"), "5");
}

TEST_F(StringUtilsTest, StartsWith) {
    EXPECT_TRUE(startsWith("@daily", "@"));
    EXPECT_FALSE(startsWith("daily", "@"));
    EXPECT_FALSE(startsWith("", "@"));
}

TEST_F(StringUtilsTest, SplitKeepsEmptyFields) {
    EXPECT_EQ(splitString("1,2,,3", ','),
              (std::vector<std::string>{"1", "2", "", "3"}));
    EXPECT_EQ(splitString("7:", ':'), (std::vector<std::string>{"7", ""}));
    EXPECT_EQ(splitString("7", ':'), (std::vector<std::string>{"7"}));
    EXPECT_TRUE(splitString("", ',').empty());
}

TEST_F(StringUtilsTest, ParseIntIsStrict) {
    EXPECT_EQ(parseInt("42"), 42);
    EXPECT_EQ(parseInt("-3"), -3);
    EXPECT_EQ(parseInt("+7"), 7);
    EXPECT_FALSE(parseInt("").has_value());
    EXPECT_FALSE(parseInt("5x").has_value());
    EXPECT_FALSE(parseInt("x5").has_value());
    EXPECT_FALSE(parseInt("1.5").has_value());
    EXPECT_FALSE(parseInt("99999999999").has_value());
}
