/**
 * @file test_text.cpp
 * @brief Tests for the text geometry helpers used by console Blocks.
 *
 * Validates:
 *  - Centering follows the classic odd-padding rule
 *  - Greedy wrap keeps words whole and chunks over-long words
 *  - Column counting is per UTF-8 code point
 */

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

#include "ignite/console/text.hpp"

using ignite::console::center;
using ignite::console::display_cols;
using ignite::console::repeat;
using ignite::console::take_cols;
using ignite::console::wrap;

using Lines = std::vector<std::string>;

// --------------------------------- center ----------------------------------

/**
 * @test Center_Even_Margin_Splits_Evenly
 * @brief Two spare columns on each side.
 */
TEST(Text, Center_Even_Margin_Splits_Evenly) {
  EXPECT_EQ(center("ab", 6), "  ab  ");
}

/**
 * @test Center_Odd_Margin_Even_Width_Pads_Right
 * @brief Odd margin in an even field: the extra column goes right.
 */
TEST(Text, Center_Odd_Margin_Even_Width_Pads_Right) {
  EXPECT_EQ(center("abc", 6), " abc  ");
  EXPECT_EQ(center("a", 4), " a  ");
  EXPECT_EQ(center("Sample text", 38), std::string(13, ' ') + "Sample text" + std::string(14, ' '));
}

/**
 * @test Center_Odd_Margin_Odd_Width_Pads_Left
 * @brief Odd margin in an odd field: the extra column goes left.
 */
TEST(Text, Center_Odd_Margin_Odd_Width_Pads_Left) {
  EXPECT_EQ(center("ab", 5), "  ab ");
  EXPECT_EQ(center("abcd", 7), "  abcd ");
}

/**
 * @test Center_Wider_Text_Is_Unchanged
 * @brief Text at or above the field width is returned as is.
 */
TEST(Text, Center_Wider_Text_Is_Unchanged) {
  EXPECT_EQ(center("abcdef", 4), "abcdef");
  EXPECT_EQ(center("abcd", 4), "abcd");
  EXPECT_EQ(center("x", 0), "x");
  EXPECT_EQ(center("x", -3), "x");
}

// ---------------------------------- wrap -----------------------------------

/**
 * @test Wrap_Blank_Input_Yields_No_Lines
 */
TEST(Text, Wrap_Blank_Input_Yields_No_Lines) {
  EXPECT_TRUE(wrap("", 10).empty());
  EXPECT_TRUE(wrap("   \t \n", 10).empty());
}

/**
 * @test Wrap_Greedy_Fill
 * @brief Words are packed while they fit; whitespace runs collapse.
 */
TEST(Text, Wrap_Greedy_Fill) {
  EXPECT_EQ(wrap("a b c", 3), (Lines{"a b", "c"}));
  EXPECT_EQ(wrap("  one   two  three ", 9), (Lines{"one two", "three"}));
  EXPECT_EQ(wrap("Sample text", 40), (Lines{"Sample text"}));
}

/**
 * @test Wrap_Never_Splits_A_Fitting_Word
 * @brief Every word shorter than the width appears whole on one line.
 */
TEST(Text, Wrap_Never_Splits_A_Fitting_Word) {
  const std::string text = "The quick brown fox jumps over the lazy dog";
  const auto lines = wrap(text, 12);
  ASSERT_FALSE(lines.empty());

  std::istringstream words(text);
  std::string word;
  while (words >> word) {
    bool found = false;
    for (const auto& l : lines) found = found || l.find(word) != std::string::npos;
    EXPECT_TRUE(found) << word;
  }
  for (const auto& l : lines) EXPECT_LE(l.size(), 12u) << l;
}

/**
 * @test Wrap_Long_Word_Starts_Fresh_Line_And_Is_Chunked
 */
TEST(Text, Wrap_Long_Word_Starts_Fresh_Line_And_Is_Chunked) {
  EXPECT_EQ(wrap("abcdefghij", 4), (Lines{"abcd", "efgh", "ij"}));
  EXPECT_EQ(wrap("hi abcdefghij x", 4), (Lines{"hi", "abcd", "efgh", "ij x"}));
  EXPECT_EQ(wrap("abcdefgh", 4), (Lines{"abcd", "efgh"}));
}

/**
 * @test Wrap_Width_Below_One_Acts_As_One
 */
TEST(Text, Wrap_Width_Below_One_Acts_As_One) {
  EXPECT_EQ(wrap("ab", 0), (Lines{"a", "b"}));
  EXPECT_EQ(wrap("ab", -5), (Lines{"a", "b"}));
}

// ------------------------------ UTF-8 columns ------------------------------

/**
 * @test Columns_Count_Code_Points
 */
TEST(Text, Columns_Count_Code_Points) {
  EXPECT_EQ(display_cols("hello"), 5u);
  EXPECT_EQ(display_cols("h\xC3\xA9llo"), 5u);   // é is two bytes
  EXPECT_EQ(take_cols("h\xC3\xA9llo", 2), "h\xC3\xA9");
  EXPECT_EQ(take_cols("abc", 10), "abc");
}

/**
 * @test Wrap_Chunks_By_Code_Point
 * @brief Multi-byte characters are never cut in half.
 */
TEST(Text, Wrap_Chunks_By_Code_Point) {
  EXPECT_EQ(wrap("\xC3\xA9\xC3\xA9\xC3\xA9", 2), (Lines{"\xC3\xA9\xC3\xA9", "\xC3\xA9"}));
}

/**
 * @test Repeat_Non_Positive_Is_Empty
 */
TEST(Text, Repeat_Non_Positive_Is_Empty) {
  EXPECT_EQ(repeat('-', 3), "---");
  EXPECT_EQ(repeat('-', 0), "");
  EXPECT_EQ(repeat('-', -2), "");
}
