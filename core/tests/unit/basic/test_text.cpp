#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "argconv/basic/text.hpp"

using argconv::seq2str;

TEST(Text, Seq2Str)
{
  EXPECT_EQ(seq2str({}), "");
  EXPECT_EQ(seq2str({"a"}), "'a'");
  EXPECT_EQ(seq2str({"a", "b", "c"}), "'a', 'b' and 'c'");
  EXPECT_EQ(seq2str({"int", "None"}, "", ", ", " or "), "int or None");
  EXPECT_STREQ(argconv::plural_or_not(1), "");
  EXPECT_STREQ(argconv::plural_or_not(0), "s");
}

TEST(Text, TitleCase)
{
  EXPECT_EQ(argconv::to_title("yes"), "Yes");
  EXPECT_EQ(argconv::to_title("TRUE"), "True");
  EXPECT_EQ(argconv::to_title("on off"), "On Off");
  EXPECT_EQ(argconv::to_title("1st"), "1St");
  EXPECT_EQ(argconv::to_title("kyllä"), "Kyllä");
}

TEST(Text, CaseHelpers)
{
  EXPECT_EQ(argconv::to_lower_ascii("MiXeD"), "mixed");
  EXPECT_EQ(argconv::to_upper_ascii("none"), "NONE");
  EXPECT_EQ(argconv::capitalize("rETURN value"), "Return value");
  EXPECT_TRUE(argconv::is_lower("argument 1"));
  EXPECT_FALSE(argconv::is_lower("Argument"));
  EXPECT_FALSE(argconv::is_lower("123"));
}

TEST(Text, StripAndRemove)
{
  EXPECT_EQ(argconv::strip(" \t x y \n"), "x y");
  EXPECT_EQ(argconv::strip("   "), "");
  EXPECT_EQ(argconv::remove_chars("1 000_000", " _"), "1000000");
}

TEST(Text, Normalize)
{
  EXPECT_EQ(argconv::normalize("Dark Blue"), "darkblue");
  EXPECT_EQ(argconv::normalize("DARK_BLUE", "_"), "darkblue");
  EXPECT_TRUE(argconv::eq_normalized("slow-motion", "Slow Motion", "_-"));
  EXPECT_FALSE(argconv::eq_normalized("slow-motion", "slowmotions", "_-"));
}

TEST(Text, Utf8)
{
  std::string out;
  argconv::append_utf8(out, 0xE4);
  argconv::append_utf8(out, 0x20AC);
  argconv::append_utf8(out, 0x1F600);
  EXPECT_EQ(out, "\xc3\xa4\xe2\x82\xac\xf0\x9f\x98\x80");
  EXPECT_EQ(argconv::decode_utf8(out), (std::vector<uint32_t>{0xE4, 0x20AC, 0x1F600}));
  EXPECT_EQ(argconv::decode_utf8("a\xff"), (std::vector<uint32_t>{'a', 0xFF}));
}
