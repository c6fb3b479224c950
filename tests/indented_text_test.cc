#include "plistemit/indented_text.h"

#include <gtest/gtest.h>

#include <array>
#include <span>
#include <string>
#include <string_view>

namespace plistemit {

TEST(IndentedText, AppendsNewlineOnlyWhenMissing)
{
    IndentedText t;
    t.append("<a>");
    t.append("<b>\n");
    EXPECT_EQ(t.text(), "<a>\n<b>\n");
}


TEST(IndentedText, IndentsEveryLineOfFragment)
{
    IndentedText t;
    t.raise_indent();
    t.raise_indent();
    t.append("one\ntwo");
    t.append("three\n");
    EXPECT_EQ(t.text(), "\t\tone\n\t\ttwo\n\t\tthree\n");
}


TEST(IndentedText, PreIndentedFragmentIsNotIndentedAgain)
{
    IndentedText t;
    t.raise_indent();
    t.append("\t<key>k</key>\n\t<true/>\n");
    t.append("<dict/>");
    EXPECT_EQ(t.text(), "\t<key>k</key>\n\t<true/>\n\t<dict/>\n");
}


TEST(IndentedText, EmptyFragmentIsIndentedEmptyLine)
{
    IndentedText t;
    t.append("");
    t.raise_indent();
    t.append("");
    t.append(std::string_view());
    EXPECT_EQ(t.text(), "\n\t\n\t\n");
}


TEST(IndentedText, LowerIndentClampsAtZero)
{
    IndentedText t;
    t.lower_indent();
    t.lower_indent();
    EXPECT_EQ(t.indent_level(), 0U);
    t.raise_indent();
    EXPECT_EQ(t.indent_level(), 1U);
    t.lower_indent();
    t.lower_indent();
    EXPECT_EQ(t.indent_level(), 0U);
    t.append("x");
    EXPECT_EQ(t.text(), "x\n");
}


TEST(IndentedText, AppendsFragmentListElementWise)
{
    IndentedText t;
    t.raise_indent();
    const std::array<std::string, 3> frags = { "<a/>", "<b/>\n", "<c/>" };
    t.append(std::span<const std::string>(frags.data(), frags.size()));
    EXPECT_EQ(t.text(), "\t<a/>\n\t<b/>\n\t<c/>\n");
}


TEST(IndentedText, TextLineKeepsContinuationLinesVerbatim)
{
    IndentedText t;
    t.raise_indent();
    t.append_text_line("<string>first\nsecond</string>");
    EXPECT_EQ(t.text(), "\t<string>first\nsecond</string>\n");
}


TEST(IndentedText, HonorsCustomIndentUnit)
{
    IndentedText t("  ");
    EXPECT_EQ(t.indent_unit(), "  ");
    t.append("<array>");
    t.raise_indent();
    t.append("<integer>1</integer>");
    t.lower_indent();
    t.append("</array>");
    EXPECT_EQ(t.text(), "<array>\n  <integer>1</integer>\n</array>\n");
}


TEST(IndentedText, TakeTextResetsBuilder)
{
    IndentedText t;
    t.raise_indent();
    t.append("x");
    const std::string s = t.take_text();
    EXPECT_EQ(s, "\tx\n");
    EXPECT_EQ(t.size(), 0U);
    EXPECT_EQ(t.indent_level(), 0U);
}

}  // namespace plistemit
