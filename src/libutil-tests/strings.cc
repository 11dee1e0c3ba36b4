#include <gtest/gtest.h>

#include "awsctx/util/strings.hh"

#include <vector>

namespace awsctx {

/* ----------------------------------------------------------------------------
 * tokenizeString, concatStringsSep
 * --------------------------------------------------------------------------*/

TEST(tokenizeString, dropsEmptyTokens)
{
    ASSERT_EQ(tokenizeString<Strings>(""), Strings());
    ASSERT_EQ(tokenizeString<Strings>("  timeout =\t 30 \n"), Strings({"timeout", "=", "30"}));
    ASSERT_EQ(tokenizeString<Strings>("::/etc/xdg::/usr/etc:", ":"), Strings({"/etc/xdg", "/usr/etc"}));
}

TEST(tokenizeString, intoVector)
{
    auto lines = tokenizeString<std::vector<std::string>>("a = 1\n\nb = 2\n", "\n");

    ASSERT_EQ(lines, std::vector<std::string>({"a = 1", "b = 2"}));
}

TEST(concatStringsSep, joinsRegions)
{
    ASSERT_EQ(concatStringsSep(", ", Strings()), "");
    ASSERT_EQ(concatStringsSep(", ", Strings({"re-gion-1"})), "re-gion-1");
    ASSERT_EQ(concatStringsSep(", ", Strings({"re-gion-1", "re-gion-2"})), "re-gion-1, re-gion-2");
}

/* ----------------------------------------------------------------------------
 * chomp, stripIndentation, indent
 * --------------------------------------------------------------------------*/

TEST(chomp, removesTrailingWhitespace)
{
    ASSERT_EQ(chomp("foo \n"), "foo");
    ASSERT_EQ(chomp(" foo"), " foo");
    ASSERT_EQ(chomp(" \t\n"), "");
}

TEST(stripIndentation, removesCommonIndentation)
{
    ASSERT_EQ(stripIndentation("  foo\n    bar\n  baz"), "foo\n  bar\nbaz\n");
}

TEST(stripIndentation, keepsBlankLines)
{
    ASSERT_EQ(stripIndentation("\n    foo\n\n    bar\n"), "\nfoo\n\nbar\n");
}

TEST(indent, continuationLinesGetInit)
{
    ASSERT_EQ(indent("> ", "  ", "foo\nbar"), "> foo\n  bar");
    ASSERT_EQ(indent("> ", "  ", "foo\n\nbar"), "> foo\n\n  bar");
}

/* ----------------------------------------------------------------------------
 * string2Int
 * --------------------------------------------------------------------------*/

TEST(string2Int, parsesIntegers)
{
    ASSERT_EQ(string2Int<unsigned int>("30"), 30u);
    ASSERT_EQ(string2Int<int>("-7"), -7);
    ASSERT_EQ(string2Int<long>("0"), 0l);
}

TEST(string2Int, rejectsGarbage)
{
    ASSERT_EQ(string2Int<unsigned int>("thirty"), std::nullopt);
    ASSERT_EQ(string2Int<unsigned long>("-1"), std::nullopt);
    ASSERT_EQ(string2Int<int>(""), std::nullopt);
    ASSERT_EQ(string2Int<int>("12abc"), std::nullopt);
}

} // namespace awsctx
