#include <gtest/gtest.h>

#include "sdbg/util/strings.hh"
#include "sdbg/util/error.hh"

namespace sdbg {

/* ----------------------------------------------------------------------------
 * concatStringsSep
 * --------------------------------------------------------------------------*/

TEST(concatStringsSep, joinsRegisterNames)
{
    std::vector<std::string> names = {"rax", "rbx", "rcx"};

    ASSERT_EQ(concatStringsSep(", ", names), "rax, rbx, rcx");
    ASSERT_EQ(concatStringsSep(", ", std::vector<std::string>{}), "");
}

TEST(concatStringsSep, keepsEmptyElements)
{
    Strings dirs = {"", "/etc/xdg", ""};

    ASSERT_EQ(concatStringsSep(":", dirs), ":/etc/xdg:");
}

/* ----------------------------------------------------------------------------
 * tokenizeString
 * --------------------------------------------------------------------------*/

TEST(tokenizeString, skipsRepeatedSeparators)
{
    auto words = tokenizeString<std::vector<std::string>>("  register   read rax ");
    std::vector<std::string> expected = {"register", "read", "rax"};

    ASSERT_EQ(words, expected);
}

TEST(tokenizeString, customSeparators)
{
    auto dirs = tokenizeString<Strings>("/etc/xdg::/usr/etc", ":");
    Strings expected = {"/etc/xdg", "/usr/etc"};

    ASSERT_EQ(dirs, expected);
}

/* ----------------------------------------------------------------------------
 * trim, chomp, hasPrefix, hasSuffix
 * --------------------------------------------------------------------------*/

TEST(trim, removesSurroundingWhitespace)
{
    ASSERT_EQ(trim("  \tdbg> \n"), "dbg>");
    ASSERT_EQ(trim(""), "");
    ASSERT_EQ(trim("   "), "");
}

TEST(chomp, removesTrailingWhitespaceOnly)
{
    ASSERT_EQ(chomp("  rax  0x01\n\n"), "  rax  0x01");
}

TEST(hasPrefix, basic)
{
    ASSERT_TRUE(hasPrefix("xmm15", "xmm"));
    ASSERT_TRUE(hasPrefix("xmm15", ""));
    ASSERT_FALSE(hasPrefix("xm", "xmm"));
}

TEST(hasSuffix, basic)
{
    ASSERT_TRUE(hasSuffix("stupid-dbg.conf", ".conf"));
    ASSERT_FALSE(hasSuffix("conf", "stupid-dbg.conf"));
}

/* ----------------------------------------------------------------------------
 * stripIndentation
 * --------------------------------------------------------------------------*/

TEST(stripIndentation, removesCommonIndent)
{
    ASSERT_EQ(stripIndentation("\n    foo\n      bar\n  "), "foo\n  bar\n");
}

TEST(stripIndentation, keepsParagraphBreaks)
{
    ASSERT_EQ(stripIndentation("\n      first\n\n      second\n    "), "first\n\nsecond\n");
}

/* ----------------------------------------------------------------------------
 * string2Int
 * --------------------------------------------------------------------------*/

TEST(string2Int, valid)
{
    ASSERT_EQ(string2Int<int>("4242"), 4242);
    ASSERT_EQ(string2Int<int>("-1"), -1);
}

TEST(string2Int, invalid)
{
    ASSERT_EQ(string2Int<int>("12a"), std::nullopt);
    ASSERT_EQ(string2Int<int>(""), std::nullopt);
    ASSERT_EQ(string2Int<unsigned int>("-1"), std::nullopt);
}

/* ----------------------------------------------------------------------------
 * shellSplitString
 * --------------------------------------------------------------------------*/

TEST(shellSplitString, empty)
{
    std::list<std::string> expected = {};

    ASSERT_EQ(shellSplitString(""), expected);
}

TEST(shellSplitString, twoWords)
{
    std::list<std::string> expected = {"attach", "42"};

    ASSERT_EQ(shellSplitString("attach 42"), expected);
}

TEST(shellSplitString, oneWordQuotedWithSpaces)
{
    std::list<std::string> expected = {"foo bar"};

    ASSERT_EQ(shellSplitString("'foo bar'"), expected);
}

TEST(shellSplitString, twoWordsWithSpacesAndQuotesQuoted)
{
    std::list<std::string> expected = {"foo bar'", "baz\""};

    ASSERT_EQ(shellSplitString("\"foo bar'\" 'baz\"'"), expected);
}

TEST(shellSplitString, emptyArgumentsAreAllowed)
{
    std::list<std::string> expected = {"run", "", "echo", ""};

    ASSERT_EQ(shellSplitString("run '' echo \"\""), expected);
}

TEST(shellSplitString, singleQuoteDoesNotUseEscapes)
{
    std::list<std::string> expected = {"foo\\\"bar"};

    ASSERT_EQ(shellSplitString("'foo\\\"bar'"), expected);
}

TEST(shellSplitString, doubleQuoteDoesUseEscapes)
{
    std::list<std::string> expected = {"foo\"bar"};

    ASSERT_EQ(shellSplitString("\"foo\\\"bar\""), expected);
}

TEST(shellSplitString, backslashEscapes)
{
    std::list<std::string> expected = {"foo bar", "baz"};

    ASSERT_EQ(shellSplitString("foo\\ bar baz"), expected);
}

TEST(shellSplitString, unterminatedQuotes)
{
    ASSERT_THROW(shellSplitString("run 'echo"), Error);
    ASSERT_THROW(shellSplitString("run \"echo"), Error);
    ASSERT_THROW(shellSplitString("run echo\\"), Error);
}

} // namespace sdbg
