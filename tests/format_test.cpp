#include "format/formatter.hpp"
#include "parser/parser.hpp"

#include <gtest/gtest.h>

using namespace cmscript;
using namespace cmscript::format;

class FormatterTest : public ::testing::Test {
protected:
    FormatOptions options_;

    // Parse and format, return formatted string
    auto format(const std::string& code) -> std::string {
        auto result = format_source(code, options_);
        if (is_err(result)) {
            return "PARSE_ERROR";
        }
        return unwrap(result);
    }

    auto blank_lines(int count) -> std::string {
        return std::string(static_cast<size_t>(count), '\n');
    }
};

// ============================================================================
// Spacing
// ============================================================================

TEST_F(FormatterTest, CollapsesArgumentSpacing) {
    EXPECT_EQ(format("command(   a    b )"), "command(a b)\n");
}

TEST_F(FormatterTest, SingleSpaceBeforeParen) {
    EXPECT_EQ(format("if  (A)\nendif\t()\n"), "if (A)\nendif ()\n");
}

TEST_F(FormatterTest, GroupedListsFollowSameRules) {
    EXPECT_EQ(format("if(( A   AND  B )   OR C)"), "if((A AND B) OR C)\n");
}

TEST_F(FormatterTest, IndentationAfterNewlineIsKept) {
    std::string code = "add_library(core\n"
                       "    src/a.cpp\n"
                       "        src/b.cpp\n"
                       ")\n";
    EXPECT_EQ(format(code), code);
}

TEST_F(FormatterTest, StripsTrailingWhitespace) {
    EXPECT_EQ(format("set(A 1)   \n"), "set(A 1)\n");
    EXPECT_EQ(format("set(A   \n  1 \t\n)\n"), "set(A\n  1\n)\n");
    EXPECT_EQ(format("# comment   \n"), "# comment\n");
}

TEST_F(FormatterTest, ArgumentsAndCommentsAreUntouched) {
    std::string code = "#   keep   inner   spacing\n"
                       "message(\"a   b\" [[c   d]] #[[e   f]] g)\n";
    EXPECT_EQ(format(code), code);
}

TEST_F(FormatterTest, MultiLineQuotedArgumentIsKeptVerbatim) {
    std::string code = "set(X \"x  \n\n\n\n  y \t\n\")\n";
    EXPECT_EQ(format(code), code);
}

TEST_F(FormatterTest, MultiLineBracketsAreKeptVerbatim) {
    std::string code = "file(WRITE out [=[a   \n\n\n\nb]=])\n"
                       "#[[ note  \n\n\n\n\n\n  end ]]\n";
    EXPECT_EQ(format(code), code);
}

TEST_F(FormatterTest, SpacingAroundVerbatimArgumentsIsNormalized) {
    EXPECT_EQ(format("set(X   \"a\n\n\nb\"   \n\n\n\n  Y)   \n"),
              "set(X \"a\n\n\nb\"\n\n  Y)\n");
    EXPECT_EQ(format("foo((a \"x\n\n\ny\")  b)\n"), "foo((a \"x\n\n\ny\") b)\n");
}

TEST_F(FormatterTest, LeadingIndentationAtFileScopeIsKept) {
    EXPECT_EQ(format("if(A)\n  message(hi)\nendif()\n"), "if(A)\n  message(hi)\nendif()\n");
}

// ============================================================================
// Blank Lines and End of File
// ============================================================================

TEST_F(FormatterTest, ClampsBlankLinesAtFileScope) {
    auto formatted = format("a()" + blank_lines(11) + "b()\n");
    EXPECT_EQ(formatted, "a()" + blank_lines(4) + "b()\n");
}

TEST_F(FormatterTest, ClampsBlankLinesInsideArguments) {
    auto formatted = format("set(A" + blank_lines(11) + "B)\n");
    EXPECT_EQ(formatted, "set(A" + blank_lines(2) + "B)\n");
}

TEST_F(FormatterTest, FileBlankLineLimitIsConfigurable) {
    options_.max_blank_lines = 0;
    EXPECT_EQ(format("a()\n\n\nb()\n"), "a()\nb()\n");
}

TEST_F(FormatterTest, ArgumentBlankLineLimitIsConfigurable) {
    options_.max_argument_blank_lines = 2;
    EXPECT_EQ(format("set(A\n\n\n\n\nB)\n"), "set(A\n\n\nB)\n");
}

TEST_F(FormatterTest, EndsWithExactlyOneNewline) {
    EXPECT_EQ(format("project(x)"), "project(x)\n");
    EXPECT_EQ(format("project(x)\n\n\n\n"), "project(x)\n");
    EXPECT_EQ(format("# only a comment"), "# only a comment\n");
}

TEST_F(FormatterTest, EmptyInput) {
    EXPECT_EQ(format(""), "");
    EXPECT_EQ(format("\n\n  \n"), "");
}

TEST_F(FormatterTest, CrLfBecomesLf) {
    EXPECT_EQ(format("a()\r\nb(x\r\n  y)\r\n"), "a()\nb(x\n  y)\n");
}

// ============================================================================
// Properties
// ============================================================================

TEST_F(FormatterTest, Idempotent) {
    const char* inputs[] = {
        "command(   a    b )",
        "if  ( (A  AND B)\n\n\n\n   OR C )   \n\n\n\n\n\nendif()",
        "  foo( a # c  \n  b )\n#[[ x ]]   \n",
        "set(X \"quoted   text\"   [=[bracket]=]   )\n",
        "set(X \"a  \n\n\n\nb\"   [[c\n\n\n\nd]]\n\n\n\n)\n#[[\n\n\n\n\n]]  \n",
    };
    for (const char* input : inputs) {
        auto once = format(input);
        ASSERT_NE(once, "PARSE_ERROR") << input;
        EXPECT_EQ(format(once), once) << input;
    }
}

TEST_F(FormatterTest, OutputParses) {
    auto formatted = format("foo(a  (b   c)\n\n\n d)\n");
    EXPECT_TRUE(is_ok(parser::parse(formatted)));
}

TEST_F(FormatterTest, ParseErrorIsReported) {
    auto result = format_source("foo(", options_);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).code, "P003");
}

TEST(FormatterApiTest, FormatCommandDirectly) {
    auto parsed = parser::parse("target_link_libraries (app   PRIVATE  core )");
    ASSERT_TRUE(is_ok(parsed));
    auto commands = unwrap(parsed).commands();
    ASSERT_EQ(commands.size(), 1u);

    Formatter formatter;
    EXPECT_EQ(formatter.format_command(*commands[0]), "target_link_libraries (app PRIVATE core)");
}

TEST(FormatterApiTest, NormalizeNewlinesWithoutEof) {
    EXPECT_EQ(Formatter::normalize_newlines("a  \n\n\n\nb  ", 1, false), "a\n\nb");
    EXPECT_EQ(Formatter::normalize_newlines("a\n\n", 3, true), "a\n");
}

TEST(FormatOptionsTest, Fingerprint) {
    FormatOptions defaults;
    FormatOptions same;
    FormatOptions wider;
    wider.max_blank_lines = 5;

    EXPECT_EQ(defaults.fingerprint(), same.fingerprint());
    EXPECT_NE(defaults.fingerprint(), wider.fingerprint());
}
