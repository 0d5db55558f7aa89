// Diagnostic Rendering Tests
// Tests for locate, render_diagnostic and DiagnosticEmitter

#include "../../src/cli/diagnostic.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace cmscript;
using namespace cmscript::cli;

TEST(LocateTest, CopiesTheErrorLine) {
    auto where = locate("a.cmake", "first()\nsecond(\r\nthird()\n", TextPos{.row = 2, .col = 8});

    EXPECT_EQ(where.path, "a.cmake");
    EXPECT_EQ(where.line_text, "second(");
    EXPECT_EQ(where.pos.col, 8u);
}

TEST(LocateTest, RowPastEndGivesEmptyLine) {
    EXPECT_EQ(locate("a.cmake", "x()\n", TextPos{.row = 5, .col = 1}).line_text, "");
}

TEST(RenderDiagnosticTest, SyntaxErrorWithSnippet) {
    Diagnostic diagnostic{.severity = Severity::Error,
                          .code = "P003",
                          .message = "unclosed argument list",
                          .location = locate("CMakeLists.txt", "foo(", TextPos{.row = 1, .col = 5})};

    EXPECT_EQ(render_diagnostic(diagnostic, false), "error[P003]: unclosed argument list\n"
                                                    "  --> CMakeLists.txt:1:5\n"
                                                    "  |\n"
                                                    "1 | foo(\n"
                                                    "  |     ^\n"
                                                    "\n");
}

TEST(RenderDiagnosticTest, CaretKeepsTabs) {
    Diagnostic diagnostic{.severity = Severity::Error,
                          .code = "P004",
                          .message = "m",
                          .location = locate("x", "\tset(\"a", TextPos{.row = 1, .col = 6})};

    auto text = render_diagnostic(diagnostic, false);
    EXPECT_NE(text.find("  | \t    ^\n"), std::string::npos);
}

TEST(RenderDiagnosticTest, WideRowNumberWidensGutter) {
    Diagnostic diagnostic{.severity = Severity::Warning,
                          .code = "",
                          .message = "m",
                          .location = SourceLocation{.path = "x", .pos = {12, 1}, .line_text = "y"}};

    auto text = render_diagnostic(diagnostic, false);
    EXPECT_EQ(text.rfind("warning: m\n", 0), 0u);
    EXPECT_NE(text.find("\n   --> x:12:1\n"), std::string::npos);
    EXPECT_NE(text.find("\n12 | y\n"), std::string::npos);
}

TEST(RenderDiagnosticTest, HeaderOnlyWithoutLocation) {
    Diagnostic diagnostic{.severity = Severity::Error,
                          .code = "E001",
                          .message = "Cannot read file: missing.cmake",
                          .location = std::nullopt};

    EXPECT_EQ(render_diagnostic(diagnostic, false), "error[E001]: Cannot read file: missing.cmake\n\n");
}

TEST(RenderDiagnosticTest, ColorAddsEscapes) {
    Diagnostic diagnostic{.severity = Severity::Error, .code = "E002", .message = "m", .location = {}};

    auto text = render_diagnostic(diagnostic, true);
    EXPECT_NE(text.find("\033["), std::string::npos);
    EXPECT_NE(text.find("E002"), std::string::npos);
}

TEST(DiagnosticEmitterTest, CountsErrors) {
    std::ostringstream out;
    DiagnosticEmitter emitter(out);

    emitter.error(ErrorCodes::INVALID_CURSOR, "offset 99 is outside x");
    emitter.syntax_error("x", "foo(", parser::ParseError{.code = "P003",
                                                          .message = "unclosed",
                                                          .offset = 4,
                                                          .pos = {1, 5}});

    EXPECT_EQ(emitter.error_count(), 2u);
    EXPECT_NE(out.str().find("error[E003]: offset 99 is outside x\n"), std::string::npos);
    EXPECT_NE(out.str().find("1 | foo(\n"), std::string::npos);
}
