#include "query/script.hpp"

#include <gtest/gtest.h>

using namespace cmscript;
using namespace cmscript::query;

// ============================================================================
// Scope Classification
// ============================================================================

struct ScopeCase {
    const char* text;
    ScopeKind kind;
    const char* prefix;
};

class ClassifyScopeTest : public ::testing::TestWithParam<ScopeCase> {};

TEST_P(ClassifyScopeTest, Classifies) {
    const auto& param = GetParam();
    auto match = classify_scope(param.text);
    EXPECT_EQ(scope_kind_to_string(match.kind), scope_kind_to_string(param.kind)) << param.text;
    EXPECT_EQ(match.prefix, param.prefix) << param.text;
}

INSTANTIATE_TEST_SUITE_P(
    Scopes, ClassifyScopeTest,
    ::testing::Values(ScopeCase{"", ScopeKind::Command, ""},
                      ScopeCase{"  add_lib", ScopeKind::Command, "add_lib"},
                      ScopeCase{"set(CMAKE_", ScopeKind::Setter, "CMAKE_"},
                      ScopeCase{"SET(", ScopeKind::Setter, ""},
                      ScopeCase{"message(${PROJ", ScopeKind::Access, "PROJ"},
                      ScopeCase{"include(CheckC", ScopeKind::Include, "CheckC"},
                      ScopeCase{"target_link_libraries(", ScopeKind::Params, ""},
                      ScopeCase{"set(A ", ScopeKind::Value, ""},
                      ScopeCase{"target_link_libraries(app PRIVATE fo", ScopeKind::Value, "fo"},
                      ScopeCase{"message(\"text", ScopeKind::Unknown, ""}));

TEST(CandidateKindsTest, PerScope) {
    EXPECT_EQ(candidate_kinds(ScopeKind::Command), std::vector<NameKind>{NameKind::Command});
    EXPECT_EQ(candidate_kinds(ScopeKind::Include), std::vector<NameKind>{NameKind::Module});
    EXPECT_EQ(candidate_kinds(ScopeKind::Access),
              (std::vector<NameKind>{NameKind::Variable, NameKind::Property}));
    EXPECT_EQ(candidate_kinds(ScopeKind::Params),
              (std::vector<NameKind>{NameKind::Module, NameKind::Variable, NameKind::Property}));
    EXPECT_TRUE(candidate_kinds(ScopeKind::Unknown).empty());
}

// ============================================================================
// Script
// ============================================================================

class ScriptTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_.add("add_executable", NameKind::Command);
        registry_.add("message", NameKind::Command);
        registry_.add("CTest", NameKind::Module);
        registry_.add("SOURCES", NameKind::Property);
        registry_.add("PROJECT_NAME", NameKind::Variable);
        registry_.add("CMAKE_CXX_STANDARD", NameKind::Variable);
    }

    StaticNameRegistry registry_;
};

TEST_F(ScriptTest, OffsetOfCursor) {
    Script script("set(A 1)\n");
    EXPECT_EQ(script.offset_of({.line = 0, .column = 0}), 0u);
    EXPECT_EQ(script.offset_of({.line = 0, .column = 8}), 8u);
    EXPECT_EQ(script.offset_of({.line = 1, .column = 0}), 9u);
    EXPECT_FALSE(script.offset_of({.line = 0, .column = 9}).has_value());
    EXPECT_FALSE(script.offset_of({.line = 2, .column = 0}).has_value());
}

TEST_F(ScriptTest, WordAt) {
    Script script("add_library(foo STATIC)\n");
    EXPECT_EQ(script.word_at(Cursor{.line = 0, .column = 3}), "add_library");
    EXPECT_EQ(script.word_at(Cursor{.line = 0, .column = 0}), "add_library");
    EXPECT_EQ(script.word_at(Cursor{.line = 0, .column = 13}), "foo");
}

TEST_F(ScriptTest, WordAtIncludesPositionJustAfterWord) {
    Script script("add_library(foo STATIC)\n");
    EXPECT_EQ(script.word_at(Cursor{.line = 0, .column = 11}), "add_library");
}

TEST_F(ScriptTest, WordAtAwayFromWords) {
    Script script("x  =  y\n");
    EXPECT_FALSE(script.word_at(Cursor{.line = 0, .column = 3}).has_value());
    EXPECT_FALSE(script.word_at(Cursor{.line = 5, .column = 0}).has_value());
    EXPECT_FALSE(script.word_at(size_t{100}).has_value());
}

TEST_F(ScriptTest, WordAtOnLaterLine) {
    Script script("if(A)\n  message(STATUS hi)\nendif()\n");
    EXPECT_EQ(script.word_at(Cursor{.line = 1, .column = 4}), "message");
    EXPECT_EQ(script.word_at(size_t{17}), "STATUS");
}

TEST_F(ScriptTest, WordAtInLongWord) {
    std::string word(100000, 'w');
    Script script("set(" + word + " 1)\n");
    EXPECT_EQ(script.word_at(Cursor{.line = 0, .column = 50000}), word);
    EXPECT_EQ(script.word_at(Cursor{.line = 0, .column = 100006}), "1");
}

TEST_F(ScriptTest, ScopeAtUsesSameLineOnly) {
    Script script("set(A\n  B");
    auto scope = script.scope_at({.line = 1, .column = 3});
    EXPECT_EQ(scope.kind, ScopeKind::Command);
    EXPECT_EQ(scope.prefix, "B");

    EXPECT_EQ(script.scope_at({.line = 9, .column = 0}).kind, ScopeKind::Unknown);
}

TEST_F(ScriptTest, CompleteCommand) {
    Script script("add_");
    auto names = script.complete({.line = 0, .column = 4}, registry_);
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0].name, "add_executable");
    EXPECT_EQ(names[1].name, "message");
}

TEST_F(ScriptTest, CompleteSetterOffersVariablesThenProperties) {
    Script script("set(");
    auto names = script.complete({.line = 0, .column = 4}, registry_);
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], (Name{.name = "PROJECT_NAME", .kind = NameKind::Variable}));
    EXPECT_EQ(names[1].name, "CMAKE_CXX_STANDARD");
    EXPECT_EQ(names[2], (Name{.name = "SOURCES", .kind = NameKind::Property}));
}

TEST_F(ScriptTest, CompleteInsideStringOffersNothing) {
    Script script("message(\"abc");
    EXPECT_TRUE(script.complete({.line = 0, .column = 12}, registry_).empty());
}

TEST_F(ScriptTest, Hover) {
    Script script("MESSAGE(${PROJECT_NAME})\n");
    auto command = script.hover({.line = 0, .column = 2}, registry_);
    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(command->name, "message");

    auto variable = script.hover({.line = 0, .column = 12}, registry_);
    ASSERT_TRUE(variable.has_value());
    EXPECT_EQ(variable->kind, NameKind::Variable);

    EXPECT_FALSE(script.hover({.line = 0, .column = 23}, registry_).has_value());
}

TEST_F(ScriptTest, ContextAtArgument) {
    Script script("project(demo)\nadd_executable(app main.cpp)\n");
    auto result = script.context_at(37);
    ASSERT_TRUE(is_ok(result));
    const auto& context = unwrap(result);
    ASSERT_TRUE(context.has_value());
    EXPECT_EQ(context->command, "add_executable");
    EXPECT_EQ(context->argument_index, 1);
    EXPECT_EQ(context->argument, "main.cpp");
}

TEST_F(ScriptTest, ContextAtCommandName) {
    Script script("project(demo)\n");
    auto result = script.context_at(3);
    ASSERT_TRUE(is_ok(result));
    ASSERT_TRUE(unwrap(result).has_value());
    EXPECT_EQ(unwrap(result)->argument_index, -1);
    EXPECT_FALSE(unwrap(result)->argument.has_value());
}

TEST_F(ScriptTest, ContextAtGroupedArgumentHasGroupText) {
    Script script("if((A AND B) OR C)\n");
    auto result = script.context_at(5);
    ASSERT_TRUE(is_ok(result));
    ASSERT_TRUE(unwrap(result).has_value());
    EXPECT_EQ(unwrap(result)->argument, "(A AND B)");
}

TEST_F(ScriptTest, ContextAtOutsideCommands) {
    Script script("a()\n\nb()\n");
    auto result = script.context_at(4);
    ASSERT_TRUE(is_ok(result));
    EXPECT_FALSE(unwrap(result).has_value());
}

TEST_F(ScriptTest, ContextAtReportsParseErrors) {
    Script script("foo(");
    auto result = script.context_at(0);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).code, "P003");
}
