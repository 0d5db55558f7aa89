#include "query/names.hpp"

#include <gtest/gtest.h>

using namespace cmscript::query;

TEST(NameKindTest, TagsRoundTrip) {
    for (auto kind : ALL_NAME_KINDS) {
        EXPECT_EQ(parse_name_kind(name_kind_to_string(kind)), kind);
    }
    EXPECT_EQ(name_kind_to_string(NameKind::Property), "property");
    EXPECT_FALSE(parse_name_kind("target").has_value());
    EXPECT_FALSE(parse_name_kind("Command").has_value());
}

class StaticNameRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_.add("add_executable", NameKind::Command);
        registry_.add("project", NameKind::Command);
        registry_.add("GNUInstallDirs", NameKind::Module);
        registry_.add("CMP0048", NameKind::Policy);
        registry_.add("SOURCES", NameKind::Property);
        registry_.add("PROJECT_NAME", NameKind::Variable);
    }

    StaticNameRegistry registry_;
};

TEST_F(StaticNameRegistryTest, NamesKeepInsertionOrder) {
    registry_.add("add_library", NameKind::Command);
    auto commands = registry_.names(NameKind::Command);
    ASSERT_EQ(commands.size(), 3u);
    EXPECT_EQ(commands[0].name, "add_executable");
    EXPECT_EQ(commands[2].name, "add_library");
    EXPECT_EQ(commands[2].kind, NameKind::Command);
}

TEST_F(StaticNameRegistryTest, DuplicatesAreIgnored) {
    registry_.add("project", NameKind::Command);
    EXPECT_EQ(registry_.size(), 6u);

    // Same text under another kind is a different name.
    registry_.add("project", NameKind::Variable);
    EXPECT_EQ(registry_.size(), 7u);
}

TEST_F(StaticNameRegistryTest, FindExact) {
    auto found = registry_.find("PROJECT_NAME");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, (Name{.name = "PROJECT_NAME", .kind = NameKind::Variable}));
    EXPECT_FALSE(registry_.find("project_name").has_value());
}

TEST_F(StaticNameRegistryTest, CommandsMatchIgnoringCase) {
    auto found = registry_.find("ADD_EXECUTABLE");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->name, "add_executable");
    EXPECT_EQ(found->kind, NameKind::Command);
}

TEST_F(StaticNameRegistryTest, FindPrefersEarlierKinds) {
    registry_.add("SOURCES", NameKind::Variable);
    auto found = registry_.find("SOURCES");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->kind, NameKind::Property);
}

TEST_F(StaticNameRegistryTest, MissingNameAndEmptyKind) {
    EXPECT_FALSE(registry_.find("no_such_name").has_value());

    StaticNameRegistry empty;
    EXPECT_TRUE(empty.names(NameKind::Module).empty());
    EXPECT_EQ(empty.size(), 0u);
}

TEST(StaticNameRegistryListingTest, AddListing) {
    StaticNameRegistry registry;
    registry.add_listing("CMAKE_CXX_STANDARD\r\n\n  CMAKE_BUILD_TYPE  \nPROJECT_NAME", NameKind::Variable);

    auto names = registry.names(NameKind::Variable);
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0].name, "CMAKE_CXX_STANDARD");
    EXPECT_EQ(names[1].name, "CMAKE_BUILD_TYPE");
    EXPECT_EQ(names[2].name, "PROJECT_NAME");
}
