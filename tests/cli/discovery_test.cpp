// Format Command Tests
// Tests for script discovery, fmt argument parsing and run_fmt

#include "../../src/cli/commands/cmd_format.hpp"
#include "../../src/cli/format_cache.hpp"
#include "../../src/cli/utils.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

using namespace cmscript;
using namespace cmscript::cli;
namespace fs = std::filesystem;

// ============================================================================
// parse_fmt_args Tests
// ============================================================================

class FmtArgsTest : public ::testing::Test {
protected:
    Result<FmtOptions, std::string> parse(const std::vector<std::string>& args) {
        std::vector<std::string> all = {"cmscript", "fmt"};
        all.insert(all.end(), args.begin(), args.end());
        std::vector<char*> argv;
        for (auto& arg : all) {
            argv.push_back(arg.data());
        }
        return parse_fmt_args(static_cast<int>(argv.size()), argv.data());
    }
};

TEST_F(FmtArgsTest, Defaults) {
    auto result = parse({});
    ASSERT_TRUE(is_ok(result));
    const auto& options = unwrap(result);
    EXPECT_TRUE(options.paths.empty());
    EXPECT_FALSE(options.check_only);
    EXPECT_FALSE(options.to_stdout);
    EXPECT_FALSE(options.no_cache);
    EXPECT_FALSE(options.jobs.has_value());
}

TEST_F(FmtArgsTest, FlagsAndPaths) {
    auto result = parse({"--check", "cmake", "--jobs=3", "-vv", "CMakeLists.txt", "--no-cache"});
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);
    const auto& options = unwrap(result);
    EXPECT_EQ(options.paths, (std::vector<std::string>{"cmake", "CMakeLists.txt"}));
    EXPECT_TRUE(options.check_only);
    EXPECT_TRUE(options.no_cache);
    EXPECT_EQ(options.jobs, 3u);
}

TEST_F(FmtArgsTest, Errors) {
    EXPECT_TRUE(is_err(parse({"--frobnicate"})));
    EXPECT_TRUE(is_err(parse({"--jobs=many"})));
    EXPECT_TRUE(is_err(parse({"--check", "--stdout", "a.cmake"})));
}

// ============================================================================
// Discovery Tests
// ============================================================================

class ScriptDirTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "cmscript_discovery_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path write(const std::string& name, const std::string& content) {
        auto path = test_dir / name;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    std::string read(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }
};

TEST(IsCMakeScriptTest, Names) {
    EXPECT_TRUE(is_cmake_script("CMakeLists.txt"));
    EXPECT_TRUE(is_cmake_script("cmake/Warnings.cmake"));
    EXPECT_FALSE(is_cmake_script("README.txt"));
    EXPECT_FALSE(is_cmake_script("cmakelists.txt"));
    EXPECT_FALSE(is_cmake_script("config.cmake.in"));
}

TEST_F(ScriptDirTest, FindsScriptsSorted) {
    write("CMakeLists.txt", "project(x)\n");
    write("src/CMakeLists.txt", "add_library(x a.cpp)\n");
    write("cmake/Options.cmake", "option(X \"x\" ON)\n");
    write("src/a.cpp", "int x;\n");

    auto scripts = discover_scripts(test_dir);
    ASSERT_EQ(scripts.size(), 3u);
    EXPECT_EQ(scripts[0], test_dir / "CMakeLists.txt");
    EXPECT_EQ(scripts[1], test_dir / "cmake" / "Options.cmake");
    EXPECT_EQ(scripts[2], test_dir / "src" / "CMakeLists.txt");
}

TEST_F(ScriptDirTest, SkipsHiddenAndBuildDirectories) {
    write("CMakeLists.txt", "project(x)\n");
    write(".git/hooks/x.cmake", "a()\n");
    write("build/CMakeCache.txt", "CMAKE_BUILD_TYPE:STRING=Debug\n");
    write("build/CMakeFiles/3.28/CMakeSystem.cmake", "set(A 1)\n");

    auto scripts = discover_scripts(test_dir);
    ASSERT_EQ(scripts.size(), 1u);
    EXPECT_EQ(scripts[0], test_dir / "CMakeLists.txt");
}

TEST_F(ScriptDirTest, MissingDirectoryYieldsNothing) {
    EXPECT_TRUE(discover_scripts(test_dir / "nope").empty());
}

// ============================================================================
// run_fmt Tests
// ============================================================================

TEST_F(ScriptDirTest, CheckReportsWithoutWriting) {
    auto path = write("CMakeLists.txt", "project(  x )\n");

    FmtOptions options{.paths = {test_dir.string()}, .check_only = true};
    EXPECT_EQ(run_fmt(options, Config{}), ExitCode::Failure);
    EXPECT_EQ(read(path), "project(  x )\n");
}

TEST_F(ScriptDirTest, FormatsDirectoryAndWritesCache) {
    auto path = write("CMakeLists.txt", "project(  x )\n");
    write("cmake/a.cmake", "set(A 1)\n");

    FmtOptions options{.paths = {test_dir.string()}};
    EXPECT_EQ(run_fmt(options, Config{}), ExitCode::Ok);
    EXPECT_EQ(read(path), "project(x)\n");

    FormatCache cache(test_dir, Config{}.format.fingerprint());
    cache.load();
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.is_clean(path, "project(x)\n"));

    options.check_only = true;
    EXPECT_EQ(run_fmt(options, Config{}), ExitCode::Ok);
}

TEST_F(ScriptDirTest, NoCacheLeavesNoCacheFile) {
    write("CMakeLists.txt", "project(  x )\n");

    FmtOptions options{.paths = {test_dir.string()}, .no_cache = true};
    EXPECT_EQ(run_fmt(options, Config{}), ExitCode::Ok);
    EXPECT_FALSE(fs::exists(test_dir / FORMAT_CACHE_FILE));

    Config config;
    config.cache = false;
    options.no_cache = false;
    EXPECT_EQ(run_fmt(options, config), ExitCode::Ok);
    EXPECT_FALSE(fs::exists(test_dir / FORMAT_CACHE_FILE));
}

TEST_F(ScriptDirTest, SingleFileUsesConfiguredOptions) {
    auto path = write("a.cmake", "a()\n\n\nb()\n");

    Config config;
    config.format.max_blank_lines = 1;
    FmtOptions options{.paths = {path.string()}};
    EXPECT_EQ(run_fmt(options, config), ExitCode::Ok);
    EXPECT_EQ(read(path), "a()\n\nb()\n");
    EXPECT_FALSE(fs::exists(test_dir / FORMAT_CACHE_FILE));
}

TEST_F(ScriptDirTest, MissingPathFails) {
    FmtOptions options{.paths = {(test_dir / "missing").string()}};
    EXPECT_EQ(run_fmt(options, Config{}), ExitCode::Failure);
}

TEST_F(ScriptDirTest, StdoutRejectsDirectory) {
    FmtOptions options{.paths = {test_dir.string()}, .to_stdout = true};
    EXPECT_EQ(run_fmt(options, Config{}), ExitCode::Failure);
}
