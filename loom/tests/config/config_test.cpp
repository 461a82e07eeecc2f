//! # Configuration Tests

#include "../common/temp_project.hpp"
#include "build/entries.hpp"
#include "config/config.hpp"

#include <gtest/gtest.h>

using namespace loom;
using namespace loom::config;

// ============================================================================
// Parsing
// ============================================================================

TEST(ConfigTest, EmptyObjectGivesDefaults) {
    auto result = parse_config("{}");
    ASSERT_TRUE(is_ok(result));
    const auto& config = unwrap(result);
    EXPECT_TRUE(config.entry.empty());
    EXPECT_TRUE(config.alias.empty());
    EXPECT_TRUE(config.externals.empty());
    EXPECT_EQ(config.inline_limit, DEFAULT_INLINE_LIMIT);
    EXPECT_EQ(config.threads, 0u);
}

TEST(ConfigTest, AllSections) {
    auto result = parse_config(R"({
        "entry": { "main": "src/main.ts", "admin": "src/admin.ts" },
        "resolve": { "alias": { "@": "./src" } },
        "externals": { "react": "React", "react-dom": "ReactDOM" },
        "assets": { "inlineLimit": 2048 },
        "build": { "threads": 3 }
    })");
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    const auto& config = unwrap(result);

    EXPECT_EQ(config.entry.at("admin"), "src/admin.ts");
    EXPECT_EQ(config.alias.at("@"), "./src");
    EXPECT_EQ(config.externals.at("react-dom"), "ReactDOM");
    EXPECT_EQ(config.inline_limit, 2048u);
    EXPECT_EQ(config.threads, 3u);
}

TEST(ConfigTest, WrongTypesAreConfigErrors) {
    const char* cases[] = {
        "[]",
        R"({"entry": "src/index.ts"})",
        R"({"externals": {"react": 1}})",
        R"({"resolve": []})",
        R"({"assets": {"inlineLimit": -1}})",
        R"({"build": {"threads": "many"}})",
    };
    for (const char* text : cases) {
        auto result = parse_config(text, "/p/loom.config.json");
        ASSERT_TRUE(is_err(result)) << text;
        EXPECT_EQ(unwrap_err(result).kind, BuildErrorKind::ConfigError) << text;
        EXPECT_EQ(unwrap_err(result).path, "/p/loom.config.json") << text;
    }
}

TEST(ConfigTest, ThreadCountIsBounded) {
    auto at_cap = parse_config(R"({"build": {"threads": 256}})");
    ASSERT_TRUE(is_ok(at_cap));
    EXPECT_EQ(unwrap(at_cap).threads, MAX_THREADS);

    for (const char* text : {R"({"build": {"threads": 257}})",
                             R"({"build": {"threads": 4294967297}})"}) {
        auto result = parse_config(text);
        ASSERT_TRUE(is_err(result)) << text;
        EXPECT_EQ(unwrap_err(result).kind, BuildErrorKind::ConfigError) << text;
        EXPECT_NE(unwrap_err(result).message.find("build.threads"), std::string::npos);
    }
}

TEST(ConfigTest, MalformedJsonIsConfigError) {
    auto result = parse_config("{ \"entry\": ");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, BuildErrorKind::ConfigError);
}

// ============================================================================
// Loading and Entries
// ============================================================================

TEST(ConfigTest, MissingFileGivesDefaults) {
    test::TempProject project;
    auto result = load_config(project.root());
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).inline_limit, DEFAULT_INLINE_LIMIT);
}

TEST(ConfigTest, LoadsFileFromRoot) {
    test::TempProject project;
    project.write(CONFIG_FILE_NAME, R"({"externals": {"vue": "Vue"}})");
    auto result = load_config(project.root());
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).externals.at("vue"), "Vue");
}

TEST(EntriesTest, DefaultEntrySearchOrder) {
    test::TempProject project;
    project.write("index.ts", "");
    project.write("src/index.ts", "");

    auto entries = build::find_entries(Config{}, project.root());
    ASSERT_TRUE(is_ok(entries));
    EXPECT_EQ(unwrap(entries), std::vector<std::string>{project.path("src/index.ts")});
}

TEST(EntriesTest, ConfiguredEntriesAreAbsolute) {
    test::TempProject project;
    project.write("app/a.ts", "");
    project.write("app/b.ts", "");
    Config config;
    config.entry["a"] = "app/a.ts";
    config.entry["b"] = "./app/b.ts";

    auto entries = build::find_entries(config, project.root());
    ASSERT_TRUE(is_ok(entries));
    EXPECT_EQ(unwrap(entries),
              (std::vector<std::string>{project.path("app/a.ts"), project.path("app/b.ts")}));
}

TEST(EntriesTest, NothingFoundIsEntryNotFound) {
    test::TempProject project;
    auto entries = build::find_entries(Config{}, project.root());
    ASSERT_TRUE(is_err(entries));
    EXPECT_EQ(unwrap_err(entries).kind, BuildErrorKind::EntryNotFound);
}
