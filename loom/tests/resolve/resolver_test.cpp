//! # Resolver Tests
//!
//! Relative paths, extension probing, directory indexes, package main
//! fields, aliases, externals and the resolution cache.

#include "../common/temp_project.hpp"
#include "resolve/resolver.hpp"

#include <gtest/gtest.h>

using namespace loom;
using namespace loom::resolve;

class ResolverTest : public ::testing::Test {
protected:
    test::TempProject project;

    auto make_resolver(config::Config config = {}) -> Resolver {
        return Resolver(Resolver::from_config(config, project.root()));
    }

    auto resolve_ok(const Resolver& resolver, const std::string& importer,
                    const std::string& specifier) -> std::string {
        auto result = resolver.resolve(project.path(importer), specifier);
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).to_string() : "");
        return is_ok(result) ? unwrap(result).path : std::string{};
    }
};

// ============================================================================
// Paths
// ============================================================================

TEST_F(ResolverTest, ExactFile) {
    project.write("src/index.ts", "");
    project.write("src/data.json", "{}");
    auto resolver = make_resolver();
    EXPECT_EQ(resolve_ok(resolver, "src/index.ts", "./data.json"), project.path("src/data.json"));
}

TEST_F(ResolverTest, ExtensionProbingOrder) {
    project.write("index.ts", "");
    project.write("util.js", "");
    project.write("util.ts", "");
    auto resolver = make_resolver();
    EXPECT_EQ(resolve_ok(resolver, "index.ts", "./util"), project.path("util.ts"));
}

TEST_F(ResolverTest, ParentDirectory) {
    project.write("src/deep/a.ts", "");
    project.write("src/b.tsx", "");
    auto resolver = make_resolver();
    EXPECT_EQ(resolve_ok(resolver, "src/deep/a.ts", "../b"), project.path("src/b.tsx"));
}

TEST_F(ResolverTest, DirectoryIndex) {
    project.write("index.ts", "");
    project.write("components/index.tsx", "");
    auto resolver = make_resolver();
    EXPECT_EQ(resolve_ok(resolver, "index.ts", "./components"),
              project.path("components/index.tsx"));
}

TEST_F(ResolverTest, NodeModulesPackageMain) {
    project.write("src/index.ts", "");
    project.write("node_modules/lib/package.json", R"({"main": "dist/lib.js"})");
    project.write("node_modules/lib/dist/lib.js", "");
    auto resolver = make_resolver();
    EXPECT_EQ(resolve_ok(resolver, "src/index.ts", "lib"),
              project.path("node_modules/lib/dist/lib.js"));
}

TEST_F(ResolverTest, ModuleFieldPreferredOverMain) {
    project.write("index.ts", "");
    project.write("node_modules/lib/package.json",
                  R"({"main": "lib.cjs.js", "module": "lib.esm.js"})");
    project.write("node_modules/lib/lib.cjs.js", "");
    project.write("node_modules/lib/lib.esm.js", "");
    auto resolver = make_resolver();
    EXPECT_EQ(resolve_ok(resolver, "index.ts", "lib"), project.path("node_modules/lib/lib.esm.js"));
}

TEST_F(ResolverTest, ScopedPackageSubpath) {
    project.write("index.ts", "");
    project.write("node_modules/@swc/helpers/_/_export_star.js", "");
    auto resolver = make_resolver();
    EXPECT_EQ(resolve_ok(resolver, "index.ts", "@swc/helpers/_/_export_star"),
              project.path("node_modules/@swc/helpers/_/_export_star.js"));
}

TEST_F(ResolverTest, MissingModuleIsResolveError) {
    project.write("index.ts", "");
    auto resolver = make_resolver();
    auto result = resolver.resolve(project.path("index.ts"), "./missing");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, BuildErrorKind::ResolveError);
    EXPECT_EQ(unwrap_err(result).path, project.path("index.ts"));
}

// ============================================================================
// Alias and Externals
// ============================================================================

TEST_F(ResolverTest, AliasRelativeToRoot) {
    project.write("src/app/main.ts", "");
    project.write("src/shared/util.ts", "");
    config::Config config;
    config.alias["@"] = "./src";
    auto resolver = make_resolver(config);
    EXPECT_EQ(resolve_ok(resolver, "src/app/main.ts", "@/shared/util"),
              project.path("src/shared/util.ts"));
}

TEST_F(ResolverTest, LongestAliasWins) {
    project.write("index.ts", "");
    project.write("a/x.ts", "");
    project.write("b/x.ts", "");
    config::Config config;
    config.alias["lib"] = "./a";
    config.alias["lib/sub"] = "./b";
    auto resolver = make_resolver(config);
    EXPECT_EQ(resolve_ok(resolver, "index.ts", "lib/sub/x"), project.path("b/x.ts"));
    EXPECT_EQ(resolve_ok(resolver, "index.ts", "lib/x"), project.path("a/x.ts"));
}

TEST_F(ResolverTest, AliasDoesNotMatchPartialSegment) {
    project.write("index.ts", "");
    project.write("node_modules/library/index.js", "");
    config::Config config;
    config.alias["lib"] = "./nowhere";
    auto resolver = make_resolver(config);
    EXPECT_EQ(resolve_ok(resolver, "index.ts", "library"),
              project.path("node_modules/library/index.js"));
}

TEST_F(ResolverTest, ExternalsShortCircuit) {
    project.write("index.ts", "");
    config::Config config;
    config.externals["react"] = "React";
    auto resolver = make_resolver(config);

    auto result = resolver.resolve(project.path("index.ts"), "react");
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(unwrap(result).is_external());
    EXPECT_EQ(unwrap(result).path, "react");
    EXPECT_EQ(*unwrap(result).external, "React");
    EXPECT_EQ(resolver.cache_size(), 0u);
}

// ============================================================================
// Cache
// ============================================================================

TEST_F(ResolverTest, CacheKeyedByDirectory) {
    project.write("a.ts", "");
    project.write("b.ts", "");
    project.write("foo.ts", "");
    project.write("sub/c.ts", "");
    project.write("sub/foo.ts", "");
    auto resolver = make_resolver();

    EXPECT_EQ(resolve_ok(resolver, "a.ts", "./foo"), project.path("foo.ts"));
    EXPECT_EQ(resolve_ok(resolver, "b.ts", "./foo"), project.path("foo.ts"));
    EXPECT_EQ(resolver.cache_size(), 1u);

    EXPECT_EQ(resolve_ok(resolver, "sub/c.ts", "./foo"), project.path("sub/foo.ts"));
    EXPECT_EQ(resolver.cache_size(), 2u);
}

TEST_F(ResolverTest, FailuresAreCached) {
    project.write("index.ts", "");
    auto resolver = make_resolver();
    EXPECT_TRUE(is_err(resolver.resolve(project.path("index.ts"), "./late")));

    project.write("late.ts", "");
    EXPECT_TRUE(is_err(resolver.resolve(project.path("index.ts"), "./late")));
}
