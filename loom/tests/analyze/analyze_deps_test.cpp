//! # Dependency Analysis Tests

#include "analyze/analyze_deps.hpp"
#include "parse/script_parser.hpp"
#include "parse/style_parser.hpp"
#include "transform/transform.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace loom;
using namespace loom::analyze;
using graph::ResolveType;

namespace {

auto script(std::string_view source) -> ast::ModuleAst {
    auto result = parse::parse_script(source, "/p/a.ts");
    EXPECT_TRUE(is_ok(result));
    return ast::ModuleAst{ast::AstKind::Script, std::move(unwrap(result))};
}

auto style(std::string_view source) -> ast::ModuleAst {
    auto result = parse::parse_style(source, "/p/a.css");
    EXPECT_TRUE(is_ok(result));
    return ast::ModuleAst{ast::AstKind::Style, std::move(unwrap(result))};
}

} // namespace

TEST(AnalyzeDepsTest, ScriptDependenciesInSourceOrder) {
    auto module = script("import a from './a';\n"
                         "export * from './b';\n"
                         "const c = require('./c');\n"
                         "import('./d');\n");
    auto deps = analyze_deps(module);
    ASSERT_EQ(deps.size(), 4u);

    EXPECT_EQ(deps[0], (graph::Dependency{"./a", ResolveType::Import, 0}));
    EXPECT_EQ(deps[1], (graph::Dependency{"./b", ResolveType::ExportFrom, 1}));
    EXPECT_EQ(deps[2], (graph::Dependency{"./c", ResolveType::Require, 2}));
    EXPECT_EQ(deps[3], (graph::Dependency{"./d", ResolveType::DynamicImport, 3}));
}

TEST(AnalyzeDepsTest, TypeOnlyImportsContributeNothing) {
    auto module = script("import type { T } from './types';\n"
                         "import { type U } from './more-types';\n"
                         "export type { V } from './reexport';\n"
                         "import { type W, x } from './mixed';\n");
    auto deps = analyze_deps(module);
    ASSERT_EQ(deps.size(), 1u);
    EXPECT_EQ(deps[0].source, "./mixed");
    EXPECT_EQ(deps[0].order, 0u);
}

TEST(AnalyzeDepsTest, DuplicateSpecifiersKeepSeparateEntries) {
    auto module = script("import { a } from './x';\nimport { b } from './x';\n");
    auto deps = analyze_deps(module);
    ASSERT_EQ(deps.size(), 2u);
    EXPECT_EQ(deps[0].order, 0u);
    EXPECT_EQ(deps[1].order, 1u);
}

TEST(AnalyzeDepsTest, StyleDependencies) {
    auto module = style("@import './base.css';\n"
                        "@import 'https://cdn.example.com/x.css';\n"
                        ".a { background: url(logo.png); }\n"
                        ".b { background: url(data:image/png;base64,AAAA); }\n"
                        ".c { background: url(//cdn/x.png); }\n");
    auto deps = analyze_deps(module);
    ASSERT_EQ(deps.size(), 2u);
    EXPECT_EQ(deps[0], (graph::Dependency{"./base.css", ResolveType::CssImport, 0}));
    EXPECT_EQ(deps[1], (graph::Dependency{"logo.png", ResolveType::CssUrl, 1}));
}

TEST(AnalyzeDepsTest, HelperDependenciesFollowAnalysis) {
    auto module = script("import a from './a';\nimport * as b from './b';\nexport * from './c';\n");
    auto deps = analyze_deps(module);
    ASSERT_EQ(deps.size(), 3u);

    transform::transform(module);
    add_helper_deps(module, deps);

    ASSERT_EQ(deps.size(), 6u);
    std::vector<std::string> helpers;
    for (size_t i = 3; i < deps.size(); ++i) {
        EXPECT_EQ(deps[i].resolve_type, ResolveType::Helper);
        EXPECT_EQ(deps[i].order, i);
        helpers.push_back(deps[i].source);
    }
    std::sort(helpers.begin(), helpers.end());
    EXPECT_EQ(helpers, (std::vector<std::string>{"@swc/helpers/_/_export_star",
                                                  "@swc/helpers/_/_interop_require_default",
                                                  "@swc/helpers/_/_interop_require_wildcard"}));
}

TEST(AnalyzeDepsTest, HelperAlreadyRequiredIsNotDuplicated) {
    auto module = script("const h = require('@swc/helpers/_/_interop_require_default');\n"
                         "import a from './a';\n");
    auto deps = analyze_deps(module);
    transform::transform(module);
    add_helper_deps(module, deps);

    ASSERT_EQ(deps.size(), 2u);
    EXPECT_EQ(deps[0].resolve_type, ResolveType::Require);
    EXPECT_EQ(deps[1].resolve_type, ResolveType::Import);
}

TEST(AnalyzeDepsTest, IgnoredStyleUrls) {
    EXPECT_TRUE(is_ignored_style_url(""));
    EXPECT_TRUE(is_ignored_style_url("data:image/png;base64,x"));
    EXPECT_TRUE(is_ignored_style_url("http://a/b.png"));
    EXPECT_TRUE(is_ignored_style_url("https://a/b.png"));
    EXPECT_TRUE(is_ignored_style_url("//a/b.png"));
    EXPECT_TRUE(is_ignored_style_url("#mask"));
    EXPECT_FALSE(is_ignored_style_url("./logo.png"));
    EXPECT_FALSE(is_ignored_style_url("logo.png"));
}
