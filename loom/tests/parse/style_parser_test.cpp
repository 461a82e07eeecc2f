//! # Style Parser Tests

#include "parse/printer.hpp"
#include "parse/style_parser.hpp"

#include <gtest/gtest.h>

using namespace loom;
using namespace loom::parse;

namespace {

template <typename T> auto collect(const ast::StyleAst& ast) -> std::vector<T> {
    std::vector<T> out;
    for (const auto& stmt : ast.body) {
        if (const auto* s = std::get_if<T>(&stmt))
            out.push_back(*s);
    }
    return out;
}

} // namespace

TEST(StyleParserTest, ImportRules) {
    auto result = parse_style("@import \"./a.css\";\n"
                              "@import url('./b.css') screen and (min-width: 100px);\n"
                              "@IMPORT './c.css';\n",
                              "/p/index.css");
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();

    auto imports = collect<ast::StyleImport>(unwrap(result));
    ASSERT_EQ(imports.size(), 3u);
    EXPECT_EQ(imports[0].url, "./a.css");
    EXPECT_EQ(imports[0].media, "");
    EXPECT_EQ(imports[1].url, "./b.css");
    EXPECT_EQ(imports[1].media, "screen and (min-width: 100px)");
    EXPECT_EQ(imports[2].url, "./c.css");
}

TEST(StyleParserTest, UrlReferences) {
    auto result = parse_style(".a { background: url(logo.png); }\n"
                              ".b { background: url( \"img/x.svg\" ); }\n"
                              ".c { mask: url('#frag'); }\n",
                              "/p/index.css");
    ASSERT_TRUE(is_ok(result));

    auto urls = collect<ast::StyleUrl>(unwrap(result));
    ASSERT_EQ(urls.size(), 3u);
    EXPECT_EQ(urls[0].url, "logo.png");
    EXPECT_EQ(urls[0].quote, 0);
    EXPECT_EQ(urls[1].url, "img/x.svg");
    EXPECT_EQ(urls[1].quote, '"');
    EXPECT_EQ(urls[2].url, "#frag");
}

TEST(StyleParserTest, CommentsAndStringsAreNotRules) {
    auto result = parse_style("/* @import './hidden.css'; url(hidden.png) */\n"
                              ".a::before { content: \"url(nope.png)\"; }\n",
                              "/p/index.css");
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(collect<ast::StyleImport>(unwrap(result)).empty());
    EXPECT_TRUE(collect<ast::StyleUrl>(unwrap(result)).empty());
}

TEST(StyleParserTest, IdentifierEndingInUrlIsNotUrl) {
    auto result = parse_style(".a { --my-url(x); }\n", "/p/index.css");
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(collect<ast::StyleUrl>(unwrap(result)).empty());
}

TEST(StyleParserTest, PrintsBackNormalizedSource) {
    auto result = parse_style("@import './a.css';\n.x { background: url(a.png); }\n",
                              "/p/index.css");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(print_style(unwrap(result)),
              "@import \"./a.css\";\n.x { background: url(a.png); }\n");
}

TEST(StyleParserTest, UnterminatedUrlIsParseError) {
    auto result = parse_style(".a {\n  background: url(logo.png\n}\n", "/p/broken.css");
    ASSERT_TRUE(is_err(result));
    const auto& err = unwrap_err(result);
    EXPECT_EQ(err.kind, BuildErrorKind::ParseError);
    EXPECT_EQ(err.path, "/p/broken.css");
    EXPECT_NE(err.message.find("2:15"), std::string::npos);
}

TEST(StyleParserTest, UnterminatedCommentIsParseError) {
    auto result = parse_style("/* never closed", "/p/broken.css");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, BuildErrorKind::ParseError);
}
