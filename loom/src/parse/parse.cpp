#include "parse/parse.hpp"

#include "json/json.hpp"
#include "parse/script_parser.hpp"
#include "parse/style_parser.hpp"

namespace loom::parse {

auto parse(const std::string& path, const load::Content& content)
    -> Result<ast::ModuleAst, BuildError> {
    switch (content.kind) {
    case load::ContentKind::Js: {
        auto script = parse_script(content.text, path);
        if (is_err(script))
            return unwrap_err(script);
        return ast::ModuleAst{ast::AstKind::Script, std::move(unwrap(script))};
    }
    case load::ContentKind::Css: {
        auto style = parse_style(content.text, path);
        if (is_err(style))
            return unwrap_err(style);
        return ast::ModuleAst{ast::AstKind::Style, std::move(unwrap(style))};
    }
    case load::ContentKind::Asset:
        return ast::make_exports_module(ast::AstKind::Asset, json::quote(content.text));
    }
    return BuildError::internal("unknown content kind", path);
}

} // namespace loom::parse
