#include "ast/ast.hpp"

namespace loom::ast {

auto ast_kind_name(AstKind kind) -> const char* {
    switch (kind) {
    case AstKind::Script:
        return "script";
    case AstKind::Style:
        return "style";
    case AstKind::Asset:
        return "asset";
    }
    return "unknown";
}

auto make_exports_module(AstKind kind, const std::string& expr) -> ModuleAst {
    ScriptAst script;
    script.body.push_back(Code{"module.exports = " + expr + ";"});
    return ModuleAst{kind, std::move(script)};
}

} // namespace loom::ast
