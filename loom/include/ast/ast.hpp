//! # Module Syntax Trees
//!
//! Token-level trees for the three module kinds the engine handles.
//!
//! | Tree        | Produced for                                    |
//! |-------------|-------------------------------------------------|
//! | `ScriptAst` | `js jsx ts tsx mjs cjs`, JSON, asset wrappers   |
//! | `StyleAst`  | `css`                                           |
//!
//! Only the constructs that carry module relationships are modelled as
//! statements; everything in between is kept verbatim as `Code`, so printing
//! an untransformed tree reproduces the source modulo the normalization of
//! recognised import/export syntax.

#ifndef LOOM_AST_AST_HPP
#define LOOM_AST_AST_HPP

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace loom::ast {

// ============================================================================
// Script Statements
// ============================================================================

/// Verbatim source text.
struct Code {
    std::string text;
};

/// `imported as local` inside braces. For `export { a as b }` the local side
/// is the exported name.
struct ImportSpecifier {
    std::string imported;
    std::string local;
    bool type_only = false;
};

/// `import def, * as ns, { a, b as c } from "source";` or `import "source";`
struct ImportDecl {
    std::string source;
    std::optional<std::string> default_binding;
    std::optional<std::string> namespace_binding;
    std::vector<ImportSpecifier> named;
    bool has_braces = false;
    bool type_only = false;

    [[nodiscard]] auto is_side_effect() const -> bool {
        return !default_binding && !namespace_binding && !has_braces;
    }
};

/// `export * from "s"`, `export * as ns from "s"`, `export { a, b as c } from "s"`
struct ExportFrom {
    std::string source;
    bool star = false;
    std::optional<std::string> star_alias;
    std::vector<ImportSpecifier> named;
    bool type_only = false;
};

/// `export { a, b as c };` with no source.
struct ExportNamed {
    std::vector<ImportSpecifier> named;
    bool type_only = false;
};

/// The `export` keyword in front of a declaration. The declaration itself
/// stays in the following `Code`.
struct ExportDecl {
    std::vector<std::string> names;
    bool type_only = false;
};

/// `export default `; the exported expression follows as `Code`.
struct ExportDefault {};

/// `require("source")` with a literal argument.
struct RequireCall {
    std::string source;
};

/// `import("source")` with a literal argument.
struct DynamicImport {
    std::string source;
};

using ScriptStmt = std::variant<Code, ImportDecl, ExportFrom, ExportNamed, ExportDecl,
                                ExportDefault, RequireCall, DynamicImport>;

struct ScriptAst {
    std::vector<ScriptStmt> body;
};

// ============================================================================
// Style Statements
// ============================================================================

/// `@import "url" media;`
struct StyleImport {
    std::string url;
    std::string media;
};

/// `url(...)` inside a declaration. `quote` is `'`, `"` or 0 for bare urls.
struct StyleUrl {
    std::string url;
    char quote = 0;
};

using StyleStmt = std::variant<Code, StyleImport, StyleUrl>;

struct StyleAst {
    std::vector<StyleStmt> body;
};

// ============================================================================
// Module Tree
// ============================================================================

enum class AstKind {
    Script,
    Style,
    /// Script tree wrapping a static asset (`module.exports = "...";`).
    Asset,
};

[[nodiscard]] auto ast_kind_name(AstKind kind) -> const char*;

struct ModuleAst {
    AstKind kind = AstKind::Script;
    std::variant<ScriptAst, StyleAst> tree;

    [[nodiscard]] auto is_style() const -> bool {
        return kind == AstKind::Style;
    }
    [[nodiscard]] auto script() -> ScriptAst& {
        return std::get<ScriptAst>(tree);
    }
    [[nodiscard]] auto script() const -> const ScriptAst& {
        return std::get<ScriptAst>(tree);
    }
    [[nodiscard]] auto style() const -> const StyleAst& {
        return std::get<StyleAst>(tree);
    }
};

/// Script tree holding one `module.exports = <expr>;` statement.
[[nodiscard]] auto make_exports_module(AstKind kind, const std::string& expr) -> ModuleAst;

} // namespace loom::ast

#endif // LOOM_AST_AST_HPP
