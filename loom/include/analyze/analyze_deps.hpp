//! # Dependency Analysis
//!
//! Collects the module references of a tree in source order.
//!
//! | Syntax                           | ResolveType     |
//! |----------------------------------|-----------------|
//! | `import ... from "x"`, `import "x"` | `Import`     |
//! | `export ... from "x"`            | `ExportFrom`    |
//! | `require("x")`                   | `Require`       |
//! | `import("x")`                    | `DynamicImport` |
//! | `@import "x"`                    | `CssImport`     |
//! | `url(x)`                         | `CssUrl`        |
//!
//! Type-only imports and re-exports are erased and contribute nothing.
//! Style urls that are data URIs, remote, protocol-relative or pure
//! fragments are not dependencies.

#ifndef LOOM_ANALYZE_ANALYZE_DEPS_HPP
#define LOOM_ANALYZE_ANALYZE_DEPS_HPP

#include "ast/ast.hpp"
#include "graph/module.hpp"

#include <string_view>
#include <vector>

namespace loom::analyze {

/// Prefix of the runtime helper modules the transform injects.
constexpr std::string_view HELPERS_PREFIX = "@swc/helpers/";

[[nodiscard]] auto analyze_deps(const ast::ModuleAst& module) -> std::vector<graph::Dependency>;

/// Appends a `Helper` dependency for each helper module the transformed tree
/// requires that `deps` does not already name.
void add_helper_deps(const ast::ModuleAst& module, std::vector<graph::Dependency>& deps);

/// True for import declarations the transform erases.
[[nodiscard]] auto is_type_only(const ast::ImportDecl& decl) -> bool;
[[nodiscard]] auto is_type_only(const ast::ExportFrom& exp) -> bool;

/// True for style urls that never become dependencies.
[[nodiscard]] auto is_ignored_style_url(std::string_view url) -> bool;

} // namespace loom::analyze

#endif // LOOM_ANALYZE_ANALYZE_DEPS_HPP
