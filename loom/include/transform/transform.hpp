//! # Module Transform
//!
//! Lowers ES module syntax in script trees to CommonJS:
//!
//! ```text
//! import foo from "./foo";        const foo = _interop_require_default._(require("./foo")).default;
//! import * as ns from "./ns";     const ns = _interop_require_wildcard._(require("./ns"));
//! import { a, b as c } from "./x" const { a, b: c } = require("./x");
//! import "./side";                require("./side");
//! export * from "./all";          _export_star._(require("./all"), exports);
//! export const x = 1;             const x = 1; ... exports.x = x;
//! export default expr;            exports.default = expr;
//! ```
//!
//! Helpers are required from `@swc/helpers/_/<name>` at the top of the
//! module, once each. Type-only syntax is erased. Style and asset trees are
//! left unchanged.

#ifndef LOOM_TRANSFORM_TRANSFORM_HPP
#define LOOM_TRANSFORM_TRANSFORM_HPP

#include "ast/ast.hpp"

#include <string>

namespace loom::transform {

constexpr const char* INTEROP_REQUIRE_DEFAULT = "_interop_require_default";
constexpr const char* INTEROP_REQUIRE_WILDCARD = "_interop_require_wildcard";
constexpr const char* EXPORT_STAR = "_export_star";

/// `@swc/helpers/_/<helper>`
[[nodiscard]] auto helper_source(const std::string& helper) -> std::string;

void transform(ast::ModuleAst& module);

} // namespace loom::transform

#endif // LOOM_TRANSFORM_TRANSFORM_HPP
