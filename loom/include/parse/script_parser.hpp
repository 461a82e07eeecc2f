//! # Script Parser
//!
//! Builds a `ScriptAst` from a token stream, recognising module syntax:
//!
//! ```text
//! import def, * as ns, { a, b as c } from "src";   -> ImportDecl
//! import "src";                                     -> ImportDecl (side effect)
//! import type { T } from "src";                     -> ImportDecl (type only)
//! export * from "src";  export { a } from "src";    -> ExportFrom
//! export { a, b as c };                             -> ExportNamed
//! export const x = ...; export function f() {}      -> ExportDecl + Code
//! export default ...                                -> ExportDefault + Code
//! require("src")                                    -> RequireCall
//! import("src")                                     -> DynamicImport
//! ```
//!
//! Anything else, including module-like syntax with a non-literal source,
//! stays in `Code`.

#ifndef LOOM_PARSE_SCRIPT_PARSER_HPP
#define LOOM_PARSE_SCRIPT_PARSER_HPP

#include "ast/ast.hpp"
#include "build/error.hpp"
#include "common.hpp"

#include <string>
#include <string_view>

namespace loom::parse {

/// Parses a script. Lexical errors become `ParseError` for `path`.
[[nodiscard]] auto parse_script(std::string_view source, const std::string& path)
    -> Result<ast::ScriptAst, BuildError>;

} // namespace loom::parse

#endif // LOOM_PARSE_SCRIPT_PARSER_HPP
