//! # Code Printer
//!
//! Regenerates source text from module trees. Recognised statements are
//! printed in a normalized form (double-quoted sources, single spaces);
//! `Code` is emitted verbatim.

#ifndef LOOM_PARSE_PRINTER_HPP
#define LOOM_PARSE_PRINTER_HPP

#include "ast/ast.hpp"

#include <string>

namespace loom::parse {

[[nodiscard]] auto print_script(const ast::ScriptAst& script) -> std::string;
[[nodiscard]] auto print_style(const ast::StyleAst& style) -> std::string;

/// Prints either tree of a module.
[[nodiscard]] auto print_module(const ast::ModuleAst& module) -> std::string;

} // namespace loom::parse

#endif // LOOM_PARSE_PRINTER_HPP
