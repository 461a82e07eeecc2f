//! # Style Parser
//!
//! Scans CSS for `@import` rules and `url(...)` references. Comments and
//! strings are skipped so that neither is mistaken for a reference.

#ifndef LOOM_PARSE_STYLE_PARSER_HPP
#define LOOM_PARSE_STYLE_PARSER_HPP

#include "ast/ast.hpp"
#include "build/error.hpp"
#include "common.hpp"

#include <string>
#include <string_view>

namespace loom::parse {

[[nodiscard]] auto parse_style(std::string_view source, const std::string& path)
    -> Result<ast::StyleAst, BuildError>;

} // namespace loom::parse

#endif // LOOM_PARSE_STYLE_PARSER_HPP
