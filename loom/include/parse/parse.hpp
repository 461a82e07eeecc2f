#ifndef LOOM_PARSE_PARSE_HPP
#define LOOM_PARSE_PARSE_HPP

#include "ast/ast.hpp"
#include "build/error.hpp"
#include "common.hpp"
#include "load/content.hpp"

#include <string>

namespace loom::parse {

/// Parses loaded content by kind: scripts and styles through their parsers,
/// assets into a `module.exports = "<value>";` wrapper.
[[nodiscard]] auto parse(const std::string& path, const load::Content& content)
    -> Result<ast::ModuleAst, BuildError>;

} // namespace loom::parse

#endif // LOOM_PARSE_PARSE_HPP
