//! # Script Lexer
//!
//! Splits JavaScript/TypeScript source into a flat token stream. The lexer
//! knows just enough of the grammar to never mistake the inside of a
//! comment, string, template or regular expression for code:
//!
//! - **Comments**: `// line` and `/* block */`
//! - **Strings**: single and double quoted, with escapes decoded into `value`
//! - **Templates**: backtick literals including nested `${ ... }` expressions,
//!   kept as one token
//! - **Regular expressions**: a `/` starts a regex when the previous
//!   significant token cannot end an expression
//!
//! Every byte of the input belongs to exactly one token, so concatenating the
//! token texts reproduces the source.

#ifndef LOOM_PARSE_SCRIPT_LEXER_HPP
#define LOOM_PARSE_SCRIPT_LEXER_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace loom::parse {

enum class TokenKind {
    Ident,
    Punct,
    String,
    Template,
    Regex,
    Number,
    Comment,
    Whitespace,
};

struct Token {
    TokenKind kind;
    std::string_view text;
    size_t line = 1;
    size_t column = 1;

    /// Decoded contents for `String` tokens.
    std::string value;

    [[nodiscard]] auto is_significant() const -> bool {
        return kind != TokenKind::Comment && kind != TokenKind::Whitespace;
    }
    [[nodiscard]] auto is_ident(std::string_view word) const -> bool {
        return kind == TokenKind::Ident && text == word;
    }
    [[nodiscard]] auto is_punct(char c) const -> bool {
        return kind == TokenKind::Punct && text.size() == 1 && text[0] == c;
    }
};

struct LexError {
    std::string message;
    size_t line = 0;
    size_t column = 0;

    /// `line:column: message`
    [[nodiscard]] auto to_string() const -> std::string;
};

/// Tokenizes `source`. Token texts point into `source`, which must outlive
/// the returned vector.
[[nodiscard]] auto tokenize_script(std::string_view source) -> Result<std::vector<Token>, LexError>;

} // namespace loom::parse

#endif // LOOM_PARSE_SCRIPT_LEXER_HPP
