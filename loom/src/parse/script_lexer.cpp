#include "parse/script_lexer.hpp"

#include <array>
#include <optional>

namespace loom::parse {

auto LexError::to_string() const -> std::string {
    return std::to_string(line) + ":" + std::to_string(column) + ": " + message;
}

namespace {

/// Keywords after which a `/` begins a regular expression.
constexpr std::array<std::string_view, 14> REGEX_PREFIX_KEYWORDS = {
    "return", "typeof", "instanceof", "in",    "of",   "new",   "delete",
    "void",   "throw",  "case",       "do",    "else", "yield", "await",
};

auto is_regex_prefix_keyword(std::string_view word) -> bool {
    for (auto keyword : REGEX_PREFIX_KEYWORDS) {
        if (word == keyword)
            return true;
    }
    return false;
}

auto is_ident_start(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$' ||
           static_cast<unsigned char>(c) >= 0x80;
}

auto is_ident_char(char c) -> bool {
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

class ScriptLexer {
public:
    explicit ScriptLexer(std::string_view source) : src_(source) {}

    auto run() -> Result<std::vector<Token>, LexError> {
        while (!at_end()) {
            auto err = next_token();
            if (err)
                return *err;
        }
        return std::move(tokens_);
    }

private:
    std::string_view src_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    std::vector<Token> tokens_;

    [[nodiscard]] auto at_end() const -> bool {
        return pos_ >= src_.size();
    }

    [[nodiscard]] auto peek(size_t ahead = 0) const -> char {
        return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
    }

    auto advance() -> char {
        char c = src_[pos_++];
        if (c == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        return c;
    }

    auto error_at(std::string message, size_t line, size_t column) const -> LexError {
        return LexError{std::move(message), line, column};
    }

    void push(TokenKind kind, size_t start, size_t line, size_t column, std::string value = {}) {
        tokens_.push_back(Token{kind, src_.substr(start, pos_ - start), line, column,
                                std::move(value)});
    }

    /// `n`-th significant token from the end, 0 being the last.
    [[nodiscard]] auto significant_from_end(size_t n) const -> const Token* {
        for (auto it = tokens_.rbegin(); it != tokens_.rend(); ++it) {
            if (!it->is_significant())
                continue;
            if (n == 0)
                return &*it;
            --n;
        }
        return nullptr;
    }

    [[nodiscard]] auto last_significant() const -> const Token* {
        return significant_from_end(0);
    }

    /// True when the last two significant tokens are an adjacent `++` or
    /// `--` applied to an operand, so the expression is already complete.
    [[nodiscard]] auto after_postfix_update() const -> bool {
        const Token* second = significant_from_end(0);
        const Token* first = significant_from_end(1);
        const Token* operand = significant_from_end(2);
        if (!second || !first || !operand)
            return false;
        if (!(second->is_punct('+') || second->is_punct('-')) || first->text != second->text)
            return false;
        if (first->text.data() + 1 != second->text.data())
            return false;

        switch (operand->kind) {
        case TokenKind::Ident:
            return !is_regex_prefix_keyword(operand->text);
        case TokenKind::Number:
        case TokenKind::String:
        case TokenKind::Template:
            return true;
        case TokenKind::Punct:
            return operand->is_punct(')') || operand->is_punct(']');
        default:
            return false;
        }
    }

    [[nodiscard]] auto regex_allowed() const -> bool {
        const Token* prev = last_significant();
        if (!prev)
            return true;

        switch (prev->kind) {
        case TokenKind::Ident:
            return is_regex_prefix_keyword(prev->text);
        case TokenKind::Punct:
            if (prev->is_punct(')') || prev->is_punct(']') || prev->is_punct('}'))
                return false;
            if (after_postfix_update())
                return false;
            // JSX closing tag `</`
            if (prev->is_punct('<') && &tokens_.back() == prev)
                return false;
            return true;
        default:
            return false;
        }
    }

    auto next_token() -> std::optional<LexError> {
        size_t start = pos_;
        size_t line = line_;
        size_t column = column_;
        char c = peek();

        if (is_space(c)) {
            while (!at_end() && is_space(peek()))
                advance();
            push(TokenKind::Whitespace, start, line, column);
            return std::nullopt;
        }

        if (c == '/' && peek(1) == '/') {
            while (!at_end() && peek() != '\n')
                advance();
            push(TokenKind::Comment, start, line, column);
            return std::nullopt;
        }

        if (c == '/' && peek(1) == '*') {
            advance();
            advance();
            while (!(peek() == '*' && peek(1) == '/')) {
                if (at_end())
                    return error_at("unterminated block comment", line, column);
                advance();
            }
            advance();
            advance();
            push(TokenKind::Comment, start, line, column);
            return std::nullopt;
        }

        if (c == '\'' || c == '"') {
            std::string value;
            if (auto err = scan_quoted(value))
                return err;
            push(TokenKind::String, start, line, column, std::move(value));
            return std::nullopt;
        }

        if (c == '`') {
            if (auto err = scan_template())
                return err;
            push(TokenKind::Template, start, line, column);
            return std::nullopt;
        }

        if (c == '/' && regex_allowed()) {
            if (auto err = scan_regex())
                return err;
            push(TokenKind::Regex, start, line, column);
            return std::nullopt;
        }

        if (is_ident_start(c)) {
            while (!at_end() && is_ident_char(peek()))
                advance();
            push(TokenKind::Ident, start, line, column);
            return std::nullopt;
        }

        if (c >= '0' && c <= '9') {
            while (!at_end() && (is_ident_char(peek()) || peek() == '.'))
                advance();
            push(TokenKind::Number, start, line, column);
            return std::nullopt;
        }

        advance();
        push(TokenKind::Punct, start, line, column);
        return std::nullopt;
    }

    auto scan_quoted(std::string& value) -> std::optional<LexError> {
        size_t line = line_;
        size_t column = column_;
        char quote = advance();

        while (true) {
            if (at_end() || peek() == '\n')
                return error_at("unterminated string literal", line, column);
            char c = advance();
            if (c == quote)
                return std::nullopt;
            if (c != '\\') {
                value += c;
                continue;
            }
            if (at_end())
                return error_at("unterminated string literal", line, column);
            char esc = advance();
            switch (esc) {
            case 'n':
                value += '\n';
                break;
            case 't':
                value += '\t';
                break;
            case 'r':
                value += '\r';
                break;
            case '\n':
                break; // line continuation
            default:
                value += esc;
                break;
            }
        }
    }

    auto scan_template() -> std::optional<LexError> {
        size_t line = line_;
        size_t column = column_;
        advance(); // `

        while (true) {
            if (at_end())
                return error_at("unterminated template literal", line, column);
            char c = advance();
            if (c == '\\') {
                if (!at_end())
                    advance();
            } else if (c == '`') {
                return std::nullopt;
            } else if (c == '$' && peek() == '{') {
                advance();
                if (auto err = scan_template_expression(line, column))
                    return err;
            }
        }
    }

    /// Skips a `${ ... }` substitution up to its closing brace.
    auto scan_template_expression(size_t line, size_t column) -> std::optional<LexError> {
        int depth = 1;
        while (true) {
            if (at_end())
                return error_at("unterminated template literal", line, column);
            char c = peek();
            if (c == '\'' || c == '"') {
                std::string ignored;
                if (auto err = scan_quoted(ignored))
                    return err;
            } else if (c == '`') {
                if (auto err = scan_template())
                    return err;
            } else if (c == '/' && peek(1) == '/') {
                while (!at_end() && peek() != '\n')
                    advance();
            } else if (c == '/' && peek(1) == '*') {
                advance();
                advance();
                while (!(peek() == '*' && peek(1) == '/')) {
                    if (at_end())
                        return error_at("unterminated block comment", line, column);
                    advance();
                }
                advance();
                advance();
            } else {
                advance();
                if (c == '{') {
                    ++depth;
                } else if (c == '}' && --depth == 0) {
                    return std::nullopt;
                }
            }
        }
    }

    auto scan_regex() -> std::optional<LexError> {
        size_t line = line_;
        size_t column = column_;
        advance(); // /
        bool in_class = false;

        while (true) {
            if (at_end() || peek() == '\n')
                return error_at("unterminated regular expression", line, column);
            char c = advance();
            if (c == '\\') {
                if (at_end() || peek() == '\n')
                    return error_at("unterminated regular expression", line, column);
                advance();
            } else if (c == '[') {
                in_class = true;
            } else if (c == ']') {
                in_class = false;
            } else if (c == '/' && !in_class) {
                break;
            }
        }
        while (!at_end() && is_ident_char(peek()))
            advance(); // flags
        return std::nullopt;
    }
};

} // namespace

auto tokenize_script(std::string_view source) -> Result<std::vector<Token>, LexError> {
    ScriptLexer lexer(source);
    return lexer.run();
}

} // namespace loom::parse
