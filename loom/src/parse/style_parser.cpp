#include "parse/style_parser.hpp"

#include <cctype>
#include <optional>

namespace loom::parse {

namespace {

auto iequals_at(std::string_view src, size_t pos, std::string_view word) -> bool {
    if (pos + word.size() > src.size())
        return false;
    for (size_t i = 0; i < word.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(src[pos + i])) != word[i])
            return false;
    }
    return true;
}

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

auto is_ident_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

class StyleParser {
public:
    StyleParser(std::string_view source, const std::string& path) : src_(source), path_(path) {}

    auto run() -> Result<ast::StyleAst, BuildError> {
        while (!at_end()) {
            char c = peek();

            if (c == '/' && peek(1) == '*') {
                size_t start = pos_;
                size_t line = line_;
                size_t column = column_;
                advance();
                advance();
                while (!(peek() == '*' && peek(1) == '/')) {
                    if (at_end())
                        return error("unterminated comment", line, column);
                    advance();
                }
                advance();
                advance();
                code_ += src_.substr(start, pos_ - start);
                continue;
            }

            if (c == '"' || c == '\'') {
                size_t start = pos_;
                auto value = scan_string();
                if (is_err(value))
                    return unwrap_err(value);
                code_ += src_.substr(start, pos_ - start);
                continue;
            }

            if (c == '@' && iequals_at(src_, pos_, "@import") &&
                !is_ident_char(peek(7))) {
                auto result = parse_import();
                if (is_err(result))
                    return unwrap_err(result);
                if (unwrap(result))
                    continue;
            }

            if ((c == 'u' || c == 'U') && iequals_at(src_, pos_, "url(") &&
                (pos_ == 0 || !is_ident_char(src_[pos_ - 1]))) {
                auto url = parse_url();
                if (is_err(url))
                    return unwrap_err(url);
                flush_code();
                ast_.body.push_back(std::move(unwrap(url)));
                continue;
            }

            code_ += advance();
        }
        flush_code();
        return std::move(ast_);
    }

private:
    std::string_view src_;
    const std::string& path_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    ast::StyleAst ast_;
    std::string code_;

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

    void skip_whitespace() {
        while (!at_end() && std::isspace(static_cast<unsigned char>(peek())))
            advance();
    }

    void flush_code() {
        if (!code_.empty()) {
            ast_.body.push_back(ast::Code{std::move(code_)});
            code_.clear();
        }
    }

    auto error(const std::string& message, size_t line, size_t column) const -> BuildError {
        return BuildError::parse(path_, std::to_string(line) + ":" + std::to_string(column) +
                                            ": " + message);
    }

    auto scan_string() -> Result<std::string, BuildError> {
        size_t line = line_;
        size_t column = column_;
        char quote = advance();
        std::string value;
        while (true) {
            if (at_end() || peek() == '\n')
                return error("unterminated string", line, column);
            char c = advance();
            if (c == quote)
                return value;
            if (c == '\\' && !at_end()) {
                value += advance();
                continue;
            }
            value += c;
        }
    }

    /// Parses `url(...)` at the current position.
    auto parse_url() -> Result<ast::StyleUrl, BuildError> {
        size_t line = line_;
        size_t column = column_;
        for (int i = 0; i < 4; ++i)
            advance(); // url(
        skip_whitespace();

        ast::StyleUrl url;
        if (peek() == '"' || peek() == '\'') {
            url.quote = peek();
            auto value = scan_string();
            if (is_err(value))
                return unwrap_err(value);
            url.url = std::move(unwrap(value));
            skip_whitespace();
            if (peek() != ')')
                return error("unterminated url()", line, column);
            advance();
            return url;
        }

        size_t start = pos_;
        while (peek() != ')') {
            if (at_end() || peek() == '\n')
                return error("unterminated url()", line, column);
            advance();
        }
        url.url = std::string(trim(src_.substr(start, pos_ - start)));
        advance();
        return url;
    }

    /// Parses `@import` at the current position. Returns false (and consumes
    /// nothing) if the rule has no recognisable url.
    auto parse_import() -> Result<bool, BuildError> {
        size_t save_pos = pos_;
        size_t save_line = line_;
        size_t save_column = column_;
        size_t line = line_;
        size_t column = column_;

        for (int i = 0; i < 7; ++i)
            advance(); // @import
        skip_whitespace();

        ast::StyleImport rule;
        if (peek() == '"' || peek() == '\'') {
            auto value = scan_string();
            if (is_err(value))
                return unwrap_err(value);
            rule.url = std::move(unwrap(value));
        } else if (iequals_at(src_, pos_, "url(")) {
            auto url = parse_url();
            if (is_err(url))
                return unwrap_err(url);
            rule.url = std::move(unwrap(url).url);
        } else {
            pos_ = save_pos;
            line_ = save_line;
            column_ = save_column;
            return false;
        }

        size_t media_start = pos_;
        while (peek() != ';') {
            if (at_end())
                return error("unterminated @import", line, column);
            advance();
        }
        rule.media = std::string(trim(src_.substr(media_start, pos_ - media_start)));
        advance(); // ;

        flush_code();
        ast_.body.push_back(std::move(rule));
        return true;
    }
};

} // namespace

auto parse_style(std::string_view source, const std::string& path)
    -> Result<ast::StyleAst, BuildError> {
    StyleParser parser(source, path);
    return parser.run();
}

} // namespace loom::parse
