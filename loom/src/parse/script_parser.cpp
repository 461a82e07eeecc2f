#include "parse/script_parser.hpp"

#include "parse/script_lexer.hpp"

#include <optional>
#include <utility>

namespace loom::parse {

namespace {

using ast::ImportSpecifier;

/// A recognised statement and the index of its last token.
struct Match {
    ast::ScriptStmt stmt;
    size_t end;
};

class ScriptParser {
public:
    explicit ScriptParser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    auto run() -> ast::ScriptAst {
        size_t i = 0;
        while (i < tokens_.size()) {
            const Token& tok = tokens_[i];
            if (tok.kind == TokenKind::Ident && !after_member_access(i)) {
                std::optional<Match> match;
                if (tok.text == "import") {
                    match = match_import(i);
                } else if (tok.text == "export") {
                    match = match_export(i);
                } else if (tok.text == "require") {
                    match = match_require(i);
                }

                if (match) {
                    flush_code();
                    ast_.body.push_back(std::move(match->stmt));
                    i = match->end + 1;
                    continue;
                }
            }
            code_ += tok.text;
            ++i;
        }
        flush_code();
        return std::move(ast_);
    }

private:
    std::vector<Token> tokens_;
    ast::ScriptAst ast_;
    std::string code_;

    void flush_code() {
        if (!code_.empty()) {
            ast_.body.push_back(ast::Code{std::move(code_)});
            code_.clear();
        }
    }

    [[nodiscard]] auto at(size_t index) const -> const Token* {
        return index < tokens_.size() ? &tokens_[index] : nullptr;
    }

    [[nodiscard]] auto next_sig(size_t index) const -> size_t {
        size_t k = index + 1;
        while (k < tokens_.size() && !tokens_[k].is_significant())
            ++k;
        return k;
    }

    [[nodiscard]] auto prev_sig(size_t index) const -> const Token* {
        while (index > 0) {
            --index;
            if (tokens_[index].is_significant())
                return &tokens_[index];
        }
        return nullptr;
    }

    [[nodiscard]] auto after_member_access(size_t index) const -> bool {
        const Token* prev = prev_sig(index);
        return prev && prev->is_punct('.');
    }

    [[nodiscard]] static auto is_name(const Token* tok) -> bool {
        return tok && (tok->kind == TokenKind::Ident || tok->kind == TokenKind::String);
    }

    [[nodiscard]] static auto name_of(const Token* tok) -> std::string {
        return tok->kind == TokenKind::String ? tok->value : std::string(tok->text);
    }

    /// Extends `end` over a trailing `;` if there is one.
    [[nodiscard]] auto consume_semicolon(size_t end) const -> size_t {
        size_t k = next_sig(end);
        const Token* tok = at(k);
        return tok && tok->is_punct(';') ? k : end;
    }

    /// Extends `end` over `assert { ... }` or `with { ... }`.
    [[nodiscard]] auto skip_import_attributes(size_t end) const -> size_t {
        size_t k = next_sig(end);
        const Token* tok = at(k);
        if (!tok || !(tok->is_ident("assert") || tok->is_ident("with")))
            return end;
        size_t open = next_sig(k);
        if (!at(open) || !at(open)->is_punct('{'))
            return end;
        for (size_t m = open; m < tokens_.size(); m = next_sig(m)) {
            if (tokens_[m].is_punct('}'))
                return m;
        }
        return end;
    }

    /// `from "source"` starting at `index`. Returns the source and the index
    /// of the string token.
    [[nodiscard]] auto match_from(size_t index) const
        -> std::optional<std::pair<std::string, size_t>> {
        const Token* tok = at(index);
        if (!tok || !tok->is_ident("from"))
            return std::nullopt;
        size_t k = next_sig(index);
        const Token* source = at(k);
        if (!source || source->kind != TokenKind::String)
            return std::nullopt;
        return std::make_pair(source->value, k);
    }

    /// `{ a, type b, c as d, "e-f" as g }` starting at the opening brace.
    /// Returns the specifiers and the index of the closing brace.
    [[nodiscard]] auto parse_specifiers(size_t open) const
        -> std::optional<std::pair<std::vector<ImportSpecifier>, size_t>> {
        std::vector<ImportSpecifier> specs;
        size_t k = next_sig(open);

        while (true) {
            const Token* tok = at(k);
            if (!tok)
                return std::nullopt;
            if (tok->is_punct('}'))
                return std::make_pair(std::move(specs), k);

            ImportSpecifier spec;
            if (tok->is_ident("type")) {
                size_t after = next_sig(k);
                const Token* next = at(after);
                if (is_name(next) && !next->is_ident("as")) {
                    spec.type_only = true;
                    k = after;
                    tok = next;
                }
            }
            if (!is_name(tok))
                return std::nullopt;
            spec.imported = name_of(tok);
            spec.local = spec.imported;

            k = next_sig(k);
            tok = at(k);
            if (tok && tok->is_ident("as")) {
                k = next_sig(k);
                tok = at(k);
                if (!is_name(tok))
                    return std::nullopt;
                spec.local = name_of(tok);
                k = next_sig(k);
                tok = at(k);
            }
            specs.push_back(std::move(spec));

            if (!tok)
                return std::nullopt;
            if (tok->is_punct(',')) {
                k = next_sig(k);
                continue;
            }
            if (!tok->is_punct('}'))
                return std::nullopt;
        }
    }

    /// Names bound by a destructuring pattern starting at `{` or `[`.
    [[nodiscard]] auto binding_names(size_t open) const -> std::optional<std::vector<std::string>> {
        std::vector<std::string> names;
        int depth = 0;

        for (size_t k = open; k < tokens_.size(); k = next_sig(k)) {
            const Token& tok = tokens_[k];
            if (tok.is_punct('{') || tok.is_punct('[')) {
                ++depth;
            } else if (tok.is_punct('}') || tok.is_punct(']')) {
                if (--depth == 0)
                    return names;
            } else if (tok.is_punct('=')) {
                // Skip the default value
                int nested = 0;
                size_t m = next_sig(k);
                for (; m < tokens_.size(); m = next_sig(m)) {
                    const Token& t = tokens_[m];
                    if (t.is_punct('(') || t.is_punct('{') || t.is_punct('[')) {
                        ++nested;
                    } else if (t.is_punct(')') || t.is_punct('}') || t.is_punct(']')) {
                        if (nested == 0)
                            break;
                        --nested;
                    } else if (t.is_punct(',') && nested == 0) {
                        break;
                    }
                }
                // Resume just before the terminator
                k = m - 1;
            } else if (tok.kind == TokenKind::Ident) {
                const Token* next = at(next_sig(k));
                if (next && (next->is_punct(',') || next->is_punct('}') || next->is_punct(']') ||
                             next->is_punct('='))) {
                    names.emplace_back(tok.text);
                }
            }
        }
        return std::nullopt;
    }

    auto match_import(size_t i) const -> std::optional<Match> {
        size_t j = next_sig(i);
        const Token* tok = at(j);
        if (!tok)
            return std::nullopt;

        if (tok->is_punct('(')) {
            size_t k = next_sig(j);
            size_t close = next_sig(k);
            if (at(k) && at(k)->kind == TokenKind::String && at(close) && at(close)->is_punct(')'))
                return Match{ast::DynamicImport{at(k)->value}, close};
            return std::nullopt;
        }

        ast::ImportDecl decl;

        if (tok->kind == TokenKind::String) {
            decl.source = tok->value;
            return Match{std::move(decl), consume_semicolon(skip_import_attributes(j))};
        }

        if (tok->is_ident("type")) {
            size_t k = next_sig(j);
            const Token* next = at(k);
            if (next && ((next->kind == TokenKind::Ident && !next->is_ident("from")) ||
                         next->is_punct('{') || next->is_punct('*'))) {
                decl.type_only = true;
                j = k;
                tok = next;
            }
        }

        if (tok->kind == TokenKind::Ident) {
            decl.default_binding = std::string(tok->text);
            j = next_sig(j);
            tok = at(j);
            if (tok && tok->is_punct(',')) {
                j = next_sig(j);
                tok = at(j);
            }
        }

        if (tok && tok->is_punct('*')) {
            size_t as = next_sig(j);
            size_t name = next_sig(as);
            if (!at(as) || !at(as)->is_ident("as") || !at(name) ||
                at(name)->kind != TokenKind::Ident)
                return std::nullopt;
            decl.namespace_binding = std::string(at(name)->text);
            j = next_sig(name);
        } else if (tok && tok->is_punct('{')) {
            auto specs = parse_specifiers(j);
            if (!specs)
                return std::nullopt;
            decl.named = std::move(specs->first);
            decl.has_braces = true;
            j = next_sig(specs->second);
        }

        if (decl.is_side_effect())
            return std::nullopt;

        auto from = match_from(j);
        if (!from)
            return std::nullopt;
        decl.source = std::move(from->first);
        return Match{std::move(decl), consume_semicolon(skip_import_attributes(from->second))};
    }

    /// `{ ... } [from "s"]` or `* [as name] from "s"` after `export [type]`.
    auto match_export_clause(size_t j, bool type_only) const -> std::optional<Match> {
        const Token* tok = at(j);

        if (tok->is_punct('*')) {
            ast::ExportFrom exp;
            exp.star = true;
            exp.type_only = type_only;
            size_t k = next_sig(j);
            if (at(k) && at(k)->is_ident("as")) {
                size_t name = next_sig(k);
                if (!is_name(at(name)))
                    return std::nullopt;
                exp.star_alias = name_of(at(name));
                k = next_sig(name);
            }
            auto from = match_from(k);
            if (!from)
                return std::nullopt;
            exp.source = std::move(from->first);
            return Match{std::move(exp), consume_semicolon(skip_import_attributes(from->second))};
        }

        auto specs = parse_specifiers(j);
        if (!specs)
            return std::nullopt;

        auto from = match_from(next_sig(specs->second));
        if (from) {
            ast::ExportFrom exp;
            exp.named = std::move(specs->first);
            exp.type_only = type_only;
            exp.source = std::move(from->first);
            return Match{std::move(exp), consume_semicolon(skip_import_attributes(from->second))};
        }

        ast::ExportNamed exp{std::move(specs->first), type_only};
        return Match{std::move(exp), consume_semicolon(specs->second)};
    }

    auto match_export(size_t i) const -> std::optional<Match> {
        size_t j = next_sig(i);
        const Token* tok = at(j);
        if (!tok)
            return std::nullopt;

        if (tok->is_punct('*') || tok->is_punct('{'))
            return match_export_clause(j, false);

        if (tok->kind != TokenKind::Ident)
            return std::nullopt;

        if (tok->is_ident("default"))
            return Match{ast::ExportDefault{}, j};

        if (tok->is_ident("type")) {
            size_t k = next_sig(j);
            const Token* next = at(k);
            if (next && (next->is_punct('*') || next->is_punct('{')))
                return match_export_clause(k, true);
            if (next && next->kind == TokenKind::Ident)
                return Match{ast::ExportDecl{{std::string(next->text)}, true}, i};
            return std::nullopt;
        }

        if (tok->is_ident("interface") || tok->is_ident("declare")) {
            const Token* next = at(next_sig(j));
            std::vector<std::string> names;
            if (next && next->kind == TokenKind::Ident)
                names.emplace_back(next->text);
            return Match{ast::ExportDecl{std::move(names), true}, i};
        }

        if (tok->is_ident("const") || tok->is_ident("let") || tok->is_ident("var")) {
            size_t k = next_sig(j);
            const Token* next = at(k);
            if (next && next->is_ident("enum")) {
                k = next_sig(k);
                next = at(k);
            }
            if (next && next->kind == TokenKind::Ident)
                return Match{ast::ExportDecl{{std::string(next->text)}, false}, i};
            if (next && (next->is_punct('{') || next->is_punct('['))) {
                auto names = binding_names(k);
                if (!names)
                    return std::nullopt;
                return Match{ast::ExportDecl{std::move(*names), false}, i};
            }
            return std::nullopt;
        }

        size_t k = j;
        if (tok->is_ident("async") || tok->is_ident("abstract"))
            k = next_sig(k);

        const Token* keyword = at(k);
        if (!keyword)
            return std::nullopt;
        if (keyword->is_ident("function") || keyword->is_ident("class") ||
            keyword->is_ident("enum") || keyword->is_ident("namespace") ||
            keyword->is_ident("module")) {
            size_t name = next_sig(k);
            if (at(name) && at(name)->is_punct('*'))
                name = next_sig(name);
            if (at(name) && at(name)->kind == TokenKind::Ident)
                return Match{ast::ExportDecl{{std::string(at(name)->text)}, false}, i};
        }
        return std::nullopt;
    }

    auto match_require(size_t i) const -> std::optional<Match> {
        const Token* prev = prev_sig(i);
        if (prev && prev->is_ident("function"))
            return std::nullopt;

        size_t open = next_sig(i);
        size_t arg = next_sig(open);
        size_t close = next_sig(arg);
        if (at(open) && at(open)->is_punct('(') && at(arg) &&
            at(arg)->kind == TokenKind::String && at(close) && at(close)->is_punct(')'))
            return Match{ast::RequireCall{at(arg)->value}, close};
        return std::nullopt;
    }
};

} // namespace

auto parse_script(std::string_view source, const std::string& path)
    -> Result<ast::ScriptAst, BuildError> {
    auto tokens = tokenize_script(source);
    if (is_err(tokens))
        return BuildError::parse(path, unwrap_err(tokens).to_string());

    ScriptParser parser(std::move(unwrap(tokens)));
    return parser.run();
}

} // namespace loom::parse
