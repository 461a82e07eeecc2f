#include "parse/printer.hpp"

#include "json/json.hpp"

#include <sstream>
#include <type_traits>

namespace loom::parse {

namespace {

void print_specifiers(std::ostringstream& out, const std::vector<ast::ImportSpecifier>& specs) {
    out << "{";
    for (size_t i = 0; i < specs.size(); ++i) {
        const auto& spec = specs[i];
        out << (i == 0 ? " " : ", ");
        if (spec.type_only)
            out << "type ";
        out << spec.imported;
        if (spec.local != spec.imported)
            out << " as " << spec.local;
    }
    out << (specs.empty() ? "}" : " }");
}

void print_import(std::ostringstream& out, const ast::ImportDecl& decl) {
    out << "import ";
    if (decl.type_only)
        out << "type ";
    if (decl.is_side_effect()) {
        out << json::quote(decl.source) << ";";
        return;
    }

    bool need_comma = false;
    if (decl.default_binding) {
        out << *decl.default_binding;
        need_comma = true;
    }
    if (decl.namespace_binding) {
        out << (need_comma ? ", " : "") << "* as " << *decl.namespace_binding;
        need_comma = true;
    }
    if (decl.has_braces) {
        out << (need_comma ? ", " : "");
        print_specifiers(out, decl.named);
    }
    out << " from " << json::quote(decl.source) << ";";
}

void print_export_from(std::ostringstream& out, const ast::ExportFrom& exp) {
    out << "export ";
    if (exp.type_only)
        out << "type ";
    if (exp.star) {
        out << "*";
        if (exp.star_alias)
            out << " as " << *exp.star_alias;
    } else {
        print_specifiers(out, exp.named);
    }
    out << " from " << json::quote(exp.source) << ";";
}

} // namespace

auto print_script(const ast::ScriptAst& script) -> std::string {
    std::ostringstream out;
    for (const auto& stmt : script.body) {
        std::visit(
            [&](const auto& s) {
                using T = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<T, ast::Code>) {
                    out << s.text;
                } else if constexpr (std::is_same_v<T, ast::ImportDecl>) {
                    print_import(out, s);
                } else if constexpr (std::is_same_v<T, ast::ExportFrom>) {
                    print_export_from(out, s);
                } else if constexpr (std::is_same_v<T, ast::ExportNamed>) {
                    out << (s.type_only ? "export type " : "export ");
                    print_specifiers(out, s.named);
                    out << ";";
                } else if constexpr (std::is_same_v<T, ast::ExportDecl>) {
                    out << "export";
                } else if constexpr (std::is_same_v<T, ast::ExportDefault>) {
                    out << "export default";
                } else if constexpr (std::is_same_v<T, ast::RequireCall>) {
                    out << "require(" << json::quote(s.source) << ")";
                } else {
                    out << "import(" << json::quote(s.source) << ")";
                }
            },
            stmt);
    }
    return out.str();
}

auto print_style(const ast::StyleAst& style) -> std::string {
    std::ostringstream out;
    for (const auto& stmt : style.body) {
        std::visit(
            [&](const auto& s) {
                using T = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<T, ast::Code>) {
                    out << s.text;
                } else if constexpr (std::is_same_v<T, ast::StyleImport>) {
                    out << "@import " << json::quote(s.url);
                    if (!s.media.empty())
                        out << " " << s.media;
                    out << ";";
                } else {
                    out << "url(";
                    if (s.quote)
                        out << s.quote << s.url << s.quote;
                    else
                        out << s.url;
                    out << ")";
                }
            },
            stmt);
    }
    return out.str();
}

auto print_module(const ast::ModuleAst& module) -> std::string {
    if (module.is_style())
        return print_style(module.style());
    return print_script(module.script());
}

} // namespace loom::parse
