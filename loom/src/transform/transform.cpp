#include "transform/transform.hpp"

#include "analyze/analyze_deps.hpp"
#include "json/json.hpp"

#include <cctype>
#include <set>
#include <type_traits>
#include <vector>

namespace loom::transform {

auto helper_source(const std::string& helper) -> std::string {
    return std::string(analyze::HELPERS_PREFIX) + "_/" + helper;
}

namespace {

auto is_identifier(const std::string& name) -> bool {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0])))
        return false;
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '$')
            return false;
    }
    return true;
}

auto property_key(const std::string& name) -> std::string {
    return is_identifier(name) ? name : json::quote(name);
}

auto member(const std::string& object, const std::string& name) -> std::string {
    return is_identifier(name) ? object + "." + name : object + "[" + json::quote(name) + "]";
}

class ScriptLowering {
public:
    auto run(const ast::ScriptAst& input) -> ast::ScriptAst {
        bool has_module_syntax = false;

        for (const auto& stmt : input.body) {
            std::visit(
                [&](const auto& s) {
                    using T = std::decay_t<decltype(s)>;
                    if constexpr (std::is_same_v<T, ast::Code> ||
                                  std::is_same_v<T, ast::RequireCall> ||
                                  std::is_same_v<T, ast::DynamicImport>) {
                        body_.push_back(s);
                    } else {
                        has_module_syntax = true;
                        lower(s);
                    }
                },
                stmt);
        }

        ast::ScriptAst output;
        if (has_module_syntax) {
            output.body.push_back(ast::Code{
                "\"use strict\";\nObject.defineProperty(exports, \"__esModule\", { value: true "
                "});\n"});
        }
        for (const auto& helper : helpers_) {
            output.body.push_back(ast::Code{"const " + helper + " = "});
            output.body.push_back(ast::RequireCall{helper_source(helper)});
            output.body.push_back(ast::Code{";\n"});
        }
        for (auto& stmt : body_)
            output.body.push_back(std::move(stmt));
        for (const auto& line : trailer_)
            output.body.push_back(ast::Code{"\n" + line});
        return output;
    }

private:
    std::vector<ast::ScriptStmt> body_;
    std::set<std::string> helpers_;
    std::vector<std::string> trailer_;
    std::set<std::string> temps_;

    void code(std::string text) {
        body_.push_back(ast::Code{std::move(text)});
    }

    void require(const std::string& source) {
        body_.push_back(ast::RequireCall{source});
    }

    /// `helper._(require("source"))`
    void wrapped_require(const char* helper, const std::string& source) {
        helpers_.insert(helper);
        code(std::string(helper) + "._(");
        require(source);
        code(")");
    }

    /// Fresh module-level name derived from the source's file name.
    auto temp_name(const std::string& source) -> std::string {
        auto slash = source.find_last_of('/');
        std::string base = slash == std::string::npos ? source : source.substr(slash + 1);
        auto dot = base.find('.');
        if (dot != std::string::npos && dot > 0)
            base = base.substr(0, dot);

        std::string name = "_";
        for (char c : base)
            name += std::isalnum(static_cast<unsigned char>(c)) ? c : '_';

        std::string candidate = name;
        for (int n = 1; !temps_.insert(candidate).second; ++n)
            candidate = name + std::to_string(n);
        return candidate;
    }

    void lower(const ast::ImportDecl& decl) {
        if (analyze::is_type_only(decl))
            return;

        if (decl.is_side_effect()) {
            require(decl.source);
            code(";");
            return;
        }

        bool first = true;
        auto separate = [&] {
            if (!first)
                code("\n");
            first = false;
        };

        if (decl.namespace_binding) {
            separate();
            code("const " + *decl.namespace_binding + " = ");
            wrapped_require(INTEROP_REQUIRE_WILDCARD, decl.source);
            code(";");
            if (decl.default_binding)
                code("\nconst " + *decl.default_binding + " = " + *decl.namespace_binding +
                     ".default;");
        } else if (decl.default_binding) {
            separate();
            code("const " + *decl.default_binding + " = ");
            wrapped_require(INTEROP_REQUIRE_DEFAULT, decl.source);
            code(".default;");
        }

        std::string pattern;
        for (const auto& spec : decl.named) {
            if (spec.type_only)
                continue;
            if (!pattern.empty())
                pattern += ", ";
            pattern += spec.imported == spec.local ? spec.local
                                                   : property_key(spec.imported) + ": " + spec.local;
        }
        if (!pattern.empty()) {
            separate();
            code("const { " + pattern + " } = ");
            require(decl.source);
            code(";");
        }
    }

    void lower(const ast::ExportFrom& exp) {
        if (analyze::is_type_only(exp))
            return;

        if (exp.star && !exp.star_alias) {
            helpers_.insert(EXPORT_STAR);
            code(std::string(EXPORT_STAR) + "._(");
            require(exp.source);
            code(", exports);");
            return;
        }

        if (exp.star) {
            code(member("exports", *exp.star_alias) + " = ");
            wrapped_require(INTEROP_REQUIRE_WILDCARD, exp.source);
            code(";");
            return;
        }

        auto temp = temp_name(exp.source);
        code("const " + temp + " = ");
        require(exp.source);
        code(";");
        for (const auto& spec : exp.named) {
            if (!spec.type_only)
                code("\n" + member("exports", spec.local) + " = " + member(temp, spec.imported) +
                     ";");
        }
    }

    void lower(const ast::ExportNamed& exp) {
        if (exp.type_only)
            return;
        for (const auto& spec : exp.named) {
            if (!spec.type_only)
                trailer_.push_back(member("exports", spec.local) + " = " + spec.imported + ";");
        }
    }

    void lower(const ast::ExportDecl& decl) {
        if (decl.type_only)
            return;
        for (const auto& name : decl.names)
            trailer_.push_back(member("exports", name) + " = " + name + ";");
    }

    void lower(const ast::ExportDefault&) {
        code("exports.default =");
    }
};

} // namespace

void transform(ast::ModuleAst& module) {
    if (module.kind != ast::AstKind::Script)
        return;

    ScriptLowering lowering;
    module.tree = lowering.run(module.script());
}

} // namespace loom::transform
