#include "analyze/analyze_deps.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <type_traits>

namespace loom::analyze {

namespace {

using graph::Dependency;
using graph::ResolveType;

auto all_type_only(const std::vector<ast::ImportSpecifier>& specs) -> bool {
    return !specs.empty() && std::all_of(specs.begin(), specs.end(),
                                         [](const auto& spec) { return spec.type_only; });
}

auto starts_with(std::string_view s, std::string_view prefix) -> bool {
    return s.substr(0, prefix.size()) == prefix;
}

} // namespace

auto is_type_only(const ast::ImportDecl& decl) -> bool {
    if (decl.type_only)
        return true;
    return !decl.default_binding && !decl.namespace_binding && all_type_only(decl.named);
}

auto is_type_only(const ast::ExportFrom& exp) -> bool {
    return exp.type_only || (!exp.star && all_type_only(exp.named));
}

auto is_ignored_style_url(std::string_view url) -> bool {
    return url.empty() || starts_with(url, "data:") || starts_with(url, "http:") ||
           starts_with(url, "https:") || starts_with(url, "//") || starts_with(url, "#");
}

auto analyze_deps(const ast::ModuleAst& module) -> std::vector<Dependency> {
    std::vector<Dependency> deps;
    auto add = [&deps](const std::string& source, ResolveType type) {
        deps.push_back(Dependency{source, type, deps.size()});
    };

    if (module.is_style()) {
        for (const auto& stmt : module.style().body) {
            if (const auto* rule = std::get_if<ast::StyleImport>(&stmt)) {
                if (!is_ignored_style_url(rule->url))
                    add(rule->url, ResolveType::CssImport);
            } else if (const auto* url = std::get_if<ast::StyleUrl>(&stmt)) {
                if (!is_ignored_style_url(url->url))
                    add(url->url, ResolveType::CssUrl);
            }
        }
        return deps;
    }

    for (const auto& stmt : module.script().body) {
        std::visit(
            [&](const auto& s) {
                using T = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<T, ast::ImportDecl>) {
                    if (!is_type_only(s))
                        add(s.source, ResolveType::Import);
                } else if constexpr (std::is_same_v<T, ast::ExportFrom>) {
                    if (!is_type_only(s))
                        add(s.source, ResolveType::ExportFrom);
                } else if constexpr (std::is_same_v<T, ast::RequireCall>) {
                    add(s.source, ResolveType::Require);
                } else if constexpr (std::is_same_v<T, ast::DynamicImport>) {
                    add(s.source, ResolveType::DynamicImport);
                }
            },
            stmt);
    }
    return deps;
}

void add_helper_deps(const ast::ModuleAst& module, std::vector<Dependency>& deps) {
    if (module.is_style())
        return;

    std::set<std::string> known;
    for (const auto& dep : deps)
        known.insert(dep.source);

    for (const auto& stmt : module.script().body) {
        const auto* call = std::get_if<ast::RequireCall>(&stmt);
        if (!call || !starts_with(call->source, HELPERS_PREFIX))
            continue;
        if (known.insert(call->source).second)
            deps.push_back(Dependency{call->source, ResolveType::Helper, deps.size()});
    }
}

} // namespace loom::analyze
