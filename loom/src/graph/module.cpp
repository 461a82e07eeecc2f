#include "graph/module.hpp"

namespace loom::graph {

auto resolve_type_name(ResolveType type) -> const char* {
    switch (type) {
    case ResolveType::Import:
        return "import";
    case ResolveType::ExportFrom:
        return "export-from";
    case ResolveType::Require:
        return "require";
    case ResolveType::DynamicImport:
        return "dynamic-import";
    case ResolveType::CssImport:
        return "css-import";
    case ResolveType::CssUrl:
        return "css-url";
    case ResolveType::Helper:
        return "helper";
    }
    return "unknown";
}

auto Module::external(const std::string& specifier, const std::string& global) -> Module {
    ModuleInfo module_info{ast::make_exports_module(ast::AstKind::Script, global), specifier,
                           global};
    return Module(ModuleId(specifier), false, std::move(module_info));
}

auto Module::add_info(ModuleInfo module_info) -> bool {
    if (info)
        return false;
    info = std::move(module_info);
    return true;
}

} // namespace loom::graph
