#include "build/pipeline.hpp"

#include "analyze/analyze_deps.hpp"
#include "compiler/context.hpp"
#include "load/load.hpp"
#include "log/log.hpp"
#include "parse/parse.hpp"
#include "transform/transform.hpp"

namespace loom::build {

auto resolve_request(const graph::Dependency& dependency) -> std::string {
    if (dependency.resolve_type != graph::ResolveType::CssImport &&
        dependency.resolve_type != graph::ResolveType::CssUrl)
        return dependency.source;

    std::string request = dependency.source;
    if (dependency.resolve_type == graph::ResolveType::CssUrl) {
        auto cut = request.find_first_of("?#");
        if (cut != std::string::npos)
            request.resize(cut);
    }

    if (!request.empty() && request[0] == '~')
        return request.substr(1);
    if (request.rfind("./", 0) == 0 || request.rfind("../", 0) == 0 || request.rfind('/', 0) == 0)
        return request;
    return "./" + request;
}

auto build_module(const Context& context, const Task& task, const resolve::Resolver& resolver)
    -> Result<BuildResult, BuildError> {
    LOOM_LOG_DEBUG("pipeline", "building " << task.path);

    auto content = load::load(task.path, context);
    if (is_err(content))
        return unwrap_err(content);

    auto tree = parse::parse(task.path, unwrap(content));
    if (is_err(tree))
        return unwrap_err(tree);
    auto& ast = unwrap(tree);

    auto deps = analyze::analyze_deps(ast);
    transform::transform(ast);
    analyze::add_helper_deps(ast, deps);

    std::vector<ResolvedDependency> resolved;
    resolved.reserve(deps.size());
    for (auto& dep : deps) {
        auto resolution = resolver.resolve(task.path, resolve_request(dep));
        if (is_err(resolution)) {
            auto err = std::move(unwrap_err(resolution));
            // Report the specifier as written
            err.message = "cannot resolve '" + dep.source + "' from " + task.path;
            return err;
        }
        resolved.push_back(ResolvedDependency{std::move(unwrap(resolution)), std::move(dep)});
    }

    graph::ModuleInfo info{std::move(ast), task.path, std::nullopt};
    graph::Module module(graph::ModuleId(task.path), task.is_entry, std::move(info));

    LOOM_LOG_TRACE("pipeline", task.path << ": " << resolved.size() << " dependencies");
    return BuildResult{std::move(module), std::move(resolved), task};
}

} // namespace loom::build
