#include "compiler/compiler.hpp"

#include "build/entries.hpp"
#include "build/pipeline.hpp"
#include "log/log.hpp"

#include <mutex>

namespace loom {

Compiler::Compiler(config::Config config, const std::filesystem::path& root)
    : context_(std::move(config), root),
      resolver_(resolve::Resolver::from_config(context_.config, context_.root)) {}

auto Compiler::create(const std::filesystem::path& root) -> Result<Box<Compiler>, BuildError> {
    auto config = config::load_config(root);
    if (is_err(config))
        return unwrap_err(config);
    return make_box<Compiler>(std::move(unwrap(config)), root);
}

auto Compiler::build() -> Result<build::BuildStats, BuildError> {
    auto entries = build::find_entries(context_.config, context_.root);
    if (is_err(entries))
        return unwrap_err(entries);

    {
        std::unique_lock lock(context_.graph_lock);
        context_.module_graph = graph::ModuleGraph{};
    }
    context_.assets.clear();

    build::Coordinator coordinator(
        context_,
        [this](const build::Task& task) { return build::build_module(context_, task, resolver_); },
        context_.config.threads);
    coordinator.seed(unwrap(entries));

    auto stats = coordinator.run();
    if (is_ok(stats)) {
        const auto& s = unwrap(stats);
        LOOM_LOG_INFO("build", "module count: " << s.module_count);
        LOOM_LOG_INFO("build", "build done in " << s.elapsed_ms << "ms (integration "
                                                << s.integration_ms << "ms)");
    }
    return stats;
}

} // namespace loom
