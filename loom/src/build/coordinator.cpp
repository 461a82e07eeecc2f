//! # Build Coordinator
//!
//! ## Thread Safety
//!
//! | State                  | Owner                                   |
//! |------------------------|-----------------------------------------|
//! | task queue, counters   | coordinator thread (plain members)      |
//! | module graph           | coordinator writes under `graph_lock`   |
//! | completion channel     | workers send, coordinator receives      |
//!
//! Workers never see the graph or the queue. Every submitted job sends
//! exactly one message, error or result, so the blocking receive always
//! wakes up.

#include "build/coordinator.hpp"

#include "build/channel.hpp"
#include "build/worker_pool.hpp"
#include "compiler/context.hpp"
#include "log/log.hpp"

#include <exception>
#include <mutex>
#include <optional>

namespace loom::build {

namespace {

struct BuildMessage {
    Task task;
    Result<BuildResult, BuildError> result;
};

} // namespace

Coordinator::Coordinator(Context& context, BuildFn build_fn, unsigned threads)
    : context_(context), build_fn_(std::move(build_fn)), threads_(threads) {}

void Coordinator::seed(const std::vector<std::string>& entries) {
    for (const auto& entry : entries) {
        // Same spelling as the ids the resolver produces
        auto path = normalize_path(entry);
        if (entry_paths_.insert(path).second)
            queue_.push_back(Task{std::move(path), true});
    }
}

auto Coordinator::import_chain(const std::string& path) const -> std::vector<std::string> {
    std::vector<std::string> chain{path};
    std::set<std::string> seen{path};

    auto it = first_importer_.find(path);
    while (it != first_importer_.end() && seen.insert(it->second).second) {
        chain.push_back(it->second);
        it = first_importer_.find(it->second);
    }
    return std::vector<std::string>(chain.rbegin(), chain.rend());
}

auto Coordinator::run() -> Result<BuildStats, BuildError> {
    auto start = std::chrono::steady_clock::now();
    BuildStats stats;

    if (queue_.empty())
        return BuildError::entry_not_found(context_.root);

    // Declared before the pool: the pool joins its workers first, and their
    // final sends must find the channel alive.
    Channel<BuildMessage> channel;
    WorkerPool pool(threads_);

    size_t in_flight = 0;

    auto fail = [&](BuildError err, const Task& task) -> BuildError {
        pool.cancel();
        channel.close();
        if (err.path.empty())
            err.path = task.path;
        err.import_chain = import_chain(task.path);
        LOOM_LOG_ERROR("build", err.to_string());
        return err;
    };

    while (true) {
        {
            std::unique_lock lock(context_.graph_lock);
            while (!queue_.empty()) {
                Task task = std::move(queue_.front());
                queue_.pop_front();
                ++in_flight;

                pool.submit([this, &channel, task] {
                    std::optional<Result<BuildResult, BuildError>> result;
                    try {
                        result.emplace(build_fn_(task));
                    } catch (const std::exception& e) {
                        result.emplace(BuildError::internal(
                            std::string("pipeline failed with exception: ") + e.what(), task.path));
                    } catch (...) {
                        result.emplace(BuildError::internal(
                            "pipeline failed with unknown exception", task.path));
                    }
                    channel.send(BuildMessage{task, std::move(*result)});
                });
            }
        }

        if (in_flight == 0)
            break;

        auto message = channel.recv();
        if (!message) {
            pool.cancel();
            return BuildError::internal("completion channel closed with " +
                                        std::to_string(in_flight) + " tasks in flight");
        }
        --in_flight;
        ++stats.modules_built;

        if (is_err(message->result))
            return fail(std::move(unwrap_err(message->result)), message->task);

        auto integrate_start = std::chrono::steady_clock::now();
        auto integrated = integrate(std::move(unwrap(message->result)));
        stats.integration_ms += std::chrono::duration<double, std::milli>(
                                    std::chrono::steady_clock::now() - integrate_start)
                                    .count();
        if (is_err(integrated))
            return fail(std::move(unwrap_err(integrated)), message->task);
    }

    {
        std::shared_lock lock(context_.graph_lock);
        stats.module_count = context_.module_graph.module_count();
        stats.edge_count = context_.module_graph.edge_count();

        if (auto placeholders = context_.module_graph.placeholder_count(); placeholders != 0)
            return BuildError::internal(std::to_string(placeholders) +
                                        " modules were discovered but never built");
    }

    stats.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - start)
                           .count();
    return stats;
}

auto Coordinator::integrate(BuildResult result) -> Result<Unit, BuildError> {
    std::unique_lock lock(context_.graph_lock);
    auto& graph = context_.module_graph;
    const graph::ModuleId id = result.module.id;

    if (!result.module.info)
        return BuildError::internal("pipeline returned no module info for " + id.id, id.id);

    auto* existing = graph.get_module_mut(id);
    if (result.task.is_entry && !existing) {
        graph.add_module(std::move(result.module));
    } else {
        // Placeholder from discovery; an entry can also be discovered by
        // another module before its own build finishes.
        if (!existing)
            return BuildError::internal("no placeholder for built module " + id.id, id.id);
        if (!existing->add_info(std::move(*result.module.info)))
            return BuildError::internal("module built twice: " + id.id, id.id);
        existing->is_entry = existing->is_entry || result.task.is_entry;
    }

    for (auto& dep : result.dependencies) {
        graph::ModuleId target(dep.resolution.path);

        if (!graph.has_module(target)) {
            if (dep.resolution.is_external()) {
                graph.add_module(
                    graph::Module::external(dep.resolution.path, *dep.resolution.external));
                LOOM_LOG_DEBUG("build", "external " << target.id << " = "
                                                    << *dep.resolution.external);
            } else {
                graph.add_module(graph::Module::placeholder(target));
                // Entries are already queued by seed()
                if (entry_paths_.count(target.id) == 0) {
                    first_importer_.emplace(target.id, id.id);
                    queue_.push_back(Task{target.id, false});
                }
            }
        }

        auto added = graph.add_dependency(id, target, std::move(dep.dependency));
        if (is_err(added))
            return unwrap_err(added);
    }
    return Unit{};
}

} // namespace loom::build
