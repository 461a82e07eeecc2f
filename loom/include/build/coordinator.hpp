//! # Build Coordinator
//!
//! Drives pipeline executions on a worker pool and is the only writer of
//! the module graph.
//!
//! ## Event Loop
//!
//! ```text
//! seed(entries)
//! loop:
//!     submit every queued task to the pool          (in_flight += n)
//!     if in_flight == 0: done
//!     block on the completion channel               (in_flight -= 1)
//!         result  -> integrate into the graph, queue new tasks
//!         error   -> cancel the pool, return the error
//!         closed  -> InternalChannelFailure
//! ```
//!
//! ## De-duplication
//!
//! A dependency target that is not yet a node gets a placeholder and a task
//! in the same integration step. Integration runs on the coordinator thread
//! only, so no second importer can observe the target as absent and the
//! module is built exactly once.

#ifndef LOOM_BUILD_COORDINATOR_HPP
#define LOOM_BUILD_COORDINATOR_HPP

#include "build/error.hpp"
#include "build/pipeline.hpp"
#include "build/task.hpp"
#include "common.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace loom {
class Context;
}

namespace loom::build {

/// Runs the pipeline for one task. Called on worker threads.
using BuildFn = std::function<Result<BuildResult, BuildError>(const Task&)>;

/// Summary of a finished build.
struct BuildStats {
    size_t module_count = 0;
    size_t edge_count = 0;

    /// Pipeline executions completed.
    size_t modules_built = 0;

    int64_t elapsed_ms = 0;

    /// Time the coordinator spent integrating results into the graph.
    double integration_ms = 0.0;
};

class Coordinator {
public:
    /// `threads == 0` uses the hardware concurrency.
    Coordinator(Context& context, BuildFn build_fn, unsigned threads = 0);

    /// Queues one entry task per path. Duplicate paths are queued once.
    void seed(const std::vector<std::string>& entries);

    /// Builds until no task is queued or running. Returns the first error.
    [[nodiscard]] auto run() -> Result<BuildStats, BuildError>;

    /// Entry-to-module chain of first importers ending at `path`.
    [[nodiscard]] auto import_chain(const std::string& path) const -> std::vector<std::string>;

private:
    Context& context_;
    BuildFn build_fn_;
    unsigned threads_;

    std::deque<Task> queue_;
    std::set<std::string> entry_paths_;

    /// Module -> the importer that discovered it.
    std::map<std::string, std::string> first_importer_;

    auto integrate(BuildResult result) -> Result<Unit, BuildError>;
};

} // namespace loom::build

#endif // LOOM_BUILD_COORDINATOR_HPP
