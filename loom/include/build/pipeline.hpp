//! # Module Build Pipeline
//!
//! Builds one module, start to finish, without touching the module graph:
//!
//! ```text
//! load -> parse -> analyze deps -> transform -> add helper deps -> resolve
//! ```
//!
//! The pipeline is stateless and safe to run concurrently for different
//! tasks; its only shared inputs are the read-only `Context` and `Resolver`.

#ifndef LOOM_BUILD_PIPELINE_HPP
#define LOOM_BUILD_PIPELINE_HPP

#include "build/error.hpp"
#include "build/task.hpp"
#include "common.hpp"
#include "graph/module.hpp"
#include "resolve/resolver.hpp"

#include <string>
#include <vector>

namespace loom {
class Context;
}

namespace loom::build {

struct ResolvedDependency {
    resolve::Resolution resolution;
    graph::Dependency dependency;
};

struct BuildResult {
    /// Complete module for `task.path`.
    graph::Module module;
    std::vector<ResolvedDependency> dependencies;
    Task task;
};

[[nodiscard]] auto build_module(const Context& context, const Task& task,
                                const resolve::Resolver& resolver)
    -> Result<BuildResult, BuildError>;

/// Specifier handed to the resolver for a dependency. Style references are
/// relative unless written as paths or `~package`; query and fragment
/// suffixes on `url()` are dropped.
[[nodiscard]] auto resolve_request(const graph::Dependency& dependency) -> std::string;

} // namespace loom::build

#endif // LOOM_BUILD_PIPELINE_HPP
