//! # Build Context
//!
//! State shared by one build. Pipeline executions on worker threads only
//! read it, with two exceptions:
//!
//! | Member          | Writers           | Guard          |
//! |-----------------|-------------------|----------------|
//! | `module_graph`  | coordinator only  | `graph_lock`   |
//! | `assets`        | asset loaders     | own mutex      |

#ifndef LOOM_COMPILER_CONTEXT_HPP
#define LOOM_COMPILER_CONTEXT_HPP

#include "common.hpp"
#include "config/config.hpp"
#include "graph/module_graph.hpp"
#include "plugin/plugin.hpp"

#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace loom {

/// Source path -> emitted file name for assets too large to inline.
class AssetManifest {
public:
    void insert(const std::string& source, const std::string& output_name);

    [[nodiscard]] auto get(const std::string& source) const -> std::optional<std::string>;

    [[nodiscard]] auto snapshot() const -> std::map<std::string, std::string>;

    void clear();

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> entries_;
};

class Context {
public:
    Context(config::Config config, const std::filesystem::path& root);

    Context(const Context&) = delete;
    auto operator=(const Context&) -> Context& = delete;

    config::Config config;

    /// Normalized absolute project root.
    std::string root;

    /// Load chain: user plugins followed by the built-ins.
    std::vector<Rc<plugin::Plugin>> plugins;

    graph::ModuleGraph module_graph;
    mutable std::shared_mutex graph_lock;

    /// Written by asset loaders through a `const Context&`.
    mutable AssetManifest assets;

    /// Registers a user plugin ahead of the built-in loaders.
    void add_plugin(Rc<plugin::Plugin> plugin);

private:
    size_t user_plugin_count_ = 0;
};

} // namespace loom

#endif // LOOM_COMPILER_CONTEXT_HPP
