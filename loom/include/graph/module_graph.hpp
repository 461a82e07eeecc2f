//! # Module Graph
//!
//! Directed graph of modules keyed by `ModuleId`. Parallel edges between the
//! same pair are kept: each records one import as written.
//!
//! The graph itself is not synchronized. During a build it lives in the
//! `Context` behind `Context::graph_lock`, and only the coordinator mutates it.

#ifndef LOOM_GRAPH_MODULE_GRAPH_HPP
#define LOOM_GRAPH_MODULE_GRAPH_HPP

#include "build/error.hpp"
#include "common.hpp"
#include "graph/module.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace loom::graph {

struct Edge {
    ModuleId from;
    ModuleId to;
    Dependency dependency;
};

class ModuleGraph {
public:
    /// Inserts a node. Returns false, leaving the graph unchanged, if a node
    /// with the same id exists.
    auto add_module(Module module) -> bool;

    [[nodiscard]] auto has_module(const ModuleId& id) const -> bool;
    [[nodiscard]] auto get_module(const ModuleId& id) const -> const Module*;
    [[nodiscard]] auto get_module_mut(const ModuleId& id) -> Module*;

    /// Adds an edge. Both endpoints must already be nodes.
    auto add_dependency(const ModuleId& from, const ModuleId& to, Dependency dependency)
        -> Result<Unit, BuildError>;

    [[nodiscard]] auto module_count() const -> size_t {
        return modules_.size();
    }
    [[nodiscard]] auto edge_count() const -> size_t {
        return edges_.size();
    }
    [[nodiscard]] auto placeholder_count() const -> size_t;

    /// All nodes ordered by id.
    [[nodiscard]] auto modules() const -> std::vector<const Module*>;

    [[nodiscard]] auto entries() const -> std::vector<const Module*>;

    /// All edges in insertion order.
    [[nodiscard]] auto edges() const -> const std::vector<Edge>& {
        return edges_;
    }

    /// Outgoing edges of `id` as (target, dependency), ordered by dependency order.
    [[nodiscard]] auto dependencies(const ModuleId& id) const
        -> std::vector<std::pair<const Module*, const Dependency*>>;

    /// Incoming edges of `id` as (importer, dependency).
    [[nodiscard]] auto dependents(const ModuleId& id) const
        -> std::vector<std::pair<const Module*, const Dependency*>>;

    /// Sorted, comma-separated node ids with `root/` stripped:
    /// `"bar_1.ts,bar_2.ts,foo.ts,index.ts"`.
    [[nodiscard]] auto node_listing(const std::string& root) const -> std::string;

    /// Sorted, comma-separated `from -> to` pairs with `root/` stripped, one per
    /// edge; parallel edges repeat.
    [[nodiscard]] auto edge_listing(const std::string& root) const -> std::string;

private:
    std::map<ModuleId, Module> modules_;
    std::vector<Edge> edges_;
    std::map<ModuleId, std::vector<size_t>> outgoing_;
    std::map<ModuleId, std::vector<size_t>> incoming_;
};

/// `id` relative to `root` when it lies below it, otherwise unchanged.
[[nodiscard]] auto relative_id(const ModuleId& id, const std::string& root) -> std::string;

} // namespace loom::graph

#endif // LOOM_GRAPH_MODULE_GRAPH_HPP
