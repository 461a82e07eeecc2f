#include "graph/module_graph.hpp"

#include <algorithm>
#include <set>

namespace loom::graph {

auto ModuleGraph::add_module(Module module) -> bool {
    auto id = module.id;
    return modules_.emplace(std::move(id), std::move(module)).second;
}

auto ModuleGraph::has_module(const ModuleId& id) const -> bool {
    return modules_.find(id) != modules_.end();
}

auto ModuleGraph::get_module(const ModuleId& id) const -> const Module* {
    auto it = modules_.find(id);
    return it == modules_.end() ? nullptr : &it->second;
}

auto ModuleGraph::get_module_mut(const ModuleId& id) -> Module* {
    auto it = modules_.find(id);
    return it == modules_.end() ? nullptr : &it->second;
}

auto ModuleGraph::add_dependency(const ModuleId& from, const ModuleId& to, Dependency dependency)
    -> Result<Unit, BuildError> {
    if (!has_module(from))
        return BuildError::internal("edge source is not in the graph: " + from.id, from.id);
    if (!has_module(to))
        return BuildError::internal("edge target is not in the graph: " + to.id, from.id);

    size_t index = edges_.size();
    edges_.push_back(Edge{from, to, std::move(dependency)});
    outgoing_[from].push_back(index);
    incoming_[to].push_back(index);
    return Unit{};
}

auto ModuleGraph::placeholder_count() const -> size_t {
    return static_cast<size_t>(std::count_if(modules_.begin(), modules_.end(), [](const auto& kv) {
        return kv.second.is_placeholder();
    }));
}

auto ModuleGraph::modules() const -> std::vector<const Module*> {
    std::vector<const Module*> result;
    result.reserve(modules_.size());
    for (const auto& [id, module] : modules_)
        result.push_back(&module);
    return result;
}

auto ModuleGraph::entries() const -> std::vector<const Module*> {
    std::vector<const Module*> result;
    for (const auto& [id, module] : modules_) {
        if (module.is_entry)
            result.push_back(&module);
    }
    return result;
}

auto ModuleGraph::dependencies(const ModuleId& id) const
    -> std::vector<std::pair<const Module*, const Dependency*>> {
    std::vector<std::pair<const Module*, const Dependency*>> result;
    auto it = outgoing_.find(id);
    if (it == outgoing_.end())
        return result;

    for (size_t index : it->second) {
        const auto& edge = edges_[index];
        result.emplace_back(get_module(edge.to), &edge.dependency);
    }
    std::stable_sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a.second->order < b.second->order;
    });
    return result;
}

auto ModuleGraph::dependents(const ModuleId& id) const
    -> std::vector<std::pair<const Module*, const Dependency*>> {
    std::vector<std::pair<const Module*, const Dependency*>> result;
    auto it = incoming_.find(id);
    if (it == incoming_.end())
        return result;

    for (size_t index : it->second) {
        const auto& edge = edges_[index];
        result.emplace_back(get_module(edge.from), &edge.dependency);
    }
    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a.first->id < b.first->id;
    });
    return result;
}

auto relative_id(const ModuleId& id, const std::string& root) -> std::string {
    std::string prefix = root;
    if (!prefix.empty() && prefix.back() != '/')
        prefix += '/';
    if (!prefix.empty() && id.id.rfind(prefix, 0) == 0)
        return id.id.substr(prefix.size());
    return id.id;
}

namespace {

template <typename Items> auto join(const Items& items) -> std::string {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty())
            out += ',';
        out += item;
    }
    return out;
}

} // namespace

auto ModuleGraph::node_listing(const std::string& root) const -> std::string {
    std::set<std::string> names;
    for (const auto& [id, module] : modules_)
        names.insert(relative_id(id, root));
    return join(names);
}

auto ModuleGraph::edge_listing(const std::string& root) const -> std::string {
    std::vector<std::string> pairs;
    pairs.reserve(edges_.size());
    for (const auto& edge : edges_)
        pairs.push_back(relative_id(edge.from, root) + " -> " + relative_id(edge.to, root));
    std::sort(pairs.begin(), pairs.end());
    return join(pairs);
}

} // namespace loom::graph
