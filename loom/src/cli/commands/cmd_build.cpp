#include "cmd_build.hpp"

#include "../utils.hpp"
#include "compiler/compiler.hpp"
#include "json/json.hpp"

#include <chrono>
#include <iostream>
#include <shared_mutex>

namespace loom::cli {

namespace {

/// Creates a compiler for `root` and builds it, reporting any error.
auto build_project(const std::string& root) -> Box<Compiler> {
    auto compiler = Compiler::create(root);
    if (is_err(compiler)) {
        report_error(unwrap_err(compiler));
        return nullptr;
    }

    auto stats = unwrap(compiler)->build();
    if (is_err(stats)) {
        report_error(unwrap_err(stats));
        return nullptr;
    }
    return std::move(unwrap(compiler));
}

auto graph_to_json(const Context& context) -> json::JsonValue {
    const auto& graph = context.module_graph;

    json::JsonArray nodes;
    for (const auto* module : graph.modules()) {
        json::JsonObject node;
        node["id"] = graph::relative_id(module->id, context.root);
        node["entry"] = module->is_entry;
        if (module->info) {
            node["kind"] = ast::ast_kind_name(module->info->ast.kind);
            if (module->info->external)
                node["external"] = *module->info->external;
        }
        nodes.emplace_back(std::move(node));
    }

    json::JsonArray edges;
    for (const auto& edge : graph.edges()) {
        json::JsonObject obj;
        obj["from"] = graph::relative_id(edge.from, context.root);
        obj["to"] = graph::relative_id(edge.to, context.root);
        obj["source"] = edge.dependency.source;
        obj["type"] = graph::resolve_type_name(edge.dependency.resolve_type);
        obj["order"] = static_cast<int64_t>(edge.dependency.order);
        edges.emplace_back(std::move(obj));
    }

    json::JsonObject root;
    root["nodes"] = std::move(nodes);
    root["edges"] = std::move(edges);
    return json::JsonValue(std::move(root));
}

} // namespace

int run_build(const std::string& root) {
    auto start = std::chrono::steady_clock::now();
    auto compiler = build_project(root);
    if (!compiler)
        return 1;

    const auto& context = compiler->context();
    std::shared_lock lock(context.graph_lock);
    const auto& graph = context.module_graph;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - start)
                       .count();

    std::cout << "Build summary:\n";
    std::cout << "  Root: " << context.root << "\n";
    std::cout << "  Entries: " << graph.entries().size() << "\n";
    std::cout << "  Modules: " << graph.module_count() << "\n";
    std::cout << "  Dependencies: " << graph.edge_count() << "\n";

    auto assets = context.assets.snapshot();
    if (!assets.empty())
        std::cout << "  Emitted assets: " << assets.size() << "\n";
    std::cout << "  Time: " << (static_cast<double>(elapsed) / 1000.0) << "s\n";
    return 0;
}

int run_graph(const std::string& root, bool as_json) {
    auto compiler = build_project(root);
    if (!compiler)
        return 1;

    const auto& context = compiler->context();
    std::shared_lock lock(context.graph_lock);

    if (as_json) {
        std::cout << graph_to_json(context).to_string(2) << "\n";
        return 0;
    }

    std::cout << context.module_graph.node_listing(context.root) << "\n";
    std::cout << context.module_graph.edge_listing(context.root) << "\n";
    return 0;
}

} // namespace loom::cli
