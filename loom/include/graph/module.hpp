//! # Modules and Dependencies
//!
//! Node and edge payloads of the module graph.
//!
//! ## Node States
//!
//! ```text
//! Absent ──discover──> Placeholder ──integrate──> Complete
//!    └──────────── entry / external ──────────────────┘
//! ```
//!
//! A placeholder reserves its identifier the moment the module is first
//! discovered, so a second importer finds it present and never schedules a
//! second build. `info` is attached exactly once and never removed.

#ifndef LOOM_GRAPH_MODULE_HPP
#define LOOM_GRAPH_MODULE_HPP

#include "ast/ast.hpp"

#include <compare>
#include <cstddef>
#include <optional>
#include <string>

namespace loom::graph {

/// Normalized absolute path, or the bare specifier for externals.
struct ModuleId {
    std::string id;

    ModuleId() = default;
    explicit ModuleId(std::string value) : id(std::move(value)) {}

    auto operator<=>(const ModuleId&) const = default;
};

enum class ResolveType {
    Import,
    ExportFrom,
    Require,
    DynamicImport,
    CssImport,
    CssUrl,
    /// Injected by the transform (`@swc/helpers/...`).
    Helper,
};

[[nodiscard]] auto resolve_type_name(ResolveType type) -> const char*;

/// Edge payload: one import relationship as written in the importer.
struct Dependency {
    std::string source;
    ResolveType resolve_type = ResolveType::Import;

    /// Position among the importer's dependencies, in source order.
    size_t order = 0;

    auto operator==(const Dependency&) const -> bool = default;
};

struct ModuleInfo {
    ast::ModuleAst ast;
    std::string path;

    /// Runtime global name; set only for synthetic external modules.
    std::optional<std::string> external;
};

struct Module {
    ModuleId id;
    bool is_entry = false;
    std::optional<ModuleInfo> info;

    Module() = default;
    Module(ModuleId module_id, bool entry, std::optional<ModuleInfo> module_info = std::nullopt)
        : id(std::move(module_id)), is_entry(entry), info(std::move(module_info)) {}

    [[nodiscard]] static auto placeholder(ModuleId module_id) -> Module {
        return Module(std::move(module_id), false);
    }

    /// Synthetic module re-exporting a runtime global.
    [[nodiscard]] static auto external(const std::string& specifier, const std::string& global)
        -> Module;

    [[nodiscard]] auto is_placeholder() const -> bool {
        return !info.has_value();
    }
    [[nodiscard]] auto is_external() const -> bool {
        return info && info->external.has_value();
    }

    /// Attaches info to a placeholder. Returns false if info is already set.
    auto add_info(ModuleInfo module_info) -> bool;
};

} // namespace loom::graph

#endif // LOOM_GRAPH_MODULE_HPP
