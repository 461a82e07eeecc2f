//! # Compiler
//!
//! Entry point for one project: owns the build context and resolver, and
//! runs the coordinator over the project's entries.
//!
//! ```cpp
//! auto compiler = Compiler::create("/path/to/project");
//! if (is_err(compiler))
//!     return report(unwrap_err(compiler));
//! auto stats = unwrap(compiler)->build();
//! const auto& graph = unwrap(compiler)->context().module_graph;
//! ```

#ifndef LOOM_COMPILER_COMPILER_HPP
#define LOOM_COMPILER_COMPILER_HPP

#include "build/coordinator.hpp"
#include "common.hpp"
#include "compiler/context.hpp"
#include "config/config.hpp"
#include "resolve/resolver.hpp"

#include <filesystem>

namespace loom {

class Compiler {
public:
    Compiler(config::Config config, const std::filesystem::path& root);

    /// Reads `loom.config.json` under `root` and constructs a compiler.
    [[nodiscard]] static auto create(const std::filesystem::path& root)
        -> Result<Box<Compiler>, BuildError>;

    /// Builds the module graph from scratch into `context().module_graph`.
    [[nodiscard]] auto build() -> Result<build::BuildStats, BuildError>;

    [[nodiscard]] auto context() -> Context& {
        return context_;
    }
    [[nodiscard]] auto context() const -> const Context& {
        return context_;
    }
    [[nodiscard]] auto resolver() const -> const resolve::Resolver& {
        return resolver_;
    }

private:
    Context context_;
    resolve::Resolver resolver_;
};

} // namespace loom

#endif // LOOM_COMPILER_COMPILER_HPP
