//! # Build Errors
//!
//! Every failure the engine can report. Stages return `Result<T, BuildError>`
//! and the coordinator propagates the first error out of `run()`; there is no
//! partial-graph success.
//!
//! | Kind                     | Raised by                                   |
//! |--------------------------|---------------------------------------------|
//! | `EntryNotFound`          | entry discovery                             |
//! | `LoadError`              | loader / plugin chain (`NotFound`, `UnsupportedExtName`) |
//! | `ParseError`             | script and style parsers                    |
//! | `ResolveError`           | resolver                                    |
//! | `InternalChannelFailure` | coordinator (closed channel, lost node)     |
//! | `ConfigError`            | `loom.config.json` reader                   |

#ifndef LOOM_BUILD_ERROR_HPP
#define LOOM_BUILD_ERROR_HPP

#include <optional>
#include <string>
#include <vector>

namespace loom {

enum class BuildErrorKind {
    EntryNotFound,
    LoadError,
    ParseError,
    ResolveError,
    InternalChannelFailure,
    ConfigError,
};

/// Sub-kind for `BuildErrorKind::LoadError`.
enum class LoadErrorKind {
    NotFound,
    UnsupportedExtName,
};

[[nodiscard]] auto build_error_kind_name(BuildErrorKind kind) -> const char*;
[[nodiscard]] auto load_error_kind_name(LoadErrorKind kind) -> const char*;

struct BuildError {
    BuildErrorKind kind;
    std::string message;

    /// Module the error belongs to (empty for build-level errors).
    std::string path;

    /// Set only for `LoadError`.
    std::optional<LoadErrorKind> load_kind;

    /// Importer chain from an entry down to `path`, filled in by the
    /// coordinator when the error surfaces.
    std::vector<std::string> import_chain;

    [[nodiscard]] static auto entry_not_found(const std::string& root) -> BuildError;
    [[nodiscard]] static auto not_found(const std::string& path) -> BuildError;
    [[nodiscard]] static auto unsupported_ext(const std::string& ext, const std::string& path)
        -> BuildError;
    [[nodiscard]] static auto parse(const std::string& path, const std::string& message)
        -> BuildError;
    [[nodiscard]] static auto resolve(const std::string& importer, const std::string& specifier)
        -> BuildError;
    [[nodiscard]] static auto internal(const std::string& message, const std::string& path = {})
        -> BuildError;
    [[nodiscard]] static auto config(const std::string& path, const std::string& message)
        -> BuildError;

    [[nodiscard]] auto is_load_error(LoadErrorKind sub) const -> bool {
        return kind == BuildErrorKind::LoadError && load_kind == sub;
    }

    /// One-line description followed by the importer chain, e.g.
    ///
    /// ```text
    /// ResolveError: cannot resolve './missing' from /p/bar_1.ts
    ///   imported by: /p/index.ts -> /p/bar_1.ts
    /// ```
    [[nodiscard]] auto to_string() const -> std::string;
};

} // namespace loom

#endif // LOOM_BUILD_ERROR_HPP
