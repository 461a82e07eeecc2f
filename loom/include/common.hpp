//! # Common Definitions
//!
//! Types and helpers shared by every part of the loom module-graph engine.
//!
//! ## Overview
//!
//! - **Version Information**: engine version constants
//! - **Result Type**: error handling without exceptions
//! - **Smart Pointers**: aliases for unique and shared ownership
//! - **Path helpers**: normalized, forward-slash path strings used as identifiers
//!
//! ## Conventions
//!
//! - Stages return `Result<T, E>`; exceptions never escape a worker thread.
//! - `Box<T>` for unique ownership, `Rc<T>` for shared, read-only state
//!   (resolver, context) handed to concurrent pipeline executions.

#ifndef LOOM_COMMON_HPP
#define LOOM_COMMON_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace loom {

// ============================================================================
// Version Information
// ============================================================================

/// The engine version string.
constexpr const char* VERSION = "0.3.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<Content, BuildError> content = load(path, context);
/// if (is_err(content)) {
///     return unwrap_err(content);
/// }
/// auto& text = unwrap(content).text;
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

/// Success marker for operations that produce no value.
struct Unit {};

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

template <typename T> using Box = std::unique_ptr<T>;
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

// ============================================================================
// Path Helpers
// ============================================================================

/// Converts backslashes to forward slashes.
[[nodiscard]] inline auto to_forward_slashes(std::string path) -> std::string {
    for (auto& c : path) {
        if (c == '\\')
            c = '/';
    }
    return path;
}

/// Lexically normalized absolute path with forward slashes.
///
/// Module identifiers are built from this, so two spellings of the same file
/// (`a/./b.ts`, `a/c/../b.ts`) map to one node.
[[nodiscard]] inline auto normalize_path(const std::filesystem::path& path) -> std::string {
    std::filesystem::path abs = path.is_absolute() ? path : std::filesystem::absolute(path);
    return to_forward_slashes(abs.lexically_normal().string());
}

/// Returns the extension of `path` without the leading dot (`"ts"`, `"css"`),
/// or an empty string.
[[nodiscard]] inline auto extension_name(std::string_view path) -> std::string {
    auto slash = path.find_last_of("/\\");
    auto dot = path.find_last_of('.');
    if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash))
        return {};
    return std::string(path.substr(dot + 1));
}

} // namespace loom

#endif // LOOM_COMMON_HPP
