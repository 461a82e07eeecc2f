//! # Load Plugins
//!
//! A plugin gets a chance to load a module before the built-in loaders.
//! The chain is tried in order and the first plugin returning content wins:
//!
//! ```text
//! user plugins... -> JavaScriptPlugin -> CssPlugin -> JsonPlugin -> AssetsPlugin
//! ```
//!
//! Returning `std::nullopt` passes the module on to the next plugin; returning
//! an error stops the chain and fails the module.
//!
//! Plugins are shared by every concurrent pipeline execution, so `load` must
//! be safe to call from several threads at once.

#ifndef LOOM_PLUGIN_PLUGIN_HPP
#define LOOM_PLUGIN_PLUGIN_HPP

#include "build/error.hpp"
#include "common.hpp"
#include "load/content.hpp"

#include <optional>
#include <string>

namespace loom {
class Context;
}

namespace loom::plugin {

struct PluginLoadParam {
    /// Normalized absolute path of the module.
    std::string path;

    /// Extension without the dot, e.g. `"ts"`.
    std::string ext_name;
};

class Plugin {
public:
    virtual ~Plugin() = default;

    [[nodiscard]] virtual auto name() const -> const char* = 0;

    [[nodiscard]] virtual auto load(const PluginLoadParam& param, const Context& context)
        -> Result<std::optional<load::Content>, BuildError> = 0;
};

// ============================================================================
// Built-in Plugins
// ============================================================================

/// `js jsx ts tsx mjs cjs` files as script source.
class JavaScriptPlugin : public Plugin {
public:
    [[nodiscard]] auto name() const -> const char* override {
        return "javascript";
    }
    [[nodiscard]] auto load(const PluginLoadParam& param, const Context& context)
        -> Result<std::optional<load::Content>, BuildError> override;
};

/// `css` files as style source.
class CssPlugin : public Plugin {
public:
    [[nodiscard]] auto name() const -> const char* override {
        return "css";
    }
    [[nodiscard]] auto load(const PluginLoadParam& param, const Context& context)
        -> Result<std::optional<load::Content>, BuildError> override;
};

/// `json` files, validated and wrapped as `module.exports = <json>;`.
class JsonPlugin : public Plugin {
public:
    [[nodiscard]] auto name() const -> const char* override {
        return "json";
    }
    [[nodiscard]] auto load(const PluginLoadParam& param, const Context& context)
        -> Result<std::optional<load::Content>, BuildError> override;
};

/// Everything else as a static asset. Style preprocessor sources are refused
/// with `UnsupportedExtName`.
class AssetsPlugin : public Plugin {
public:
    [[nodiscard]] auto name() const -> const char* override {
        return "assets";
    }
    [[nodiscard]] auto load(const PluginLoadParam& param, const Context& context)
        -> Result<std::optional<load::Content>, BuildError> override;
};

/// Reads a whole file. `NotFound` if it cannot be opened.
[[nodiscard]] auto read_file(const std::string& path) -> Result<std::string, BuildError>;

} // namespace loom::plugin

#endif // LOOM_PLUGIN_PLUGIN_HPP
