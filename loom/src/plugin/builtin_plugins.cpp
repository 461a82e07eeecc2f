//! # Built-in Load Plugins

#include "compiler/context.hpp"
#include "json/json.hpp"
#include "load/assets.hpp"
#include "log/log.hpp"
#include "plugin/plugin.hpp"

#include <array>
#include <fstream>
#include <sstream>

namespace loom::plugin {

namespace {

constexpr std::array<std::string_view, 6> SCRIPT_EXTENSIONS = {"js",  "jsx", "ts",
                                                              "tsx", "mjs", "cjs"};

/// Style preprocessors the engine cannot compile.
constexpr std::array<std::string_view, 4> UNSUPPORTED_STYLE_EXTENSIONS = {"sass", "scss",
                                                                          "stylus", "less"};

template <size_t N>
auto contains(const std::array<std::string_view, N>& list, std::string_view value) -> bool {
    for (auto item : list) {
        if (item == value)
            return true;
    }
    return false;
}

} // namespace

auto read_file(const std::string& path) -> Result<std::string, BuildError> {
    std::ifstream file(path, std::ios::binary);
    if (!file)
        return BuildError::not_found(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

auto JavaScriptPlugin::load(const PluginLoadParam& param, const Context&)
    -> Result<std::optional<load::Content>, BuildError> {
    if (!contains(SCRIPT_EXTENSIONS, param.ext_name))
        return std::optional<load::Content>{};

    auto text = read_file(param.path);
    if (is_err(text))
        return unwrap_err(text);
    return std::optional<load::Content>(load::Content{load::ContentKind::Js, std::move(unwrap(text))});
}

auto CssPlugin::load(const PluginLoadParam& param, const Context&)
    -> Result<std::optional<load::Content>, BuildError> {
    if (param.ext_name != "css")
        return std::optional<load::Content>{};

    auto text = read_file(param.path);
    if (is_err(text))
        return unwrap_err(text);
    return std::optional<load::Content>(load::Content{load::ContentKind::Css, std::move(unwrap(text))});
}

auto JsonPlugin::load(const PluginLoadParam& param, const Context&)
    -> Result<std::optional<load::Content>, BuildError> {
    if (param.ext_name != "json")
        return std::optional<load::Content>{};

    auto text = read_file(param.path);
    if (is_err(text))
        return unwrap_err(text);

    auto parsed = json::parse_json(unwrap(text));
    if (is_err(parsed)) {
        const auto& err = unwrap_err(parsed);
        return BuildError::parse(param.path, std::to_string(err.line) + ":" +
                                                 std::to_string(err.column) + ": " + err.message);
    }
    return std::optional<load::Content>(
        load::Content{load::ContentKind::Js, "module.exports = " + unwrap(parsed).to_string() + ";"});
}

auto AssetsPlugin::load(const PluginLoadParam& param, const Context& context)
    -> Result<std::optional<load::Content>, BuildError> {
    if (contains(UNSUPPORTED_STYLE_EXTENSIONS, param.ext_name))
        return BuildError::unsupported_ext(param.ext_name, param.path);

    auto value = load::handle_asset(context, param.path);
    if (is_err(value))
        return unwrap_err(value);

    LOOM_LOG_TRACE("load", "asset " << param.path << " -> " << unwrap(value).substr(0, 48));
    return std::optional<load::Content>(load::Content{load::ContentKind::Asset, std::move(unwrap(value))});
}

} // namespace loom::plugin
