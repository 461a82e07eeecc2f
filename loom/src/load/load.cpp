#include "load/load.hpp"

#include "compiler/context.hpp"
#include "log/log.hpp"

#include <filesystem>

namespace loom::load {

auto load(const std::string& path, const Context& context) -> Result<Content, BuildError> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        return BuildError::not_found(path);

    plugin::PluginLoadParam param{path, extension_name(path)};

    for (const auto& plugin : context.plugins) {
        auto result = plugin->load(param, context);
        if (is_err(result))
            return unwrap_err(result);

        auto& content = unwrap(result);
        if (content) {
            LOOM_LOG_TRACE("load", path << " loaded by " << plugin->name());
            return std::move(*content);
        }
    }

    return BuildError::unsupported_ext(param.ext_name, path);
}

} // namespace loom::load
