#include "config/config.hpp"

#include "json/json.hpp"
#include "log/log.hpp"

#include <fstream>
#include <sstream>

namespace loom::config {

namespace {

using json::JsonValue;

auto read_string_map(const JsonValue& value, const std::string& key, const std::string& origin,
                     std::map<std::string, std::string>& out) -> std::optional<BuildError> {
    if (!value.is_object())
        return BuildError::config(origin, "'" + key + "' must be an object");

    for (const auto& [name, target] : value.as_object()) {
        if (!target.is_string())
            return BuildError::config(origin, "'" + key + "." + name + "' must be a string");
        out[name] = target.as_string();
    }
    return std::nullopt;
}

auto read_unsigned(const JsonValue& value, const std::string& key, const std::string& origin,
                   int64_t& out) -> std::optional<BuildError> {
    if (!value.is_integer() || value.as_i64() < 0)
        return BuildError::config(origin, "'" + key + "' must be a non-negative integer");
    out = value.as_i64();
    return std::nullopt;
}

} // namespace

auto parse_config(std::string_view text, const std::string& origin) -> Result<Config, BuildError> {
    auto parsed = json::parse_json(text);
    if (is_err(parsed))
        return BuildError::config(origin, unwrap_err(parsed).to_string());

    const auto& root = unwrap(parsed);
    if (!root.is_object())
        return BuildError::config(origin, "top level must be an object");

    Config config;

    if (const auto* entry = root.get("entry")) {
        if (auto err = read_string_map(*entry, "entry", origin, config.entry))
            return *err;
    }

    if (const auto* resolve = root.get("resolve")) {
        if (!resolve->is_object())
            return BuildError::config(origin, "'resolve' must be an object");
        if (const auto* alias = resolve->get("alias")) {
            if (auto err = read_string_map(*alias, "resolve.alias", origin, config.alias))
                return *err;
        }
    }

    if (const auto* externals = root.get("externals")) {
        if (auto err = read_string_map(*externals, "externals", origin, config.externals))
            return *err;
    }

    if (const auto* assets = root.get("assets")) {
        if (!assets->is_object())
            return BuildError::config(origin, "'assets' must be an object");
        if (const auto* limit = assets->get("inlineLimit")) {
            int64_t value = 0;
            if (auto err = read_unsigned(*limit, "assets.inlineLimit", origin, value))
                return *err;
            config.inline_limit = static_cast<size_t>(value);
        }
    }

    if (const auto* build = root.get("build")) {
        if (!build->is_object())
            return BuildError::config(origin, "'build' must be an object");
        if (const auto* threads = build->get("threads")) {
            int64_t value = 0;
            if (auto err = read_unsigned(*threads, "build.threads", origin, value))
                return *err;
            if (value > MAX_THREADS)
                return BuildError::config(origin, "'build.threads' must be at most " +
                                                      std::to_string(MAX_THREADS));
            config.threads = static_cast<unsigned>(value);
        }
    }

    return config;
}

auto load_config(const std::filesystem::path& root) -> Result<Config, BuildError> {
    auto path = root / CONFIG_FILE_NAME;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOOM_LOG_DEBUG("config", "no " << CONFIG_FILE_NAME << " in " << root.string()
                                       << ", using defaults");
        return Config{};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file)
        return BuildError::config(normalize_path(path), "cannot open file");

    std::stringstream buffer;
    buffer << file.rdbuf();

    LOOM_LOG_DEBUG("config", "loading " << path.string());
    return parse_config(buffer.str(), normalize_path(path));
}

} // namespace loom::config
