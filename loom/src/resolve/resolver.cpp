#include "resolve/resolver.hpp"

#include "json/json.hpp"
#include "log/log.hpp"

#include <fstream>
#include <mutex>
#include <sstream>

namespace fs = std::filesystem;

namespace loom::resolve {

namespace {

auto is_file(const fs::path& path) -> bool {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

auto is_dir(const fs::path& path) -> bool {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

auto is_path_specifier(const std::string& specifier) -> bool {
    return specifier.rfind("./", 0) == 0 || specifier.rfind("../", 0) == 0 ||
           specifier == "." || specifier == ".." || fs::path(specifier).is_absolute();
}

/// The first of `fields` that is a string in `dir/package.json`.
auto package_main(const fs::path& dir, const std::vector<std::string>& fields)
    -> std::optional<std::string> {
    std::ifstream file(dir / "package.json", std::ios::binary);
    if (!file)
        return std::nullopt;
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto parsed = json::parse_json(buffer.str());
    if (is_err(parsed)) {
        LOOM_LOG_WARN("resolve", "ignoring malformed " << (dir / "package.json").string() << ": "
                                                       << unwrap_err(parsed).to_string());
        return std::nullopt;
    }
    for (const auto& field : fields) {
        const auto* value = unwrap(parsed).get(field);
        if (value && value->is_string())
            return value->as_string();
    }
    return std::nullopt;
}

} // namespace

Resolver::Resolver(ResolverOptions options) : options_(std::move(options)) {}

auto Resolver::from_config(const config::Config& config, const std::string& root)
    -> ResolverOptions {
    ResolverOptions options;
    options.root = root;
    options.alias = config.alias;
    options.externals = config.externals;
    return options;
}

auto Resolver::resolve(const std::string& importer, const std::string& specifier) const
    -> Result<Resolution, BuildError> {
    auto external = options_.externals.find(specifier);
    if (external != options_.externals.end())
        return Resolution{specifier, external->second};

    auto dir = fs::path(importer).parent_path();
    auto key = std::make_pair(to_forward_slashes(dir.string()), specifier);

    {
        std::shared_lock lock(cache_mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            if (!it->second)
                return BuildError::resolve(importer, specifier);
            return Resolution{*it->second, std::nullopt};
        }
    }

    auto resolved = resolve_path(dir, specifier);
    {
        std::unique_lock lock(cache_mutex_);
        cache_.emplace(key, resolved);
    }

    if (!resolved) {
        LOOM_LOG_DEBUG("resolve", "cannot resolve '" << specifier << "' from " << importer);
        return BuildError::resolve(importer, specifier);
    }
    LOOM_LOG_TRACE("resolve", specifier << " -> " << *resolved);
    return Resolution{std::move(*resolved), std::nullopt};
}

auto Resolver::cache_size() const -> size_t {
    std::shared_lock lock(cache_mutex_);
    return cache_.size();
}

auto Resolver::apply_alias(const std::string& specifier) const -> std::string {
    const std::string* best_key = nullptr;
    const std::string* best_target = nullptr;

    for (const auto& [key, target] : options_.alias) {
        bool matches = specifier == key || specifier.rfind(key + "/", 0) == 0;
        if (matches && (!best_key || key.size() > best_key->size())) {
            best_key = &key;
            best_target = &target;
        }
    }
    if (!best_key)
        return specifier;

    std::string target = *best_target;
    if (target.rfind("./", 0) == 0 || target.rfind("../", 0) == 0 || target == ".")
        target = to_forward_slashes((fs::path(options_.root) / target).string());
    return target + specifier.substr(best_key->size());
}

auto Resolver::resolve_path(const fs::path& dir, const std::string& specifier) const
    -> std::optional<std::string> {
    std::string request = apply_alias(specifier);

    if (is_path_specifier(request)) {
        fs::path base = fs::path(request).is_absolute() ? fs::path(request) : dir / request;
        if (auto file = try_file(base))
            return file;
        return try_directory(base);
    }
    return try_node_modules(dir, request);
}

auto Resolver::try_file(const fs::path& path) const -> std::optional<std::string> {
    if (is_file(path))
        return normalize_path(path);
    for (const auto& ext : options_.extensions) {
        fs::path candidate = path;
        candidate += ext;
        if (is_file(candidate))
            return normalize_path(candidate);
    }
    return std::nullopt;
}

auto Resolver::try_directory(const fs::path& dir) const -> std::optional<std::string> {
    if (!is_dir(dir))
        return std::nullopt;

    if (auto main = package_main(dir, options_.main_fields)) {
        fs::path target = dir / *main;
        if (auto file = try_file(target))
            return file;
        if (is_dir(target)) {
            if (auto index = try_file(target / "index"))
                return index;
        }
    }
    return try_file(dir / "index");
}

auto Resolver::try_node_modules(const fs::path& start, const std::string& specifier) const
    -> std::optional<std::string> {
    fs::path dir = start;
    while (true) {
        fs::path candidate = dir / "node_modules" / specifier;
        if (auto file = try_file(candidate))
            return file;
        if (auto index = try_directory(candidate))
            return index;

        auto parent = dir.parent_path();
        if (parent.empty() || parent == dir)
            return std::nullopt;
        dir = parent;
    }
}

} // namespace loom::resolve
