#include "compiler/context.hpp"

namespace loom {

void AssetManifest::insert(const std::string& source, const std::string& output_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[source] = output_name;
}

auto AssetManifest::get(const std::string& source) const -> std::optional<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(source);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

auto AssetManifest::snapshot() const -> std::map<std::string, std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

void AssetManifest::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

Context::Context(config::Config cfg, const std::filesystem::path& project_root)
    : config(std::move(cfg)), root(normalize_path(project_root)) {
    if (root.size() > 1 && root.back() == '/')
        root.pop_back();
    plugins.push_back(make_rc<plugin::JavaScriptPlugin>());
    plugins.push_back(make_rc<plugin::CssPlugin>());
    plugins.push_back(make_rc<plugin::JsonPlugin>());
    plugins.push_back(make_rc<plugin::AssetsPlugin>());
}

void Context::add_plugin(Rc<plugin::Plugin> plugin) {
    plugins.insert(plugins.begin() + static_cast<std::ptrdiff_t>(user_plugin_count_),
                   std::move(plugin));
    ++user_plugin_count_;
}

} // namespace loom
