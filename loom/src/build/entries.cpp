#include "build/entries.hpp"

#include "log/log.hpp"

#include <filesystem>

namespace loom::build {

auto find_entries(const config::Config& config, const std::string& root)
    -> Result<std::vector<std::string>, BuildError> {
    std::filesystem::path base(root);
    std::vector<std::string> entries;

    if (!config.entry.empty()) {
        for (const auto& [name, path] : config.entry) {
            auto entry = normalize_path(base / path);
            LOOM_LOG_DEBUG("build", "entry '" << name << "': " << entry);
            entries.push_back(std::move(entry));
        }
        return entries;
    }

    for (const char* candidate : DEFAULT_ENTRIES) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(base / candidate, ec)) {
            entries.push_back(normalize_path(base / candidate));
            LOOM_LOG_DEBUG("build", "using default entry " << entries.back());
            return entries;
        }
    }
    return BuildError::entry_not_found(root);
}

} // namespace loom::build
