//! # Module Resolver
//!
//! Maps `(importer, specifier)` to a module: either a normalized absolute
//! path or an external runtime global.
//!
//! ## Resolution Order
//!
//! 1. **Externals**: exact specifier match in the externals map
//! 2. **Alias**: longest key equal to the specifier or a `key/` prefix of it
//! 3. **Paths**: `./`, `../` and absolute specifiers, tried as a file, with
//!    each extension appended, then as a directory (`package.json` main
//!    field, then `index` + extension)
//! 4. **Packages**: bare specifiers under each ancestor `node_modules`
//!
//! ## Thread Safety
//!
//! `resolve` is called concurrently from pipeline executions. Results are
//! memoized per (importer directory, specifier) behind a `std::shared_mutex`;
//! the cache never changes an answer, only how fast it is produced.

#ifndef LOOM_RESOLVE_RESOLVER_HPP
#define LOOM_RESOLVE_RESOLVER_HPP

#include "build/error.hpp"
#include "common.hpp"
#include "config/config.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace loom::resolve {

struct ResolverOptions {
    /// Base for relative alias targets.
    std::string root;
    std::map<std::string, std::string> alias;
    std::map<std::string, std::string> externals;
    std::vector<std::string> extensions = {".tsx", ".ts", ".jsx", ".js", ".mjs", ".cjs", ".json"};
    std::vector<std::string> main_fields = {"module", "main"};
};

struct Resolution {
    /// Absolute path, or the specifier itself for externals.
    std::string path;
    std::optional<std::string> external;

    [[nodiscard]] auto is_external() const -> bool {
        return external.has_value();
    }
};

class Resolver {
public:
    explicit Resolver(ResolverOptions options);

    /// Options from the build configuration, rooted at `root`.
    [[nodiscard]] static auto from_config(const config::Config& config, const std::string& root)
        -> ResolverOptions;

    /// Resolves `specifier` as written in the module at `importer`.
    [[nodiscard]] auto resolve(const std::string& importer, const std::string& specifier) const
        -> Result<Resolution, BuildError>;

    [[nodiscard]] auto cache_size() const -> size_t;

private:
    ResolverOptions options_;

    mutable std::shared_mutex cache_mutex_;
    mutable std::map<std::pair<std::string, std::string>, std::optional<std::string>> cache_;

    [[nodiscard]] auto resolve_path(const std::filesystem::path& dir,
                                    const std::string& specifier) const
        -> std::optional<std::string>;
    [[nodiscard]] auto apply_alias(const std::string& specifier) const -> std::string;
    [[nodiscard]] auto try_file(const std::filesystem::path& path) const
        -> std::optional<std::string>;
    [[nodiscard]] auto try_directory(const std::filesystem::path& dir) const
        -> std::optional<std::string>;
    [[nodiscard]] auto try_node_modules(const std::filesystem::path& dir,
                                        const std::string& specifier) const
        -> std::optional<std::string>;
};

} // namespace loom::resolve

#endif // LOOM_RESOLVE_RESOLVER_HPP
