//! # Build Configuration
//!
//! Options read from `loom.config.json` at the project root. A missing file
//! yields the defaults; unknown keys are ignored.
//!
//! ```json
//! {
//!     "entry": {"index": "src/index.ts"},
//!     "resolve": {"alias": {"@": "./src"}},
//!     "externals": {"react": "React"},
//!     "assets": {"inlineLimit": 10000},
//!     "build": {"threads": 0}
//! }
//! ```

#ifndef LOOM_CONFIG_CONFIG_HPP
#define LOOM_CONFIG_CONFIG_HPP

#include "build/error.hpp"
#include "common.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace loom::config {

/// Name of the configuration file looked up at the project root.
constexpr const char* CONFIG_FILE_NAME = "loom.config.json";

/// Default size (bytes) up to which assets are inlined as data URIs.
constexpr size_t DEFAULT_INLINE_LIMIT = 10000;

/// Upper bound accepted for `build.threads`.
constexpr unsigned MAX_THREADS = 256;

struct Config {
    /// Entry name -> path relative to the root. Empty means "search for an
    /// index file".
    std::map<std::string, std::string> entry;

    /// Specifier prefix -> replacement, applied before path resolution.
    std::map<std::string, std::string> alias;

    /// Bare specifier -> runtime global name.
    std::map<std::string, std::string> externals;

    size_t inline_limit = DEFAULT_INLINE_LIMIT;

    /// Worker threads for pipeline executions; 0 = hardware concurrency.
    unsigned threads = 0;
};

/// Parses configuration text. `origin` names the source in error messages.
[[nodiscard]] auto parse_config(std::string_view text, const std::string& origin = CONFIG_FILE_NAME)
    -> Result<Config, BuildError>;

/// Reads `<root>/loom.config.json`, or returns defaults if it does not exist.
[[nodiscard]] auto load_config(const std::filesystem::path& root) -> Result<Config, BuildError>;

} // namespace loom::config

#endif // LOOM_CONFIG_CONFIG_HPP
