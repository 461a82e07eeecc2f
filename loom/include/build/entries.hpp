#ifndef LOOM_BUILD_ENTRIES_HPP
#define LOOM_BUILD_ENTRIES_HPP

#include "build/error.hpp"
#include "common.hpp"
#include "config/config.hpp"

#include <array>
#include <string>
#include <vector>

namespace loom::build {

/// Index files looked up, in order, when no entry is configured.
constexpr std::array<const char*, 4> DEFAULT_ENTRIES = {"src/index.tsx", "src/index.ts",
                                                         "index.tsx", "index.ts"};

/// Normalized absolute entry paths: the configured entries in name order, or
/// the first default index file that exists. `EntryNotFound` if neither.
[[nodiscard]] auto find_entries(const config::Config& config, const std::string& root)
    -> Result<std::vector<std::string>, BuildError>;

} // namespace loom::build

#endif // LOOM_BUILD_ENTRIES_HPP
