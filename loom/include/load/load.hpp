#ifndef LOOM_LOAD_LOAD_HPP
#define LOOM_LOAD_LOAD_HPP

#include "build/error.hpp"
#include "common.hpp"
#include "load/content.hpp"

#include <string>

namespace loom {
class Context;
}

namespace loom::load {

/// Loads `path` through the context's plugin chain.
///
/// Fails with `LoadError/NotFound` when the file does not exist and with
/// `LoadError/UnsupportedExtName` when no plugin accepts the extension.
[[nodiscard]] auto load(const std::string& path, const Context& context)
    -> Result<Content, BuildError>;

} // namespace loom::load

#endif // LOOM_LOAD_LOAD_HPP
