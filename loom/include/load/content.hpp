#ifndef LOOM_LOAD_CONTENT_HPP
#define LOOM_LOAD_CONTENT_HPP

#include <string>

namespace loom::load {

enum class ContentKind {
    Js,
    Css,
    /// `text` is the asset's exported value: a data URI or an output file name.
    Asset,
};

/// Loaded module source, tagged with how it should be parsed.
struct Content {
    ContentKind kind;
    std::string text;
};

} // namespace loom::load

#endif // LOOM_LOAD_CONTENT_HPP
