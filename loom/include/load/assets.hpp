//! # Static Assets
//!
//! Assets small enough are inlined as base64 data URIs; larger ones are
//! given a content-hashed output name recorded in the context's asset
//! manifest. Hashing and encoding use OpenSSL EVP.
//!
//! ```text
//! logo.png (812 bytes)    -> "data:image/png;base64,iVBORw0KGgo..."
//! hero.jpg (48213 bytes)  -> "hero.3f2a9c1b.jpg"
//! ```

#ifndef LOOM_LOAD_ASSETS_HPP
#define LOOM_LOAD_ASSETS_HPP

#include "build/error.hpp"
#include "common.hpp"

#include <string>
#include <string_view>

namespace loom {
class Context;
}

namespace loom::load {

/// Mime type for an extension (without dot); `application/octet-stream` if
/// unknown.
[[nodiscard]] auto mime_type(std::string_view ext) -> const char*;

[[nodiscard]] auto base64_encode(std::string_view data) -> std::string;

/// Lowercase hex SHA-256 digest.
[[nodiscard]] auto sha256_hex(std::string_view data) -> std::string;

/// Returns the value the asset module exports: a data URI, or the hashed
/// output file name (also recorded in `context.assets`).
[[nodiscard]] auto handle_asset(const Context& context, const std::string& path)
    -> Result<std::string, BuildError>;

} // namespace loom::load

#endif // LOOM_LOAD_ASSETS_HPP
