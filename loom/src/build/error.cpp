#include "build/error.hpp"

#include <sstream>

namespace loom {

auto build_error_kind_name(BuildErrorKind kind) -> const char* {
    switch (kind) {
    case BuildErrorKind::EntryNotFound:
        return "EntryNotFound";
    case BuildErrorKind::LoadError:
        return "LoadError";
    case BuildErrorKind::ParseError:
        return "ParseError";
    case BuildErrorKind::ResolveError:
        return "ResolveError";
    case BuildErrorKind::InternalChannelFailure:
        return "InternalChannelFailure";
    case BuildErrorKind::ConfigError:
        return "ConfigError";
    }
    return "UnknownError";
}

auto load_error_kind_name(LoadErrorKind kind) -> const char* {
    switch (kind) {
    case LoadErrorKind::NotFound:
        return "NotFound";
    case LoadErrorKind::UnsupportedExtName:
        return "UnsupportedExtName";
    }
    return "Unknown";
}

auto BuildError::entry_not_found(const std::string& root) -> BuildError {
    return BuildError{BuildErrorKind::EntryNotFound, "no entry configured and no index file in " + root,
                      root, std::nullopt, {}};
}

auto BuildError::not_found(const std::string& path) -> BuildError {
    return BuildError{BuildErrorKind::LoadError, "file not found: " + path, path,
                      LoadErrorKind::NotFound, {}};
}

auto BuildError::unsupported_ext(const std::string& ext, const std::string& path) -> BuildError {
    return BuildError{BuildErrorKind::LoadError,
                      "unsupported extension '" + ext + "' for " + path, path,
                      LoadErrorKind::UnsupportedExtName, {}};
}

auto BuildError::parse(const std::string& path, const std::string& message) -> BuildError {
    return BuildError{BuildErrorKind::ParseError, path + ":" + message, path, std::nullopt, {}};
}

auto BuildError::resolve(const std::string& importer, const std::string& specifier) -> BuildError {
    return BuildError{BuildErrorKind::ResolveError,
                      "cannot resolve '" + specifier + "' from " + importer, importer,
                      std::nullopt, {}};
}

auto BuildError::internal(const std::string& message, const std::string& path) -> BuildError {
    return BuildError{BuildErrorKind::InternalChannelFailure, message, path, std::nullopt, {}};
}

auto BuildError::config(const std::string& path, const std::string& message) -> BuildError {
    return BuildError{BuildErrorKind::ConfigError, path + ": " + message, path, std::nullopt, {}};
}

auto BuildError::to_string() const -> std::string {
    std::ostringstream oss;
    oss << build_error_kind_name(kind);
    if (load_kind) {
        oss << "(" << load_error_kind_name(*load_kind) << ")";
    }
    oss << ": " << message;

    if (import_chain.size() > 1) {
        oss << "\n  imported by: ";
        for (size_t i = 0; i < import_chain.size(); ++i) {
            if (i > 0)
                oss << " -> ";
            oss << import_chain[i];
        }
    }
    return oss.str();
}

} // namespace loom
