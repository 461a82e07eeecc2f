//! # JSON Error Types
//!
//! Parse errors with source location, used when reading `loom.config.json`
//! and `package.json` files.

#pragma once

#include <cstddef>
#include <string>

namespace loom::json {

/// An error encountered while parsing JSON text.
///
/// `line` and `column` are 1-based; 0 means unknown.
struct JsonError {
    std::string message;
    size_t line = 0;
    size_t column = 0;

    static auto make(std::string msg, size_t line = 0, size_t column = 0) -> JsonError {
        return JsonError{std::move(msg), line, column};
    }

    /// `"line X, column Y: message"`, or just the message without a location.
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        if (line > 0) {
            return "line " + std::to_string(line) + ": " + message;
        }
        return message;
    }
};

} // namespace loom::json
