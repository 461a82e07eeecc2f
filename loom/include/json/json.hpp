//! # JSON
//!
//! A small JSON value type with a recursive descent parser and a serializer.
//!
//! ## Features
//!
//! - **Integer precision**: numbers without fraction or exponent are kept as
//!   `int64_t`
//! - **Ordered objects**: keys are kept sorted (`std::map`), so serialized
//!   output is deterministic
//! - **Depth limiting**: nested input deeper than `MAX_DEPTH` is rejected
//!
//! ## Example
//!
//! ```cpp
//! auto result = parse_json(R"({"entry": {"index": "src/index.ts"}})");
//! if (is_ok(result)) {
//!     const auto* entry = unwrap(result).get("entry");
//! }
//! ```

#ifndef LOOM_JSON_HPP
#define LOOM_JSON_HPP

#include "common.hpp"
#include "json/json_error.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace loom::json {

struct JsonValue;

using JsonArray = std::vector<JsonValue>;
using JsonObject = std::map<std::string, JsonValue>;

/// A JSON value.
struct JsonValue {
    using Storage =
        std::variant<std::nullptr_t, bool, int64_t, double, std::string, JsonArray, JsonObject>;

    Storage data;

    JsonValue() : data(nullptr) {}
    JsonValue(std::nullptr_t) : data(nullptr) {}
    JsonValue(bool b) : data(b) {}
    JsonValue(int v) : data(static_cast<int64_t>(v)) {}
    JsonValue(int64_t v) : data(v) {}
    JsonValue(double v) : data(v) {}
    JsonValue(const char* s) : data(std::string(s)) {}
    JsonValue(std::string s) : data(std::move(s)) {}
    JsonValue(JsonArray a) : data(std::move(a)) {}
    JsonValue(JsonObject o) : data(std::move(o)) {}

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<std::nullptr_t>(data);
    }
    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }
    [[nodiscard]] auto is_integer() const -> bool {
        return std::holds_alternative<int64_t>(data);
    }
    [[nodiscard]] auto is_number() const -> bool {
        return is_integer() || std::holds_alternative<double>(data);
    }
    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }
    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<JsonArray>(data);
    }
    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<JsonObject>(data);
    }

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }
    [[nodiscard]] auto as_i64() const -> int64_t {
        if (const auto* d = std::get_if<double>(&data))
            return static_cast<int64_t>(*d);
        return std::get<int64_t>(data);
    }
    [[nodiscard]] auto as_f64() const -> double {
        if (const auto* i = std::get_if<int64_t>(&data))
            return static_cast<double>(*i);
        return std::get<double>(data);
    }
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }
    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return std::get<JsonArray>(data);
    }
    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return std::get<JsonObject>(data);
    }
    [[nodiscard]] auto as_object_mut() -> JsonObject& {
        return std::get<JsonObject>(data);
    }
    [[nodiscard]] auto as_array_mut() -> JsonArray& {
        return std::get<JsonArray>(data);
    }

    /// Member lookup; null if this is not an object or the key is missing.
    [[nodiscard]] auto get(std::string_view key) const -> const JsonValue*;

    /// Serializes to compact JSON, or indented with `indent > 0`.
    [[nodiscard]] auto to_string(int indent = 0) const -> std::string;

    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;
};

/// Maximum nesting depth accepted by the parser.
constexpr size_t MAX_DEPTH = 256;

/// Parses a complete JSON document. Trailing non-whitespace is an error.
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

/// Escapes `s` as a JSON string literal, including the surrounding quotes.
[[nodiscard]] auto quote(std::string_view s) -> std::string;

} // namespace loom::json

#endif // LOOM_JSON_HPP
