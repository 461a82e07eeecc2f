//! # JSON Value and Serializer

#include "json/json.hpp"

#include <cstdio>
#include <sstream>
#include <type_traits>

namespace loom::json {

auto JsonValue::get(std::string_view key) const -> const JsonValue* {
    const auto* object = std::get_if<JsonObject>(&data);
    if (!object)
        return nullptr;
    auto it = object->find(std::string(key));
    return it == object->end() ? nullptr : &it->second;
}

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    return data == other.data;
}

auto quote(std::string_view s) -> std::string {
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char c : s) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                out += buf;
            } else {
                out += c;
            }
        }
    }
    out += '"';
    return out;
}

namespace {

void write_value(std::ostringstream& out, const JsonValue& value, int indent, int level) {
    auto newline = [&](int lvl) {
        if (indent > 0) {
            out << '\n' << std::string(static_cast<size_t>(indent * lvl), ' ');
        }
    };

    std::visit(
        [&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                out << "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                out << (v ? "true" : "false");
            } else if constexpr (std::is_same_v<T, int64_t>) {
                out << v;
            } else if constexpr (std::is_same_v<T, double>) {
                out << v;
            } else if constexpr (std::is_same_v<T, std::string>) {
                out << quote(v);
            } else if constexpr (std::is_same_v<T, JsonArray>) {
                if (v.empty()) {
                    out << "[]";
                    return;
                }
                out << '[';
                for (size_t i = 0; i < v.size(); ++i) {
                    if (i > 0)
                        out << ',';
                    newline(level + 1);
                    write_value(out, v[i], indent, level + 1);
                }
                newline(level);
                out << ']';
            } else {
                if (v.empty()) {
                    out << "{}";
                    return;
                }
                out << '{';
                bool first = true;
                for (const auto& [key, member] : v) {
                    if (!first)
                        out << ',';
                    first = false;
                    newline(level + 1);
                    out << quote(key) << (indent > 0 ? ": " : ":");
                    write_value(out, member, indent, level + 1);
                }
                newline(level);
                out << '}';
            }
        },
        value.data);
}

} // namespace

auto JsonValue::to_string(int indent) const -> std::string {
    std::ostringstream out;
    write_value(out, *this, indent, 0);
    return out.str();
}

} // namespace loom::json
