//! # JSON Parser
//!
//! Recursive descent parser over a `std::string_view`. Tracks line and
//! column for error reporting; rejects trailing garbage and over-deep nesting.

#include "json/json.hpp"

#include <cerrno>
#include <charconv>
#include <cstdlib>

namespace loom::json {

namespace {

class Parser {
public:
    explicit Parser(std::string_view input) : input_(input) {}

    auto parse_document() -> Result<JsonValue, JsonError> {
        skip_whitespace();
        auto value = parse_value(0);
        if (is_err(value))
            return value;
        skip_whitespace();
        if (!at_end())
            return error("Unexpected trailing characters");
        return value;
    }

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    [[nodiscard]] auto at_end() const -> bool {
        return pos_ >= input_.size();
    }

    [[nodiscard]] auto peek() const -> char {
        return at_end() ? '\0' : input_[pos_];
    }

    auto advance() -> char {
        char c = input_[pos_++];
        if (c == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        return c;
    }

    auto error(std::string message) const -> JsonError {
        return JsonError::make(std::move(message), line_, column_);
    }

    void skip_whitespace() {
        while (!at_end()) {
            char c = peek();
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
                break;
            advance();
        }
    }

    auto consume_literal(std::string_view word) -> bool {
        if (input_.substr(pos_, word.size()) != word)
            return false;
        for (size_t i = 0; i < word.size(); ++i)
            advance();
        return true;
    }

    auto parse_value(size_t depth) -> Result<JsonValue, JsonError> {
        if (depth > MAX_DEPTH)
            return error("Maximum nesting depth exceeded");

        switch (peek()) {
        case '{':
            return parse_object(depth);
        case '[':
            return parse_array(depth);
        case '"': {
            auto s = parse_string();
            if (is_err(s))
                return unwrap_err(s);
            return JsonValue(std::move(unwrap(s)));
        }
        case 't':
            if (consume_literal("true"))
                return JsonValue(true);
            break;
        case 'f':
            if (consume_literal("false"))
                return JsonValue(false);
            break;
        case 'n':
            if (consume_literal("null"))
                return JsonValue(nullptr);
            break;
        case '\0':
            if (at_end())
                return error("Unexpected end of input");
            break;
        default:
            if (peek() == '-' || (peek() >= '0' && peek() <= '9'))
                return parse_number();
            break;
        }
        return error(std::string("Unexpected character '") + peek() + "'");
    }

    auto parse_object(size_t depth) -> Result<JsonValue, JsonError> {
        advance(); // {
        JsonObject object;
        skip_whitespace();
        if (peek() == '}') {
            advance();
            return JsonValue(std::move(object));
        }

        while (true) {
            skip_whitespace();
            if (peek() != '"')
                return error("Expected string key");
            auto key = parse_string();
            if (is_err(key))
                return unwrap_err(key);

            skip_whitespace();
            if (peek() != ':')
                return error("Expected ':' after object key");
            advance();
            skip_whitespace();

            auto value = parse_value(depth + 1);
            if (is_err(value))
                return value;
            object.insert_or_assign(std::move(unwrap(key)), std::move(unwrap(value)));

            skip_whitespace();
            if (peek() == ',') {
                advance();
                continue;
            }
            if (peek() == '}') {
                advance();
                return JsonValue(std::move(object));
            }
            return error("Expected ',' or '}' in object");
        }
    }

    auto parse_array(size_t depth) -> Result<JsonValue, JsonError> {
        advance(); // [
        JsonArray array;
        skip_whitespace();
        if (peek() == ']') {
            advance();
            return JsonValue(std::move(array));
        }

        while (true) {
            skip_whitespace();
            auto value = parse_value(depth + 1);
            if (is_err(value))
                return value;
            array.push_back(std::move(unwrap(value)));

            skip_whitespace();
            if (peek() == ',') {
                advance();
                continue;
            }
            if (peek() == ']') {
                advance();
                return JsonValue(std::move(array));
            }
            return error("Expected ',' or ']' in array");
        }
    }

    static void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    auto parse_hex4() -> Result<uint32_t, JsonError> {
        if (pos_ + 4 > input_.size())
            return error("Truncated unicode escape");
        uint32_t value = 0;
        auto digits = input_.substr(pos_, 4);
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + 4, value, 16);
        if (ec != std::errc() || ptr != digits.data() + 4)
            return error("Invalid unicode escape");
        for (int i = 0; i < 4; ++i)
            advance();
        return value;
    }

    auto parse_string() -> Result<std::string, JsonError> {
        advance(); // opening quote
        std::string out;

        while (true) {
            if (at_end())
                return error("Unterminated string");
            char c = advance();
            if (c == '"')
                return out;
            if (static_cast<unsigned char>(c) < 0x20)
                return error("Control character in string");
            if (c != '\\') {
                out += c;
                continue;
            }

            if (at_end())
                return error("Unterminated escape sequence");
            char esc = advance();
            switch (esc) {
            case '"':
                out += '"';
                break;
            case '\\':
                out += '\\';
                break;
            case '/':
                out += '/';
                break;
            case 'b':
                out += '\b';
                break;
            case 'f':
                out += '\f';
                break;
            case 'n':
                out += '\n';
                break;
            case 'r':
                out += '\r';
                break;
            case 't':
                out += '\t';
                break;
            case 'u': {
                auto cp = parse_hex4();
                if (is_err(cp))
                    return unwrap_err(cp);
                uint32_t code = unwrap(cp);
                // Surrogate pair
                if (code >= 0xD800 && code <= 0xDBFF && input_.substr(pos_, 2) == "\\u") {
                    advance();
                    advance();
                    auto low = parse_hex4();
                    if (is_err(low))
                        return unwrap_err(low);
                    code = 0x10000 + ((code - 0xD800) << 10) + (unwrap(low) - 0xDC00);
                }
                append_utf8(out, code);
                break;
            }
            default:
                return error(std::string("Invalid escape '\\") + esc + "'");
            }
        }
    }

    auto parse_number() -> Result<JsonValue, JsonError> {
        size_t start = pos_;
        bool is_float = false;

        if (peek() == '-')
            advance();
        if (!(peek() >= '0' && peek() <= '9'))
            return error("Invalid number");
        while (peek() >= '0' && peek() <= '9')
            advance();
        if (peek() == '.') {
            is_float = true;
            advance();
            if (!(peek() >= '0' && peek() <= '9'))
                return error("Expected digit after decimal point");
            while (peek() >= '0' && peek() <= '9')
                advance();
        }
        if (peek() == 'e' || peek() == 'E') {
            is_float = true;
            advance();
            if (peek() == '+' || peek() == '-')
                advance();
            if (!(peek() >= '0' && peek() <= '9'))
                return error("Expected digit in exponent");
            while (peek() >= '0' && peek() <= '9')
                advance();
        }

        auto text = input_.substr(start, pos_ - start);
        if (!is_float) {
            int64_t value = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec == std::errc() && ptr == text.data() + text.size())
                return JsonValue(value);
            // Out of int64 range: fall through to double
        }

        std::string buffer(text);
        errno = 0;
        double value = std::strtod(buffer.c_str(), nullptr);
        if (errno == ERANGE)
            return error("Number out of range");
        return JsonValue(value);
    }
};

} // namespace

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    Parser parser(input);
    return parser.parse_document();
}

} // namespace loom::json
