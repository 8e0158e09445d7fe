// serialization.cpp - JSON text conversion

#include <treepath/serialization.h>
#include <treepath/text_scanner.h>

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace treepath {

std::string json_escape_string(const std::string& s)
{
    std::string result;
    result.reserve(s.size() + 16);

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

namespace {

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level)
{
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const std::string newline = compact ? "" : "\n";
    const std::string space_after_colon = compact ? "" : " ";

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate> || std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, double>) {
            oss << (std::isfinite(arg) ? number_to_string(arg) : "null");
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << json_escape_string(arg) << "\"";
        } else if constexpr (std::is_same_v<T, BigInt>) {
            oss << arg.digits;
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            bool first = true;
            for (const auto entry : arg) {
                if (entry.value.is_undefined()) continue;
                oss << (first ? "{" + newline : "," + newline);
                first = false;
                oss << child_indent << "\"" << json_escape_string(entry.key) << "\":" << space_after_colon;
                to_json_impl(entry.value, oss, compact, indent_level + 1);
            }
            if (first) {
                oss << "{}";
            } else {
                oss << newline << indent << "}";
            }
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            if (arg.size() == 0) {
                oss << "[]";
            } else {
                oss << "[" << newline;
                for (std::size_t i = 0; i < arg.size(); ++i) {
                    if (i > 0) oss << "," << newline;
                    oss << child_indent;
                    to_json_impl(arg[i].get(), oss, compact, indent_level + 1);
                }
                oss << newline << indent << "]";
            }
        } else if constexpr (std::is_same_v<T, OpaqueRef>) {
            if (arg) {
                to_json_impl(arg->to_json(), oss, compact, indent_level);
            } else {
                oss << "null";
            }
        }
    }, val.data);
}

// ============================================================
// Simple JSON Parser
// ============================================================

class JsonParser : public detail::TextScanner {
public:
    explicit JsonParser(const std::string& json) : TextScanner(json) {}

    Value parse(std::string* error_out) {
        try {
            skip_whitespace();
            if (at_end()) {
                if (error_out) *error_out = "Empty JSON input";
                return Value{};
            }
            Value result = parse_value();
            skip_whitespace();
            if (!at_end()) {
                fail("Unexpected trailing characters");
            }
            return result;
        } catch (const std::runtime_error& e) {
            if (error_out) *error_out = e.what();
            return Value{};
        }
    }

private:
    [[noreturn]] void fail(const std::string& message) const override {
        throw std::runtime_error(message + " at position " + std::to_string(pos_));
    }

    void skip_whitespace() {
        while (!at_end() && std::isspace(static_cast<unsigned char>(peek()))) {
            ++pos_;
        }
    }

    Value parse_value() {
        skip_whitespace();
        char c = peek();

        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == '"') return parse_string();
        if (c == 't' || c == 'f') return parse_bool();
        if (c == 'n') return parse_null();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();

        fail("Unexpected character '" + std::string(1, c) + "'");
    }

    Value parse_object() {
        expect('{');
        skip_whitespace();

        if (peek() == '}') {
            consume();
            return Value{ValueObject{}};
        }

        ValueObject obj;

        while (true) {
            skip_whitespace();
            std::string key = parse_string_raw();
            skip_whitespace();
            expect(':');
            Value val = parse_value();
            obj = obj.set(key, std::move(val));

            skip_whitespace();
            char c = peek();
            if (c == '}') {
                consume();
                break;
            }
            if (c != ',') {
                fail("Expected ',' or '}' in object");
            }
            consume();
        }

        return Value{std::move(obj)};
    }

    Value parse_array() {
        expect('[');
        skip_whitespace();

        if (peek() == ']') {
            consume();
            return Value{ValueArray{}};
        }

        auto transient = ValueArray{}.transient();

        while (true) {
            Value val = parse_value();
            transient.push_back(ValueBox{std::move(val)});

            skip_whitespace();
            char c = peek();
            if (c == ']') {
                consume();
                break;
            }
            if (c != ',') {
                fail("Expected ',' or ']' in array");
            }
            consume();
        }

        return Value{transient.persistent()};
    }

    std::string parse_string_raw() {
        expect('"');
        return read_quoted('"');
    }

    Value parse_string() {
        return Value{parse_string_raw()};
    }

    Value parse_number() {
        const std::size_t start = pos_;

        if (peek() == '-') consume();
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            fail("Expected digit");
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        if (peek() == '.') {
            consume();
            if (!std::isdigit(static_cast<unsigned char>(peek()))) {
                fail("Expected digit after '.'");
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }
        if (peek() == 'e' || peek() == 'E') {
            consume();
            if (peek() == '+' || peek() == '-') consume();
            if (!std::isdigit(static_cast<unsigned char>(peek()))) {
                fail("Expected exponent digits");
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        const std::string num_str{text_.substr(start, pos_ - start)};
        // strtod saturates to +/-HUGE_VAL or 0 where stod would throw
        return Value{std::strtod(num_str.c_str(), nullptr)};
    }

    Value parse_bool() {
        if (text_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            return Value{true};
        }
        if (text_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            return Value{false};
        }
        fail("Expected 'true' or 'false'");
    }

    Value parse_null() {
        if (text_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return Value{nullptr};
        }
        fail("Expected 'null'");
    }
};

} // anonymous namespace

std::string to_json(const Value& val, bool compact)
{
    if (val.is_undefined()) {
        return "undefined";
    }
    std::ostringstream oss;
    to_json_impl(val, oss, compact, 0);
    return oss.str();
}

Value from_json(const std::string& json_str, std::string* error_out)
{
    JsonParser parser(json_str);
    return parser.parse(error_out);
}

} // namespace treepath
