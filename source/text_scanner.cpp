// text_scanner.cpp - shared string and integer lexing

#include <treepath/text_scanner.h>

#include <cctype>
#include <limits>

namespace treepath::detail {

void append_utf8(std::string& out, std::uint32_t codepoint)
{
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

std::string TextScanner::read_quoted(char quote, char forbidden)
{
    std::string result;

    while (!at_end()) {
        char c = consume();
        if (c == quote) {
            return result;
        }
        if (c == '\\') {
            read_escape(result);
        } else if (forbidden != '\0' && c == forbidden) {
            --pos_;
            fail(std::string("Unescaped '") + c + "' in string");
        } else if (static_cast<unsigned char>(c) < 0x20) {
            --pos_;
            fail("Control character in string");
        } else {
            result += c;
        }
    }

    fail("Unterminated string");
}

void TextScanner::read_escape(std::string& out)
{
    if (at_end()) {
        fail("Unexpected end of string escape");
    }
    char escaped = consume();
    switch (escaped) {
        case '"':  out += '"'; break;
        case '\\': out += '\\'; break;
        case '/':  out += '/'; break;
        case 'b':  out += '\b'; break;
        case 'f':  out += '\f'; break;
        case 'n':  out += '\n'; break;
        case 'r':  out += '\r'; break;
        case 't':  out += '\t'; break;
        case 'u': {
            std::uint32_t codepoint = read_hex4();
            // Surrogate pair
            if (codepoint >= 0xD800 && codepoint <= 0xDBFF &&
                text_.compare(pos_, 2, "\\u") == 0) {
                std::size_t saved = pos_;
                pos_ += 2;
                std::uint32_t low = read_hex4();
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                } else {
                    pos_ = saved;
                }
            }
            append_utf8(out, codepoint);
            break;
        }
        default:
            --pos_;
            fail("Invalid escape sequence: \\" + std::string(1, escaped));
    }
}

std::uint32_t TextScanner::read_hex4()
{
    if (pos_ + 4 > text_.size()) {
        fail("Invalid unicode escape");
    }
    std::uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        char c = text_[pos_];
        value <<= 4;
        if (c >= '0' && c <= '9') {
            value |= static_cast<std::uint32_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            value |= static_cast<std::uint32_t>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            value |= static_cast<std::uint32_t>(c - 'A' + 10);
        } else {
            fail("Invalid unicode escape");
        }
        ++pos_;
    }
    return value;
}

std::uint64_t TextScanner::read_unsigned()
{
    const std::size_t start = pos_;
    std::uint64_t value = 0;
    constexpr auto max = std::numeric_limits<std::uint64_t>::max();

    while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
        const auto digit = static_cast<std::uint64_t>(consume() - '0');
        if (value > (max - digit) / 10) {
            pos_ = start;
            fail("Integer out of range");
        }
        value = value * 10 + digit;
    }
    if (pos_ == start) {
        fail("Expected integer");
    }
    return value;
}

} // namespace treepath::detail
