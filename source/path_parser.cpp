// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_parser.cpp
/// @brief Hand-written recursive descent parser for paths and matchers.

#include <treepath/path_parser.h>
#include <treepath/text_scanner.h>

#include <limits>
#include <vector>

namespace treepath {

namespace {

bool is_identifier_start(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool is_identifier_char(char c)
{
    return is_identifier_start(c) || (c >= '0' && c <= '9');
}

class PathTextParser : public detail::TextScanner {
public:
    explicit PathTextParser(std::string_view text) : TextScanner(text) {}

    Path parse_path() {
        expect('$');
        Path path;
        while (!at_end()) {
            char c = consume();
            if (c == '.') {
                path = path.property(read_identifier());
            } else if (c == '[') {
                path = path.child(read_bracket_component());
                expect(']');
            } else {
                --pos_;
                fail("Expected '.' or '['");
            }
        }
        return path;
    }

    PathMatcher parse_matcher() {
        expect('$');
        std::vector<ComponentMatcher> matchers;
        while (!at_end()) {
            char c = consume();
            if (c == '.') {
                if (peek() == '*') {
                    consume();
                    matchers.emplace_back(any_property);
                } else {
                    matchers.emplace_back(read_identifier());
                }
            } else if (c == '[') {
                matchers.push_back(read_bracket_matcher());
                expect(']');
            } else {
                --pos_;
                fail("Expected '.' or '['");
            }
        }
        return PathMatcher{std::move(matchers)};
    }

private:
    [[noreturn]] void fail(const std::string& message) const override {
        throw PathSyntaxError(message, std::string(text_), pos_);
    }

    std::string read_identifier() {
        if (!is_identifier_start(peek())) {
            fail("Expected identifier");
        }
        const std::size_t start = pos_;
        while (!at_end() && is_identifier_char(peek())) {
            ++pos_;
        }
        return std::string(text_.substr(start, pos_ - start));
    }

    std::size_t read_index() {
        const std::size_t start = pos_;
        if (peek() == '0' && start + 1 < text_.size() &&
            text_[start + 1] >= '0' && text_[start + 1] <= '9') {
            fail("Leading zero in index");
        }
        const std::uint64_t value = read_unsigned();
        if (value > std::numeric_limits<std::size_t>::max()) {
            pos_ = start;
            fail("Integer out of range");
        }
        return static_cast<std::size_t>(value);
    }

    /// Integer or quoted string inside `[...]`
    PathElement read_bracket_component() {
        char c = peek();
        if (c >= '0' && c <= '9') {
            return PathElement{read_index()};
        }
        if (c == '"') {
            consume();
            return PathElement{read_quoted('"')};
        }
        if (c == '\'') {
            consume();
            return PathElement{read_quoted('\'', '"')};
        }
        fail("Expected integer or quoted string");
    }

    ComponentMatcher read_bracket_matcher() {
        if (peek() == '*') {
            consume();
            return ComponentMatcher{any_index};
        }

        bool single_identifier = false;
        std::vector<PathElement> members;
        members.push_back(read_union_member(single_identifier));
        while (peek() == ',') {
            consume();
            bool ignored = false;
            members.push_back(read_union_member(ignored));
        }

        if (members.size() == 1) {
            if (single_identifier) {
                fail("Bare identifier is only allowed in a union");
            }
            return ComponentMatcher{members.front()};
        }
        return ComponentMatcher{UnionMatcher{std::move(members)}};
    }

    PathElement read_union_member(bool& is_identifier) {
        if (is_identifier_start(peek())) {
            is_identifier = true;
            return PathElement{read_identifier()};
        }
        return read_bracket_component();
    }
};

} // anonymous namespace

Path parse_path(std::string_view text)
{
    PathTextParser parser(text);
    return parser.parse_path();
}

PathMatcher parse_path_matcher(std::string_view text)
{
    PathTextParser parser(text);
    return parser.parse_matcher();
}

} // namespace treepath
