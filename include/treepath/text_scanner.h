// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file text_scanner.h
/// @brief Cursor over a text buffer shared by the JSON and path parsers.
///
/// Derived parsers override fail() to throw their own error type; every
/// reading helper reports errors through it.

#pragma once

#include "api.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace treepath::detail {

class TREEPATH_API TextScanner {
public:
    explicit TextScanner(std::string_view text) : text_(text) {}
    virtual ~TextScanner() = default;

    TextScanner(const TextScanner&) = delete;
    TextScanner& operator=(const TextScanner&) = delete;

protected:
    [[noreturn]] virtual void fail(const std::string& message) const = 0;

    [[nodiscard]] bool at_end() const noexcept { return pos_ >= text_.size(); }

    [[nodiscard]] char peek() const noexcept {
        return pos_ < text_.size() ? text_[pos_] : '\0';
    }

    char consume() noexcept {
        return pos_ < text_.size() ? text_[pos_++] : '\0';
    }

    void expect(char c) {
        if (at_end() || text_[pos_] != c) {
            fail(std::string("Expected '") + c + "'");
        }
        ++pos_;
    }

    /// Read the body of a quoted string up to @p quote (consumed).
    /// JSON escapes are decoded; @p forbidden, when non-zero, may not appear raw.
    std::string read_quoted(char quote, char forbidden = '\0');

    /// Read one non-negative decimal integer; fails on overflow
    std::uint64_t read_unsigned();

    std::string_view text_;
    std::size_t pos_ = 0;

private:
    void read_escape(std::string& out);
    std::uint32_t read_hex4();
};

/// Append @p codepoint to @p out as UTF-8
TREEPATH_API void append_utf8(std::string& out, std::uint32_t codepoint);

} // namespace treepath::detail
