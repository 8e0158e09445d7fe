// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exception types thrown by treepath.
///
/// - PathError: invalid path construction or a write through a non-container
/// - PathSyntaxError: rejected path / matcher text, carries the offset
/// - UnsupportedValueError: Diff met a value that is neither a primitive,
///   an array nor a plain object

#pragma once

#include <treepath/api.h>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace treepath {

class TREEPATH_API PathError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class TREEPATH_API PathSyntaxError : public PathError {
public:
    PathSyntaxError(const std::string& message, std::string input, std::size_t position)
        : PathError(message + " at position " + std::to_string(position) + " in '" + input + "'")
        , input_(std::move(input))
        , position_(position)
    {}

    [[nodiscard]] const std::string& input() const noexcept { return input_; }
    [[nodiscard]] std::size_t position() const noexcept { return position_; }

private:
    std::string input_;
    std::size_t position_;
};

class TREEPATH_API UnsupportedValueError : public std::runtime_error {
public:
    explicit UnsupportedValueError(std::string type_name)
        : std::runtime_error("only primitives, arrays and plain objects are supported, got \"" +
                             type_name + "\"")
        , type_name_(std::move(type_name))
    {}

    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }

private:
    std::string type_name_;
};

} // namespace treepath
