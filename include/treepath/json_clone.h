// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_clone.h
/// @brief Deep copy restricted to what JSON can represent.

#pragma once

#include <treepath/api.h>
#include <treepath/value.h>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace treepath {

/// Called for every node after opaque values are resolved, with the member
/// key, the item index as a string, or "" for the root. The returned value
/// replaces the node; returning Undefined drops an object member and turns
/// an array item into null.
using JsonReplacer = std::function<Value(std::string_view key, const Value& value)>;

/// Deep clone of @p value as JSON would carry it:
/// - opaque values are replaced by their OpaqueValue::to_json() form
/// - Undefined object members are dropped, Undefined array items become null
/// - an Undefined root stays Undefined
///
/// @throws std::invalid_argument on a BigInt anywhere in the tree
[[nodiscard]] TREEPATH_API Value json_clone(const Value& value);

/// json_clone() passing each node through @p replacer first. A replacer
/// may turn a BigInt into something JSON can carry.
///
/// @throws std::invalid_argument on a BigInt left by the replacer, or an
///         opaque value the replacer returns whose to_json() is opaque too
[[nodiscard]] TREEPATH_API Value json_clone(const Value& value, const JsonReplacer& replacer);

/// json_clone() keeping only the members named in @p allowed_keys, in that
/// order, in every object of the tree. Arrays are cloned in full.
[[nodiscard]] TREEPATH_API Value json_clone(const Value& value, const std::vector<std::string>& allowed_keys);

} // namespace treepath
