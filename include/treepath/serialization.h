// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON text conversion for Value trees.
///
/// Usage:
/// @code
///   #include <treepath/serialization.h>
///
///   Value data = Value::object({{"key", "value"}});
///   std::string json = to_json(data, true);   // {"key":"value"}
///   Value parsed = from_json(json);
/// @endcode
///
/// Rendering rules (those of JSON.stringify):
/// - Undefined object members are omitted, Undefined array items print as null
/// - NaN and +/-Infinity print as null
/// - BigInt prints as its bare digits
/// - Opaque values print through OpaqueValue::to_json()

#pragma once

#include "api.h"
#include "value.h"

#include <string>

namespace treepath {

/// Convert Value to JSON string
/// @param val The Value to convert
/// @param compact If true, produce minimal output; if false, pretty-print with indentation
/// @return JSON string, or "undefined" when @p val itself is Undefined
TREEPATH_API std::string to_json(const Value& val, bool compact = false);

/// Parse JSON string to Value
/// @param json_str The JSON string to parse
/// @param error_out If provided, receives error message on failure
/// @return Parsed Value (numbers become doubles), or Undefined on parse error
TREEPATH_API Value from_json(const std::string& json_str, std::string* error_out = nullptr);

/// Escape a string for use inside JSON double quotes (without the quotes)
TREEPATH_API std::string json_escape_string(const std::string& s);

} // namespace treepath
