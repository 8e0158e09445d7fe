// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_parser.h
/// @brief Parse canonical path strings and matcher expressions.
///
/// Path grammar (no whitespace anywhere):
/// ```
/// path      := '$' ( '.' identifier | '[' index ']' )*
/// index     := integer | "json string" | 'json string'
/// ```
///
/// Matcher grammar adds wildcards and unions:
/// ```
/// matcher   := '$' ( '.' ( identifier | '*' ) | '[' ( index | '*' | union ) ']' )*
/// union     := member ( ',' member )+
/// member    := integer | identifier | "json string" | 'json string'
/// ```
///
/// Quoted strings accept JSON escapes. A raw `"` is never allowed inside
/// either quote form, and `\'` is not an escape.
///
/// @code
/// Path p = parse_path(R"($.users[0]["display name"])");
/// PathMatcher m = parse_path_matcher("$.users[*]['name',email]");
/// @endcode

#pragma once

#include <treepath/path_matcher.h>

#include <string_view>

namespace treepath {

/// @throws PathSyntaxError if @p text is not a valid path
[[nodiscard]] TREEPATH_API Path parse_path(std::string_view text);

/// @throws PathSyntaxError if @p text is not a valid matcher expression
[[nodiscard]] TREEPATH_API PathMatcher parse_path_matcher(std::string_view text);

} // namespace treepath
