// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file projection.h
/// @brief Include / exclude filtering of a Value tree by matchers.
///
/// @code
/// auto projection = Projection::of({parse_path_matcher("$.users[*].name")},
///                                  {parse_path_matcher("$.users[0]")});
/// Value visible = projection.map(document);
/// @endcode

#pragma once

#include <treepath/path_matcher.h>

#include <vector>

namespace treepath {

class TREEPATH_API Projection {
public:
    [[nodiscard]] static Projection of(std::vector<PathMatcher> includes = {},
                                       std::vector<PathMatcher> excludes = {});

    /// Copy of @p input holding only included, non-excluded locations.
    /// When any matcher allows gaps, Undefined holes are removed from arrays.
    [[nodiscard]] Value map(const Value& input) const;

    /// Whether @p path may hold projected data
    [[nodiscard]] bool match(const Path& path) const;

    [[nodiscard]] bool allows_gaps() const noexcept { return allows_gaps_; }
    [[nodiscard]] const std::vector<PathMatcher>& includes() const noexcept { return includes_; }
    [[nodiscard]] const std::vector<PathMatcher>& excludes() const noexcept { return excludes_; }

private:
    Projection(std::vector<PathMatcher> includes, std::vector<PathMatcher> excludes);

    std::vector<PathMatcher> includes_;
    std::vector<PathMatcher> excludes_;
    bool allows_gaps_ = false;
};

} // namespace treepath
