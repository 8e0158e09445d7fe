// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file version_info.h
/// @brief A current version of a tree together with its previous version.
///
/// Change information is computed on first use and cached:
/// @code
/// VersionInfo info{current, previous};
/// if (info.matches("$.address.*")) { ... }
/// for (const auto& path : info.paths()) { ... }
/// @endcode
///
/// A VersionInfo without a previous version describes a new tree: it has no
/// changes, paths() lists every leaf, and matches() searches the tree itself.

#pragma once

#include <treepath/diff.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace treepath {

struct VersionInfoConfig {
    Diff diff;

    /// Changed paths matching any of these report their old value in
    /// previous_values()
    std::vector<PathMatcher> previous_values;
};

class TREEPATH_API VersionInfo {
public:
    explicit VersionInfo(Value current,
                         std::optional<Value> previous = std::nullopt,
                         VersionInfoConfig config = {});

    [[nodiscard]] const Value& current() const noexcept { return current_; }
    [[nodiscard]] const std::optional<Value>& previous() const noexcept { return previous_; }
    [[nodiscard]] const VersionInfoConfig& config() const noexcept { return config_; }

    /// Apply @p fn to both versions, keeping (or replacing) the config
    [[nodiscard]] VersionInfo map(const std::function<Value(const Value&)>& fn,
                                  std::optional<VersionInfoConfig> config = std::nullopt) const;

    /// Changeset previous -> current; std::nullopt without a previous version
    [[nodiscard]] const std::optional<Changeset>& changes() const;

    [[nodiscard]] const std::optional<std::vector<std::string>>& changed_paths() const;

    /// Changed paths, or every leaf path of a new tree
    [[nodiscard]] const std::vector<std::string>& paths() const;

    /// Old values of the changed paths selected by config().previous_values,
    /// written into an empty container shaped like the previous root.
    /// std::nullopt when nothing was selected.
    [[nodiscard]] const std::optional<Value>& previous_values() const;

    /// Any changed path lies inside @p matcher, or for a new tree,
    /// @p matcher finds anything in current()
    [[nodiscard]] bool matches(const PathMatcher& matcher) const;

    /// @throws PathSyntaxError if @p expression does not parse
    [[nodiscard]] bool matches(std::string_view expression) const;

    [[nodiscard]] bool matches_any(const std::vector<PathMatcher>& matchers) const;
    [[nodiscard]] bool matches_any(const std::vector<std::string>& expressions) const;

    /// `{"current": ..., "changedPaths": [...], "previous": ...}`; absent
    /// parts are left Undefined
    [[nodiscard]] Value to_json() const;

private:
    Value current_;
    std::optional<Value> previous_;
    VersionInfoConfig config_;

    mutable std::optional<std::optional<Changeset>> changes_;
    mutable std::optional<std::optional<std::vector<std::string>>> changed_paths_;
    mutable std::optional<std::vector<std::string>> paths_;
    mutable std::optional<std::optional<Value>> previous_values_;
};

} // namespace treepath
