// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_matcher.h
/// @brief Immutable pattern over path components, with tree search.
///
/// ## Usage
/// ```cpp
/// auto m = PathMatcher::of("array", any_index, "value");
/// m.find(root, [](const Path& path, const Value& value) {
///     std::cout << path << " = " << value << "\n";
/// });
///
/// m.match(Path::of("array", 3, "value"));          // true
/// m.prefix_match(Path::of("array", 3, "value", 1)); // true
/// m.partial_match(Path::of("array"));               // true
/// ```
///
/// Search is depth-first and pre-order. A subtree is entered only through
/// the children the current slot selects, so narrow patterns never visit
/// the rest of the tree.

#pragma once

#include <treepath/matchers.h>

#include <concepts>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace treepath {

/// A matched location and its value
struct Node {
    Path path;
    Value value;
};

class TREEPATH_API PathMatcher {
public:
    using Visitor = std::function<void(const Path&, const Value&)>;

    /// Matcher of length zero: matches the root only
    PathMatcher() = default;

    explicit PathMatcher(std::vector<ComponentMatcher> components);

    /// PathMatcher::of("a", 0, any_property, UnionMatcher::of("x", 1))
    /// @throws PathError on an invalid component
    template <typename... Components>
        requires(std::constructible_from<ComponentMatcher, Components&&> && ...)
    [[nodiscard]] static PathMatcher of(Components&&... components) {
        std::vector<ComponentMatcher> matchers;
        matchers.reserve(sizeof...(Components));
        (matchers.emplace_back(std::forward<Components>(components)), ...);
        return PathMatcher{std::move(matchers)};
    }

    [[nodiscard]] std::size_t size() const noexcept { return components_.size(); }
    [[nodiscard]] const std::vector<ComponentMatcher>& components() const noexcept { return components_; }

    /// True if any slot may select a non-contiguous subset of an array
    [[nodiscard]] bool allows_gaps() const noexcept { return allows_gaps_; }

    // ============================================================
    // Predicates
    // ============================================================

    /// Same length and every component matches its slot
    [[nodiscard]] bool match(const Path& path) const noexcept;

    /// The first size() components of @p path match (path may be longer)
    [[nodiscard]] bool prefix_match(const Path& path) const noexcept;

    /// Every component @p path has matches its slot (path may be shorter)
    [[nodiscard]] bool partial_match(const Path& path) const noexcept;

    // ============================================================
    // Search
    // ============================================================

    /// Call @p visitor for every matching location in pre-order
    void find(const Value& root, const Visitor& visitor) const;

    [[nodiscard]] std::vector<Node> find(const Value& root) const;

    [[nodiscard]] std::optional<Node> find_first(const Value& root) const;

    [[nodiscard]] std::vector<Value> find_values(const Value& root) const;

    [[nodiscard]] std::optional<Value> find_first_value(const Value& root) const;

    /// `$` followed by every slot's textual form
    [[nodiscard]] std::string to_json() const;

    bool operator==(const PathMatcher& other) const { return components_ == other.components_; }

private:
    /// Visit matches until @p handler returns false
    /// @return false if the search was stopped early
    bool walk(const Value& current, std::size_t depth, const Path& path,
              const std::function<bool(const Path&, const Value&)>& handler) const;

    std::vector<ComponentMatcher> components_;
    bool allows_gaps_ = false;
};

TREEPATH_API std::ostream& operator<<(std::ostream& os, const PathMatcher& matcher);

} // namespace treepath
