// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_matcher.cpp
/// @brief Component matchers and PathMatcher search.

#include <treepath/path_matcher.h>
#include <treepath/serialization.h>

#include <algorithm>
#include <ostream>

namespace treepath {

// ============================================================
// UnionMatcher
// ============================================================

UnionMatcher::UnionMatcher(std::vector<PathElement> members)
    : members_(std::move(members))
{
    if (members_.size() < 2) {
        throw PathError("Expected at least 2 union members, got " + std::to_string(members_.size()));
    }
}

bool UnionMatcher::test(const PathElement& component) const noexcept
{
    return std::any_of(members_.begin(), members_.end(), [&](const PathElement& member) {
        return elements_equal(member, component);
    });
}

bool UnionMatcher::allows_gaps() const noexcept
{
    return std::any_of(members_.begin(), members_.end(), [](const PathElement& member) {
        return std::holds_alternative<std::size_t>(member);
    });
}

std::string UnionMatcher::to_string() const
{
    std::string result = "[";
    bool first = true;
    for (const auto& member : members_) {
        if (!first) result += ",";
        first = false;
        if (auto* idx = std::get_if<std::size_t>(&member)) {
            result += std::to_string(*idx);
        } else {
            result += "\"" + json_escape_string(std::get<std::string>(member)) + "\"";
        }
    }
    return result + "]";
}

bool UnionMatcher::operator==(const UnionMatcher& other) const
{
    return members_ == other.members_;
}

// ============================================================
// ComponentMatcher
// ============================================================

ComponentMatcher::ComponentMatcher(const PathElement& elem)
{
    if (auto* idx = std::get_if<std::size_t>(&elem)) {
        matcher_ = *idx;
    } else {
        matcher_ = std::get<std::string>(elem);
    }
}

bool ComponentMatcher::test(const PathElement& component) const noexcept
{
    return std::visit([&](const auto& m) -> bool {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, AnyProperty>) {
            return std::holds_alternative<std::string>(component);
        } else if constexpr (std::is_same_v<T, AnyIndex>) {
            return std::holds_alternative<std::size_t>(component);
        } else if constexpr (std::is_same_v<T, UnionMatcher>) {
            return m.test(component);
        } else {
            return elements_equal(PathElement{m}, component);
        }
    }, matcher_);
}

bool ComponentMatcher::allows_gaps() const noexcept
{
    if (std::holds_alternative<std::size_t>(matcher_) || std::holds_alternative<AnyIndex>(matcher_)) {
        return true;
    }
    if (auto* u = std::get_if<UnionMatcher>(&matcher_)) {
        return u->allows_gaps();
    }
    return false;
}

std::string ComponentMatcher::to_string() const
{
    return std::visit([](const auto& m) -> std::string {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, AnyProperty>) {
            return ".*";
        } else if constexpr (std::is_same_v<T, AnyIndex>) {
            return "[*]";
        } else if constexpr (std::is_same_v<T, UnionMatcher>) {
            return m.to_string();
        } else if constexpr (std::is_same_v<T, std::size_t>) {
            return index_to_string(m);
        } else {
            return property_to_string(m);
        }
    }, matcher_);
}

// ============================================================
// PathMatcher
// ============================================================

PathMatcher::PathMatcher(std::vector<ComponentMatcher> components)
    : components_(std::move(components))
    , allows_gaps_(std::any_of(components_.begin(), components_.end(),
                               [](const ComponentMatcher& c) { return c.allows_gaps(); }))
{}

bool PathMatcher::match(const Path& path) const noexcept
{
    return path.size() == components_.size() && prefix_match(path);
}

bool PathMatcher::prefix_match(const Path& path) const noexcept
{
    if (path.size() < components_.size()) {
        return false;
    }
    auto it = path.begin();
    for (const auto& component : components_) {
        if (!component.test(*it++)) {
            return false;
        }
    }
    return true;
}

bool PathMatcher::partial_match(const Path& path) const noexcept
{
    auto it = path.begin();
    for (std::size_t i = 0; i < components_.size() && it != path.end(); ++i) {
        if (!components_[i].test(*it++)) {
            return false;
        }
    }
    return true;
}

bool PathMatcher::walk(const Value& current, std::size_t depth, const Path& path,
                       const std::function<bool(const Path&, const Value&)>& handler) const
{
    if (depth == components_.size()) {
        return handler(path, current);
    }
    return components_[depth].select(current, [&](const PathElement& elem, const Value& child) {
        return walk(child, depth + 1, path.child(elem), handler);
    });
}

void PathMatcher::find(const Value& root, const Visitor& visitor) const
{
    walk(root, 0, Path::root(), [&](const Path& path, const Value& value) {
        visitor(path, value);
        return true;
    });
}

std::vector<Node> PathMatcher::find(const Value& root) const
{
    std::vector<Node> results;
    walk(root, 0, Path::root(), [&](const Path& path, const Value& value) {
        results.push_back(Node{path, value});
        return true;
    });
    return results;
}

std::optional<Node> PathMatcher::find_first(const Value& root) const
{
    std::optional<Node> result;
    walk(root, 0, Path::root(), [&](const Path& path, const Value& value) {
        result = Node{path, value};
        return false;
    });
    return result;
}

std::vector<Value> PathMatcher::find_values(const Value& root) const
{
    std::vector<Value> results;
    walk(root, 0, Path::root(), [&](const Path&, const Value& value) {
        results.push_back(value);
        return true;
    });
    return results;
}

std::optional<Value> PathMatcher::find_first_value(const Value& root) const
{
    std::optional<Value> result;
    walk(root, 0, Path::root(), [&](const Path&, const Value& value) {
        result = value;
        return false;
    });
    return result;
}

std::string PathMatcher::to_json() const
{
    std::string result = "$";
    for (const auto& component : components_) {
        result += component.to_string();
    }
    return result;
}

std::ostream& operator<<(std::ostream& os, const PathMatcher& matcher)
{
    return os << matcher.to_json();
}

} // namespace treepath
