// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file matchers.h
/// @brief Per-slot matchers of a PathMatcher.
///
/// A ComponentMatcher is one of:
/// - literal property (std::string) or literal index (std::size_t)
/// - any_property: every key of an object, never an array index
/// - any_index: every index of an array, never an object key
/// - UnionMatcher: any of two or more literal components
///
/// Literals compare with index normalization (see path.h).

#pragma once

#include <treepath/path.h>

#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace treepath {

struct AnyIndex {
    bool operator==(const AnyIndex&) const = default;
};

struct AnyProperty {
    bool operator==(const AnyProperty&) const = default;
};

inline constexpr AnyIndex any_index{};
inline constexpr AnyProperty any_property{};

// ============================================================
// UnionMatcher
// ============================================================

class TREEPATH_API UnionMatcher {
public:
    /// @throws PathError with fewer than two members
    explicit UnionMatcher(std::vector<PathElement> members);

    /// UnionMatcher::of("a", "b", 1)
    /// @throws PathError on a negative index or fewer than two members
    template <PathComponentLike... Components>
    [[nodiscard]] static UnionMatcher of(Components&&... components) {
        const Path path = Path::of(std::forward<Components>(components)...);
        return UnionMatcher{std::vector<PathElement>(path.begin(), path.end())};
    }

    [[nodiscard]] bool test(const PathElement& component) const noexcept;

    /// True when any member is an index
    [[nodiscard]] bool allows_gaps() const noexcept;

    /// `[m1,m2,...]` with JSON-quoted properties
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] const std::vector<PathElement>& members() const noexcept { return members_; }

    bool operator==(const UnionMatcher& other) const;

private:
    std::vector<PathElement> members_;
};

// ============================================================
// ComponentMatcher
// ============================================================

class TREEPATH_API ComponentMatcher {
public:
    using matcher_type = std::variant<std::string, std::size_t, AnyProperty, AnyIndex, UnionMatcher>;

    ComponentMatcher(std::string property) : matcher_(std::move(property)) {}
    ComponentMatcher(const char* property) : matcher_(std::string(property)) {}
    ComponentMatcher(std::string_view property) : matcher_(std::string(property)) {}
    ComponentMatcher(AnyProperty) : matcher_(AnyProperty{}) {}
    ComponentMatcher(AnyIndex) : matcher_(AnyIndex{}) {}
    ComponentMatcher(UnionMatcher matcher) : matcher_(std::move(matcher)) {}
    ComponentMatcher(const PathElement& elem);

    /// @throws PathError on a negative index
    template <IndexInteger I>
    ComponentMatcher(I index) : matcher_(std::size_t{0}) {
        if constexpr (std::is_signed_v<I>) {
            if (index < 0) {
                throw PathError("Expected index to be an integer >= 0, got " + std::to_string(index));
            }
        }
        matcher_ = static_cast<std::size_t>(index);
    }

    [[nodiscard]] bool test(const PathElement& component) const noexcept;

    /// True for literal indices, any_index and index-containing unions
    [[nodiscard]] bool allows_gaps() const noexcept;

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] const matcher_type& matcher() const noexcept { return matcher_; }

    /// Invoke @p callback(component, child) for every child of @p current
    /// this slot selects, in traversal order.
    /// @return false as soon as @p callback returns false
    template <typename Callback>
    bool select(const Value& current, Callback&& callback) const;

    bool operator==(const ComponentMatcher& other) const { return matcher_ == other.matcher_; }

private:
    matcher_type matcher_;
};

namespace detail {

/// Visit the child of @p current addressed by a literal component.
/// Properties resolve into objects, and into arrays when they are numerals;
/// indices resolve into arrays, and into objects as numeric keys.
template <typename Callback>
bool select_literal(const Value& current, const PathElement& literal, Callback& callback)
{
    if (auto* obj = current.get_if<ValueObject>()) {
        const std::string key = std::holds_alternative<std::string>(literal)
                                    ? std::get<std::string>(literal)
                                    : std::to_string(std::get<std::size_t>(literal));
        if (auto* found = obj->find(key)) {
            return callback(PathElement{key}, *found);
        }
        return true;
    }
    if (auto* arr = current.get_if<ValueArray>()) {
        std::optional<std::size_t> slot;
        if (auto* idx = std::get_if<std::size_t>(&literal)) {
            slot = *idx;
        } else {
            slot = parse_index(std::get<std::string>(literal));
        }
        if (slot && *slot < arr->size()) {
            return callback(PathElement{*slot}, (*arr)[*slot].get());
        }
    }
    return true;
}

} // namespace detail

template <typename Callback>
bool ComponentMatcher::select(const Value& current, Callback&& callback) const
{
    return std::visit([&](const auto& m) -> bool {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, AnyProperty>) {
            if (auto* obj = current.get_if<ValueObject>()) {
                for (const auto entry : *obj) {
                    if (!callback(PathElement{entry.key}, entry.value)) {
                        return false;
                    }
                }
            }
            return true;
        } else if constexpr (std::is_same_v<T, AnyIndex>) {
            if (auto* arr = current.get_if<ValueArray>()) {
                std::size_t index = 0;
                for (const auto& item : *arr) {
                    if (!callback(PathElement{index++}, item.get())) {
                        return false;
                    }
                }
            }
            return true;
        } else if constexpr (std::is_same_v<T, UnionMatcher>) {
            for (const auto& member : m.members()) {
                if (!detail::select_literal(current, member, callback)) {
                    return false;
                }
            }
            return true;
        } else {
            return detail::select_literal(current, PathElement{m}, callback);
        }
    }, matcher_);
}

} // namespace treepath
