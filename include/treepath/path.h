// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.h
/// @brief Immutable address into a Value tree.
///
/// A Path is an ordered sequence of components, each either a property key
/// (std::string) or an array index (std::size_t). Paths are persistent
/// values: every derivation returns a new Path sharing structure with the
/// old one.
///
/// ## Canonical string form
/// ```
/// $                       root
/// $.name                  identifier property
/// $["with space"]         any other property, JSON-escaped
/// $.items[0]              index
/// ```
///
/// ## Index normalization
/// Components compare with index normalization: the property "3" equals the
/// index 3. Only canonical numerals ("0", "17", not "017") take part.
///
/// ## Usage
/// ```cpp
/// auto p = Path::of("users", 0, "name");
/// Value name = p.get(root);
/// p.set(root, "Alice");       // rebinds root to the updated tree
/// p.unset(root);
/// ```

#pragma once

#include <treepath/value.h>
#include <treepath/errors.h>

#include <concepts>
#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace treepath {

// ============================================================
// PathElement
// ============================================================

/// A single path component: a property key or an array index
using PathElement = std::variant<std::string, std::size_t>;

/// Most Undefined holes Path::set() will add when extending an array
inline constexpr std::size_t max_array_padding = std::size_t{1} << 20;

/// Integer usable as an array index; bool and character types are not
template <typename T>
concept IndexInteger = std::integral<T> && !is_character_v<T>;

/// Property key or integral index accepted by Path::of()
template <typename T>
concept PathComponentLike =
    std::convertible_to<T, std::string_view> ||
    std::same_as<std::remove_cvref_t<T>, std::string> ||
    std::same_as<std::remove_cvref_t<T>, PathElement> ||
    IndexInteger<std::remove_cvref_t<T>>;

/// True for `^[a-zA-Z_][a-zA-Z0-9_]*$`
[[nodiscard]] TREEPATH_API bool is_valid_identifier(std::string_view str) noexcept;

/// `.name` for identifiers, `["escaped"]` otherwise
[[nodiscard]] TREEPATH_API std::string property_to_string(std::string_view property);

/// `[n]`
[[nodiscard]] TREEPATH_API std::string index_to_string(std::size_t index);

[[nodiscard]] TREEPATH_API std::string component_to_string(const PathElement& elem);

/// Parse a canonical index numeral ("0" or digits without a leading zero)
/// @return The index, or std::nullopt if @p str is not such a numeral
[[nodiscard]] TREEPATH_API std::optional<std::size_t> parse_index(std::string_view str) noexcept;

/// Component equality with index normalization
[[nodiscard]] TREEPATH_API bool elements_equal(const PathElement& a, const PathElement& b) noexcept;

// ============================================================
// Path
// ============================================================

class TREEPATH_API Path {
public:
    using value_type     = PathElement;
    using container_type = immer::flex_vector<PathElement, memory_policy>;
    using const_iterator = container_type::const_iterator;
    using iterator       = const_iterator;
    using size_type      = std::size_t;

    /// Root path `$`
    Path() = default;

    [[nodiscard]] static Path root() { return Path{}; }

    /// Build a path from property keys and indices.
    /// @throws PathError on a negative index
    template <PathComponentLike... Components>
    [[nodiscard]] static Path of(Components&&... components) {
        Path result;
        (result.append(std::forward<Components>(components)), ...);
        return result;
    }

    /// Build a path from runtime values (strings and non-negative integers).
    /// @throws PathError on any other value
    [[nodiscard]] static Path from_values(const std::vector<Value>& components);

    // ============================================================
    // Derivation
    // ============================================================

    [[nodiscard]] Path property(std::string name) const;

    template <IndexInteger I>
    [[nodiscard]] Path index(I i) const {
        if constexpr (std::is_signed_v<I>) {
            if (i < 0) {
                throw PathError("Expected index to be an integer >= 0, got " + std::to_string(i));
            }
        }
        return child(PathElement{static_cast<std::size_t>(i)});
    }

    /// @throws PathError unless @p i is a non-negative integer
    [[nodiscard]] Path index(double i) const;

    [[nodiscard]] Path child(PathElement elem) const;

    /// @return Path without the last component, or std::nullopt for the root
    [[nodiscard]] std::optional<Path> parent() const;

    /// this followed by every component of @p other
    [[nodiscard]] Path concat(const Path& other) const;

    /// @p prefix followed by this
    [[nodiscard]] Path connect_to(const Path& prefix) const;

    // ============================================================
    // Access
    // ============================================================

    [[nodiscard]] std::size_t size() const noexcept { return elements_.size(); }
    [[nodiscard]] std::size_t length() const noexcept { return elements_.size(); }
    [[nodiscard]] bool empty() const noexcept { return elements_.empty(); }

    /// @throws std::out_of_range if @p i >= size()
    [[nodiscard]] const PathElement& component_at(std::size_t i) const;

    [[nodiscard]] const PathElement& back() const { return elements_.back(); }

    [[nodiscard]] const_iterator begin() const { return elements_.begin(); }
    [[nodiscard]] const_iterator end() const { return elements_.end(); }

    [[nodiscard]] bool equals(const Path& other) const noexcept;

    bool operator==(const Path& other) const noexcept { return equals(other); }

    /// Canonical string form
    [[nodiscard]] std::string to_json() const;

    // ============================================================
    // Navigation
    // ============================================================

    /// Resolve against @p root; a miss yields Undefined
    [[nodiscard]] Value get(const Value& root) const;

    /// Write @p value at this path, creating intermediate containers.
    ///
    /// - A nullish intermediate becomes `[]` before an index, `{}` before a property
    /// - An existing object is kept even before an index (numeric key)
    /// - Writing Undefined is unset(): nothing is created for it
    ///
    /// @return @p root, rebound to the updated tree
    /// @throws PathError when an intermediate is a primitive or opaque value,
    ///         a non-numeral property addresses an array, or an index lies
    ///         more than max_array_padding slots past the end of an array
    Value& set(Value& root, Value value) const;

    /// Delete the property, or clear the array slot and drop the trailing
    /// run of Undefined entries. Missing intermediates make this a no-op.
    /// @return @p root
    Value& unset(Value& root) const;

private:
    explicit Path(container_type elements) : elements_(std::move(elements)) {}

    template <typename T>
    void append(T&& component) {
        using U = std::remove_cvref_t<T>;
        if constexpr (std::is_same_v<U, PathElement>) {
            elements_ = elements_.push_back(std::forward<T>(component));
        } else if constexpr (std::is_integral_v<U>) {
            elements_ = index(component).elements_;
        } else {
            elements_ = elements_.push_back(PathElement{std::string(std::string_view(component))});
        }
    }

    container_type elements_;
};

TREEPATH_API std::ostream& operator<<(std::ostream& os, const Path& path);

} // namespace treepath
