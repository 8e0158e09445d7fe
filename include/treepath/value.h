// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief JSON-shaped tree value used by Path, PathMatcher and Diff.
///
/// A Value is one of:
/// - Undefined (std::monostate): an absent leaf, distinct from null
/// - Null (std::nullptr_t)
/// - bool, number (double), std::string, BigInt
/// - ValueArray: persistent vector of boxed values (holes are Undefined)
/// - ValueObject: persistent, insertion-ordered string-keyed object
/// - Opaque: a host-specific atomic value (timestamps, money, ...)
///
/// Containers are immer persistent structures, so copying a Value is O(1)
/// and an unchanged subtree can be recognised by identity.

#pragma once

#include <treepath/treepath_config.h>
#include <treepath/api.h>

#include <immer/box.hpp>
#include <immer/flex_vector.hpp>
#include <immer/flex_vector_transient.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <iosfwd>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace treepath {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if TREEPATH_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if TREEPATH_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if TREEPATH_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

/// bool and the character types never stand for numbers or indices
template <typename T>
inline constexpr bool is_character_v =
    std::is_same_v<std::remove_cv_t<T>, bool> ||
    std::is_same_v<std::remove_cv_t<T>, char> ||
    std::is_same_v<std::remove_cv_t<T>, signed char> ||
    std::is_same_v<std::remove_cv_t<T>, unsigned char> ||
    std::is_same_v<std::remove_cv_t<T>, wchar_t> ||
    std::is_same_v<std::remove_cv_t<T>, char8_t> ||
    std::is_same_v<std::remove_cv_t<T>, char16_t> ||
    std::is_same_v<std::remove_cv_t<T>, char32_t>;

/// Single-threaded memory policy: non-atomic refcount, no locks
using memory_policy = immer::memory_policy<
    immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
    immer::unsafe_refcount_policy,
    immer::no_lock_policy
>;

struct Value;

using ValueBox   = immer::box<Value, memory_policy>;
using ValueArray = immer::flex_vector<ValueBox, memory_policy>;

/// Arbitrary precision integer, kept as its decimal digits
struct BigInt {
    std::string digits;

    bool operator==(const BigInt&) const = default;
};

/// Host-specific atomic value stored by reference.
///
/// Opaque values are not primitives for Diff: a DiffConfig::is_primitive
/// predicate has to claim them, otherwise traversal fails with
/// UnsupportedValueError naming type_name().
class TREEPATH_API OpaqueValue {
public:
    virtual ~OpaqueValue() = default;

    /// Name reported in diagnostics (the "constructor name")
    [[nodiscard]] virtual std::string_view type_name() const noexcept = 0;

    /// JSON representation used by to_json() and json_clone()
    [[nodiscard]] virtual Value to_json() const = 0;
};

using OpaqueRef = std::shared_ptr<const OpaqueValue>;

// ============================================================
// ValueObject - insertion-ordered persistent object
//
// Lookup goes through an immer::map, iteration follows a persistent
// key vector so that traversal order equals insertion order.
// ============================================================

class TREEPATH_API ValueObject {
public:
    using entry_map = immer::map<std::string, ValueBox,
                                 std::hash<std::string>,
                                 std::equal_to<std::string>,
                                 memory_policy>;
    using key_vector = immer::flex_vector<std::string, memory_policy>;

    struct Entry {
        const std::string& key;
        const Value& value;
    };

    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = Entry;
        using difference_type   = std::ptrdiff_t;
        using pointer           = void;
        using reference         = Entry;

        const_iterator() = default;
        const_iterator(const entry_map* entries, key_vector::const_iterator it)
            : entries_(entries), it_(it) {}

        Entry operator*() const;

        const_iterator& operator++() { ++it_; return *this; }
        const_iterator operator++(int) { auto copy = *this; ++it_; return copy; }

        bool operator==(const const_iterator& other) const { return it_ == other.it_; }
        bool operator!=(const const_iterator& other) const { return it_ != other.it_; }

    private:
        const entry_map* entries_ = nullptr;
        key_vector::const_iterator it_;
    };

    ValueObject() = default;

    [[nodiscard]] std::size_t size() const noexcept { return keys_.size(); }
    [[nodiscard]] bool empty() const noexcept { return keys_.empty(); }

    /// @return Pointer to the member, or nullptr when absent
    [[nodiscard]] const Value* find(const std::string& key) const;
    [[nodiscard]] bool contains(const std::string& key) const { return entries_.count(key) > 0; }

    /// Insert or replace; a new key is appended to the iteration order
    [[nodiscard]] ValueObject set(const std::string& key, Value val) const;

    /// Remove a key; returns *this unchanged if the key is absent
    [[nodiscard]] ValueObject erase(const std::string& key) const;

    [[nodiscard]] const key_vector& keys() const noexcept { return keys_; }

    [[nodiscard]] const_iterator begin() const { return {&entries_, keys_.begin()}; }
    [[nodiscard]] const_iterator end() const { return {&entries_, keys_.end()}; }

    /// O(1) identity: both objects share the same persistent storage
    [[nodiscard]] bool same_storage(const ValueObject& other) const noexcept {
        return entries_.impl().root == other.entries_.impl().root &&
               entries_.impl().size == other.entries_.impl().size &&
               keys_.impl().root == other.keys_.impl().root &&
               keys_.impl().tail == other.keys_.impl().tail;
    }

private:
    ValueObject(entry_map entries, key_vector keys)
        : entries_(std::move(entries)), keys_(std::move(keys)) {}

    entry_map entries_;
    key_vector keys_;
};

// ============================================================
// Value
// ============================================================

struct TREEPATH_API Value
{
    std::variant<std::monostate,
                 std::nullptr_t,
                 bool,
                 double,
                 std::string,
                 BigInt,
                 ValueArray,
                 ValueObject,
                 OpaqueRef>
        data;

    /// Undefined
    Value() noexcept : data(std::monostate{}) {}
    Value(std::nullptr_t) noexcept : data(nullptr) {}
    Value(bool v) noexcept : data(v) {}

    /// Every arithmetic type is stored as a double (JSON number)
    template <typename T>
        requires(std::is_arithmetic_v<T> && !is_character_v<T>)
    Value(T v) noexcept : data(static_cast<double>(v)) {}

    /// Characters are neither numbers nor strings
    template <typename T>
        requires(is_character_v<T> && !std::is_same_v<T, bool>)
    Value(T) = delete;

    Value(const std::string& v) : data(v) {}
    Value(std::string&& v) noexcept : data(std::move(v)) {}
    Value(const char* v) : data(std::in_place_type<std::string>, v) {}
    Value(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    Value(BigInt v) : data(std::move(v)) {}
    Value(ValueArray v) : data(std::move(v)) {}
    Value(ValueObject v) : data(std::move(v)) {}
    Value(OpaqueRef v) : data(std::move(v)) {}

    template <std::derived_from<OpaqueValue> T>
    Value(std::shared_ptr<T> v) : data(OpaqueRef{std::move(v)}) {}

    // Factory functions

    static Value undefined() { return Value{}; }
    static Value null() { return Value{nullptr}; }

    /// Build an object, keeping the order of @p init
    static Value object(std::initializer_list<std::pair<std::string, Value>> init);

    static Value array(std::initializer_list<Value> init);

    static Value bigint(std::string digits) { return Value{BigInt{std::move(digits)}}; }

    // Type queries

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] std::size_t type_index() const noexcept { return data.index(); }
    [[nodiscard]] bool is_undefined() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_null() const noexcept { return is<std::nullptr_t>(); }
    [[nodiscard]] bool is_nullish() const noexcept { return is_undefined() || is_null(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<double>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_bigint() const noexcept { return is<BigInt>(); }
    [[nodiscard]] bool is_array() const noexcept { return is<ValueArray>(); }
    [[nodiscard]] bool is_object() const noexcept { return is<ValueObject>(); }
    [[nodiscard]] bool is_opaque() const noexcept { return is<OpaqueRef>(); }
    [[nodiscard]] bool is_container() const noexcept { return is_array() || is_object(); }

    /// Built-in primitive: undefined, null, bool, number, string or bigint
    [[nodiscard]] bool is_primitive() const noexcept { return !is_container() && !is_opaque(); }

    /// "undefined", "null", "boolean", "number", "string", "bigint",
    /// "array", "object", or the opaque value's own type name
    [[nodiscard]] std::string_view type_name() const noexcept;

    // Typed accessors

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::int64_t as_int(std::int64_t default_val = 0) const {
        if (auto* p = get_if<double>()) return static_cast<std::int64_t>(*p);
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] ValueArray as_array(ValueArray default_val = {}) const {
        if (auto* p = get_if<ValueArray>()) return *p;
        log_mismatch("Value::as_array");
        return default_val;
    }

    [[nodiscard]] ValueObject as_object(ValueObject default_val = {}) const {
        if (auto* p = get_if<ValueObject>()) return *p;
        log_mismatch("Value::as_object");
        return default_val;
    }

    [[nodiscard]] OpaqueRef as_opaque() const {
        if (auto* p = get_if<OpaqueRef>()) return *p;
        log_mismatch("Value::as_opaque");
        return nullptr;
    }

    // Member access; a miss yields Undefined

    [[nodiscard]] Value at(const std::string& key) const;
    [[nodiscard]] Value at(std::size_t index) const;

    [[nodiscard]] bool contains(const std::string& key) const {
        if (auto* o = get_if<ValueObject>()) return o->contains(key);
        return false;
    }

    [[nodiscard]] bool contains(std::size_t index) const {
        if (auto* a = get_if<ValueArray>()) return index < a->size();
        return false;
    }

    /// Persistent update; type mismatches are logged and return *this
    [[nodiscard]] Value set(const std::string& key, Value val) const;
    [[nodiscard]] Value set(std::size_t index, Value val) const;

    [[nodiscard]] std::size_t size() const {
        if (auto* o = get_if<ValueObject>()) return o->size();
        if (auto* a = get_if<ValueArray>()) return a->size();
        return 0;
    }

private:
    /// Container accessors on a defined value of another type are logged;
    /// Undefined silently yields the default
    void log_mismatch(std::string_view func) const noexcept;
};

inline ValueObject::Entry ValueObject::const_iterator::operator*() const
{
    const std::string& key = *it_;
    return Entry{key, entries_->find(key)->get()};
}

// ============================================================
// Comparison
// ============================================================

/// Deep structural equality (object key order is not significant)
[[nodiscard]] TREEPATH_API bool operator==(const Value& a, const Value& b);

/// Identity comparison used by Diff:
/// - primitives compare by value (NaN is never identical)
/// - containers compare by shared persistent storage
/// - opaque values compare by pointer
[[nodiscard]] TREEPATH_API bool identical(const Value& a, const Value& b);

// ============================================================
// Utility functions
// ============================================================

/// Compact, human-readable rendering (Undefined prints as `undefined`)
[[nodiscard]] TREEPATH_API std::string value_to_string(const Value& val);

/// Shortest round-trip rendering of a number (integers without fraction)
[[nodiscard]] TREEPATH_API std::string number_to_string(double number);

/// Print Value with indentation
TREEPATH_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

TREEPATH_API std::ostream& operator<<(std::ostream& os, const Value& val);

} // namespace treepath
