// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.cpp
/// @brief Path construction, canonical form and get/set/unset navigation.

#include <treepath/path.h>
#include <treepath/serialization.h>

#include <cmath>
#include <limits>
#include <ostream>
#include <stdexcept>

namespace treepath {

// ============================================================
// Component helpers
// ============================================================

bool is_valid_identifier(std::string_view str) noexcept
{
    if (str.empty()) {
        return false;
    }
    auto is_start = [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    };
    if (!is_start(str.front())) {
        return false;
    }
    for (char c : str.substr(1)) {
        if (!is_start(c) && !(c >= '0' && c <= '9')) {
            return false;
        }
    }
    return true;
}

std::string property_to_string(std::string_view property)
{
    if (is_valid_identifier(property)) {
        return "." + std::string(property);
    }
    return "[\"" + json_escape_string(std::string(property)) + "\"]";
}

std::string index_to_string(std::size_t index)
{
    return "[" + std::to_string(index) + "]";
}

std::string component_to_string(const PathElement& elem)
{
    if (auto* idx = std::get_if<std::size_t>(&elem)) {
        return index_to_string(*idx);
    }
    return property_to_string(std::get<std::string>(elem));
}

std::optional<std::size_t> parse_index(std::string_view str) noexcept
{
    if (str.empty() || (str.size() > 1 && str.front() == '0')) {
        return std::nullopt;
    }
    std::size_t value = 0;
    constexpr auto max = std::numeric_limits<std::size_t>::max();
    for (char c : str) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        const auto digit = static_cast<std::size_t>(c - '0');
        if (value > (max - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

bool elements_equal(const PathElement& a, const PathElement& b) noexcept
{
    if (a.index() == b.index()) {
        return a == b;
    }
    const auto* key = std::get_if<std::string>(&a);
    const auto* idx = std::get_if<std::size_t>(&b);
    if (!key) {
        key = std::get_if<std::string>(&b);
        idx = std::get_if<std::size_t>(&a);
    }
    auto parsed = parse_index(*key);
    return parsed && *parsed == *idx;
}

// ============================================================
// Construction and derivation
// ============================================================

Path Path::from_values(const std::vector<Value>& components)
{
    Path result;
    for (const auto& component : components) {
        if (auto* str = component.get_if<std::string>()) {
            result = result.property(*str);
        } else if (auto* num = component.get_if<double>()) {
            result = result.index(*num);
        } else {
            throw PathError("Expected component to be a string or an integer, got " +
                            std::string(component.type_name()) + ": " + value_to_string(component));
        }
    }
    return result;
}

Path Path::property(std::string name) const
{
    return child(PathElement{std::move(name)});
}

Path Path::index(double i) const
{
    if (!(i >= 0) || std::trunc(i) != i ||
        i >= static_cast<double>(std::numeric_limits<std::size_t>::max())) {
        throw PathError("Expected index to be an integer >= 0, got " + number_to_string(i));
    }
    return child(PathElement{static_cast<std::size_t>(i)});
}

Path Path::child(PathElement elem) const
{
    return Path{elements_.push_back(std::move(elem))};
}

std::optional<Path> Path::parent() const
{
    if (elements_.empty()) {
        return std::nullopt;
    }
    return Path{elements_.take(elements_.size() - 1)};
}

Path Path::concat(const Path& other) const
{
    return Path{elements_ + other.elements_};
}

Path Path::connect_to(const Path& prefix) const
{
    return Path{prefix.elements_ + elements_};
}

const PathElement& Path::component_at(std::size_t i) const
{
    if (i >= elements_.size()) {
        throw std::out_of_range("Path component " + std::to_string(i) +
                                " out of range for " + to_json());
    }
    return elements_[i];
}

bool Path::equals(const Path& other) const noexcept
{
    if (elements_.size() != other.elements_.size()) {
        return false;
    }
    auto it = other.elements_.begin();
    for (const auto& elem : elements_) {
        if (!elements_equal(elem, *it++)) {
            return false;
        }
    }
    return true;
}

std::string Path::to_json() const
{
    std::string result = "$";
    for (const auto& elem : elements_) {
        result += component_to_string(elem);
    }
    return result;
}

std::ostream& operator<<(std::ostream& os, const Path& path)
{
    return os << path.to_json();
}

// ============================================================
// Navigation
// ============================================================

namespace {

/// Array slot addressed by @p elem, if any
std::optional<std::size_t> array_slot(const PathElement& elem)
{
    if (auto* idx = std::get_if<std::size_t>(&elem)) {
        return *idx;
    }
    return parse_index(std::get<std::string>(elem));
}

std::string object_key(const PathElement& elem)
{
    if (auto* idx = std::get_if<std::size_t>(&elem)) {
        return std::to_string(*idx);
    }
    return std::get<std::string>(elem);
}

Value child_of(const Value& current, const PathElement& elem)
{
    if (auto* obj = current.get_if<ValueObject>()) {
        if (auto* found = obj->find(object_key(elem))) {
            return *found;
        }
        return Value{};
    }
    if (auto* arr = current.get_if<ValueArray>()) {
        auto slot = array_slot(elem);
        if (slot && *slot < arr->size()) {
            return (*arr)[*slot].get();
        }
    }
    return Value{};
}

Value empty_container_for(const PathElement& elem)
{
    if (std::holds_alternative<std::size_t>(elem)) {
        return Value{ValueArray{}};
    }
    return Value{ValueObject{}};
}

/// Write @p child into @p container (an object or array) at @p elem
Value write_child(const Value& container, const PathElement& elem, Value child, const Path& where)
{
    if (auto* obj = container.get_if<ValueObject>()) {
        return Value{obj->set(object_key(elem), std::move(child))};
    }

    const auto& arr = std::get<ValueArray>(container.data);
    auto slot = array_slot(elem);
    if (!slot) {
        throw PathError("Cannot set property " + component_to_string(elem) +
                        " on an array at " + where.to_json());
    }
    if (*slot < arr.size()) {
        return Value{arr.set(*slot, ValueBox{std::move(child)})};
    }
    if (*slot - arr.size() > max_array_padding) {
        throw PathError("Cannot set index " + std::to_string(*slot) + " on an array of size " +
                        std::to_string(arr.size()) + " at " + where.to_json() +
                        ": more than " + std::to_string(max_array_padding) + " holes");
    }
    auto trans = arr.transient();
    while (trans.size() < *slot) {
        trans.push_back(ValueBox{});
    }
    trans.push_back(ValueBox{std::move(child)});
    return Value{trans.persistent()};
}

/// Recursive helper for Path::set with a defined value
Value set_recursive(const Path& path, std::size_t path_index, const Value& current,
                    Value new_val, Path& where)
{
    if (path_index >= path.size()) {
        return new_val;
    }

    const auto& elem = path.component_at(path_index);
    Value container = current;
    if (current.is_nullish()) {
        container = empty_container_for(elem);
    } else if (!current.is_container()) {
        throw PathError("Cannot set " + path.to_json() + ": " + where.to_json() +
                        " is a " + std::string(current.type_name()));
    }

    Path child_where = where.child(elem);
    Value new_child = set_recursive(path, path_index + 1, child_of(container, elem),
                                    std::move(new_val), child_where);
    return write_child(container, elem, std::move(new_child), where);
}

/// Remove the trailing run of Undefined entries
ValueArray truncate_undefined_tail(ValueArray arr)
{
    std::size_t size = arr.size();
    while (size > 0 && arr[size - 1].get().is_undefined()) {
        --size;
    }
    if (size == arr.size()) {
        return arr;
    }
    return arr.take(size);
}

/// Recursive helper for Path::unset; returns std::nullopt when nothing changed
std::optional<Value> unset_recursive(const Path& path, std::size_t path_index, const Value& current)
{
    if (!current.is_container()) {
        return std::nullopt;
    }

    const auto& elem = path.component_at(path_index);

    if (path_index + 1 < path.size()) {
        auto updated = unset_recursive(path, path_index + 1, child_of(current, elem));
        if (!updated) {
            return std::nullopt;
        }
        if (auto* obj = current.get_if<ValueObject>()) {
            return Value{obj->set(object_key(elem), std::move(*updated))};
        }
        const auto& arr = std::get<ValueArray>(current.data);
        return Value{arr.set(*array_slot(elem), ValueBox{std::move(*updated)})};
    }

    if (auto* obj = current.get_if<ValueObject>()) {
        auto key = object_key(elem);
        if (!obj->contains(key)) {
            return std::nullopt;
        }
        return Value{obj->erase(key)};
    }

    const auto& arr = std::get<ValueArray>(current.data);
    auto slot = array_slot(elem);
    if (!slot || *slot >= arr.size()) {
        return std::nullopt;
    }
    return Value{truncate_undefined_tail(arr.set(*slot, ValueBox{}))};
}

} // anonymous namespace

Value Path::get(const Value& root) const
{
    Value current = root;
    for (const auto& elem : elements_) {
        if (!current.is_container()) {
            return Value{};
        }
        current = child_of(current, elem);
    }
    return current;
}

Value& Path::set(Value& root, Value value) const
{
    if (elements_.empty()) {
        root = std::move(value);
        return root;
    }
    if (value.is_undefined()) {
        return unset(root);
    }
    Path where;
    root = set_recursive(*this, 0, root, std::move(value), where);
    return root;
}

Value& Path::unset(Value& root) const
{
    if (elements_.empty()) {
        root = Value{};
        return root;
    }
    if (auto updated = unset_recursive(*this, 0, root)) {
        root = std::move(*updated);
    }
    return root;
}

} // namespace treepath
