// value.cpp - Value construction, comparison and printing

#include <treepath/value.h>

#include <charconv>
#include <cmath>
#include <iostream>
#include <new>
#include <sstream>

namespace treepath {

// ============================================================
// ValueObject
// ============================================================

const Value* ValueObject::find(const std::string& key) const
{
    if (auto* box = entries_.find(key)) {
        return &box->get();
    }
    return nullptr;
}

ValueObject ValueObject::set(const std::string& key, Value val) const
{
    if (entries_.count(key) > 0) {
        return ValueObject{entries_.set(key, ValueBox{std::move(val)}), keys_};
    }
    return ValueObject{entries_.set(key, ValueBox{std::move(val)}), keys_.push_back(key)};
}

ValueObject ValueObject::erase(const std::string& key) const
{
    if (entries_.count(key) == 0) {
        return *this;
    }
    auto remaining = key_vector{}.transient();
    for (const auto& k : keys_) {
        if (k != key) remaining.push_back(k);
    }
    return ValueObject{entries_.erase(key), remaining.persistent()};
}

// ============================================================
// Value factories and access
// ============================================================

Value Value::object(std::initializer_list<std::pair<std::string, Value>> init)
{
    ValueObject obj;
    for (const auto& [key, val] : init) {
        obj = obj.set(key, val);
    }
    return Value{std::move(obj)};
}

Value Value::array(std::initializer_list<Value> init)
{
    auto t = ValueArray{}.transient();
    for (const auto& val : init) {
        t.push_back(ValueBox{val});
    }
    return Value{t.persistent()};
}

std::string_view Value::type_name() const noexcept
{
    return std::visit([](const auto& arg) -> std::string_view {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "undefined";
        } else if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return "boolean";
        } else if constexpr (std::is_same_v<T, double>) {
            return "number";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "string";
        } else if constexpr (std::is_same_v<T, BigInt>) {
            return "bigint";
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            return "array";
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            return "object";
        } else {
            return arg ? arg->type_name() : std::string_view{"null"};
        }
    }, data);
}

void Value::log_mismatch(std::string_view func) const noexcept
{
    if (is_undefined()) {
        return;
    }
#if TREEPATH_VERBOSE_LOG
    try {
        detail::log_access_error(func, "type mismatch, value holds " + std::string(type_name()));
    } catch (const std::bad_alloc&) {
        detail::log_access_error(func, "type mismatch");
    }
#else
    (void)func;
#endif
}

Value Value::at(const std::string& key) const
{
    if (auto* obj = get_if<ValueObject>()) {
        if (auto* found = obj->find(key)) {
            return *found;
        }
        return Value{};
    }
    if (!is_nullish()) {
        detail::log_key_error("Value::at", key, "requested on a non-object value");
    }
    return Value{};
}

Value Value::at(std::size_t index) const
{
    if (auto* arr = get_if<ValueArray>()) {
        if (index < arr->size()) {
            return (*arr)[index].get();
        }
        return Value{};
    }
    if (!is_nullish()) {
        detail::log_index_error("Value::at", index, "requested on a non-array value");
    }
    return Value{};
}

Value Value::set(const std::string& key, Value val) const
{
    if (auto* obj = get_if<ValueObject>()) {
        return Value{obj->set(key, std::move(val))};
    }
    detail::log_key_error("Value::set", key, "cannot be set on a non-object value");
    return *this;
}

Value Value::set(std::size_t index, Value val) const
{
    if (auto* arr = get_if<ValueArray>()) {
        if (index < arr->size()) {
            return Value{arr->set(index, ValueBox{std::move(val)})};
        }
        detail::log_index_error("Value::set", index, "out of range");
        return *this;
    }
    detail::log_index_error("Value::set", index, "cannot be set on a non-array value");
    return *this;
}

// ============================================================
// Comparison
// ============================================================

bool operator==(const Value& a, const Value& b)
{
    if (a.data.index() != b.data.index()) {
        return false;
    }

    return std::visit([&](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.data);

        if constexpr (std::is_same_v<T, std::monostate> || std::is_same_v<T, std::nullptr_t>) {
            return true;
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            if (lhs.size() != rhs.size()) return false;
            for (std::size_t i = 0; i < lhs.size(); ++i) {
                if (!(lhs[i].get() == rhs[i].get())) return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            if (lhs.same_storage(rhs)) return true;
            if (lhs.size() != rhs.size()) return false;
            for (const auto entry : lhs) {
                const Value* other = rhs.find(entry.key);
                if (!other || !(entry.value == *other)) return false;
            }
            return true;
        } else {
            return lhs == rhs;
        }
    }, a.data);
}

bool identical(const Value& a, const Value& b)
{
    if (a.data.index() != b.data.index()) {
        return false;
    }

    return std::visit([&](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.data);

        if constexpr (std::is_same_v<T, std::monostate> || std::is_same_v<T, std::nullptr_t>) {
            return true;
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            // O(1): same persistent root means same contents
            return lhs.impl().root == rhs.impl().root &&
                   lhs.impl().tail == rhs.impl().tail &&
                   lhs.impl().size == rhs.impl().size;
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            return lhs.same_storage(rhs);
        } else if constexpr (std::is_same_v<T, OpaqueRef>) {
            return lhs.get() == rhs.get();
        } else {
            // NaN != NaN, as for any IEEE comparison
            return lhs == rhs;
        }
    }, a.data);
}

// ============================================================
// Printing
// ============================================================

std::string number_to_string(double number)
{
    if (std::isnan(number)) return "NaN";
    if (std::isinf(number)) return number > 0 ? "Infinity" : "-Infinity";
    if (number == 0.0) return "0";

    char buffer[64];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), number);
    if (ec != std::errc{}) {
        std::ostringstream oss;
        oss << number;
        return oss.str();
    }
    return std::string(buffer, end);
}

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "undefined";
        } else if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, double>) {
            return number_to_string(arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, BigInt>) {
            return arg.digits + "n";
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            std::string out = "[";
            bool first = true;
            for (const auto& item : arg) {
                if (!first) out += ",";
                first = false;
                out += value_to_string(item.get());
            }
            return out + "]";
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            std::string out = "{";
            bool first = true;
            for (const auto entry : arg) {
                if (!first) out += ",";
                first = false;
                out += entry.key + ":" + value_to_string(entry.value);
            }
            return out + "}";
        } else {
            return "<" + std::string(arg ? arg->type_name() : "opaque") + ">";
        }
    }, val.data);
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    const std::string indent(depth * 2, ' ');

    if (auto* obj = val.get_if<ValueObject>()) {
        std::cout << indent << prefix << "{\n";
        for (const auto entry : *obj) {
            print_value(entry.value, entry.key + ": ", depth + 1);
        }
        std::cout << indent << "}\n";
    } else if (auto* arr = val.get_if<ValueArray>()) {
        std::cout << indent << prefix << "[\n";
        std::size_t index = 0;
        for (const auto& item : *arr) {
            print_value(item.get(), "[" + std::to_string(index++) + "] ", depth + 1);
        }
        std::cout << indent << "]\n";
    } else {
        std::cout << indent << prefix << value_to_string(val) << "\n";
    }
}

std::ostream& operator<<(std::ostream& os, const Value& val)
{
    return os << value_to_string(val);
}

} // namespace treepath
