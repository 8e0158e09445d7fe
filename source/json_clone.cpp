// json_clone.cpp - JSON-safe deep clone

#include <treepath/json_clone.h>

#include <stdexcept>

namespace treepath {

namespace {

// ============================================================
// JsonCloner - one traversal, optionally filtered by a replacer
// function or an allow-list of member names
// ============================================================

class JsonCloner {
public:
    JsonCloner(const JsonReplacer* replacer, const std::vector<std::string>* allowed_keys)
        : replacer_(replacer), allowed_keys_(allowed_keys) {}

    Value clone(std::string_view key, const Value& input) const
    {
        Value value = resolve(input);
        if (replacer_ && *replacer_) {
            value = (*replacer_)(key, value);
            value = resolve(value);
            if (value.is_opaque()) {
                throw std::invalid_argument("to_json() of " + std::string(value.type_name()) +
                                            " returned an opaque value");
            }
        }

        if (value.is_bigint()) {
            throw std::invalid_argument("BigInt value can't be serialized in JSON");
        }
        if (auto* arr = value.get_if<ValueArray>()) {
            return clone_array(*arr);
        }
        if (auto* obj = value.get_if<ValueObject>()) {
            return clone_object(*obj);
        }
        return value;
    }

private:
    static Value resolve(const Value& value)
    {
        if (auto* ref = value.get_if<OpaqueRef>()) {
            return *ref ? (*ref)->to_json() : Value{nullptr};
        }
        return value;
    }

    Value clone_array(const ValueArray& arr) const
    {
        auto trans = ValueArray{}.transient();
        std::size_t index = 0;
        for (const auto& item : arr) {
            Value cloned = clone(std::to_string(index++), item.get());
            trans.push_back(ValueBox{cloned.is_undefined() ? Value{nullptr} : std::move(cloned)});
        }
        return Value{trans.persistent()};
    }

    Value clone_object(const ValueObject& obj) const
    {
        ValueObject result;
        if (allowed_keys_) {
            for (const auto& key : *allowed_keys_) {
                const Value* member = obj.find(key);
                if (!member || result.contains(key)) {
                    continue;
                }
                Value cloned = clone(key, *member);
                if (!cloned.is_undefined()) {
                    result = result.set(key, std::move(cloned));
                }
            }
            return Value{std::move(result)};
        }
        for (const auto entry : obj) {
            Value cloned = clone(entry.key, entry.value);
            if (!cloned.is_undefined()) {
                result = result.set(entry.key, std::move(cloned));
            }
        }
        return Value{std::move(result)};
    }

    const JsonReplacer* replacer_;
    const std::vector<std::string>* allowed_keys_;
};

} // anonymous namespace

Value json_clone(const Value& value)
{
    return JsonCloner{nullptr, nullptr}.clone("", value);
}

Value json_clone(const Value& value, const JsonReplacer& replacer)
{
    return JsonCloner{&replacer, nullptr}.clone("", value);
}

Value json_clone(const Value& value, const std::vector<std::string>& allowed_keys)
{
    return JsonCloner{nullptr, &allowed_keys}.clone("", value);
}

} // namespace treepath
