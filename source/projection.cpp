// projection.cpp - include / exclude projection

#include <treepath/projection.h>
#include <treepath/json_clone.h>

#include <algorithm>

namespace treepath {

namespace {

/// Drop Undefined items from every array in the tree
Value remove_gaps(const Value& value)
{
    if (auto* arr = value.get_if<ValueArray>()) {
        auto trans = ValueArray{}.transient();
        for (const auto& item : *arr) {
            if (!item.get().is_undefined()) {
                trans.push_back(ValueBox{remove_gaps(item.get())});
            }
        }
        return Value{trans.persistent()};
    }
    if (auto* obj = value.get_if<ValueObject>()) {
        ValueObject result = *obj;
        for (const auto entry : *obj) {
            if (entry.value.is_container()) {
                result = result.set(entry.key, remove_gaps(entry.value));
            }
        }
        return Value{std::move(result)};
    }
    return value;
}

} // anonymous namespace

Projection::Projection(std::vector<PathMatcher> includes, std::vector<PathMatcher> excludes)
    : includes_(std::move(includes))
    , excludes_(std::move(excludes))
{
    auto gaps = [](const PathMatcher& m) { return m.allows_gaps(); };
    allows_gaps_ = std::any_of(includes_.begin(), includes_.end(), gaps) ||
                   std::any_of(excludes_.begin(), excludes_.end(), gaps);
}

Projection Projection::of(std::vector<PathMatcher> includes, std::vector<PathMatcher> excludes)
{
    return Projection{std::move(includes), std::move(excludes)};
}

Value Projection::map(const Value& input) const
{
    Value output;
    if (!includes_.empty()) {
        const Value source = json_clone(input);
        output = Value{ValueObject{}};
        for (const auto& include : includes_) {
            for (const auto& node : include.find(source)) {
                node.path.set(output, node.value);
            }
        }
    } else {
        output = excludes_.empty() ? input : json_clone(input);
    }

    for (const auto& exclude : excludes_) {
        for (const auto& node : exclude.find(output)) {
            node.path.unset(output);
        }
    }

    if (allows_gaps_) {
        return remove_gaps(output);
    }
    return output;
}

bool Projection::match(const Path& path) const
{
    if (!includes_.empty() &&
        std::none_of(includes_.begin(), includes_.end(),
                     [&](const PathMatcher& m) { return m.partial_match(path); })) {
        return false;
    }
    return std::none_of(excludes_.begin(), excludes_.end(),
                        [&](const PathMatcher& m) { return m.prefix_match(path); });
}

} // namespace treepath
