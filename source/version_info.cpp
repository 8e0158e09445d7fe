// version_info.cpp - cached change information between two versions

#include <treepath/version_info.h>
#include <treepath/path_parser.h>

#include <algorithm>

namespace treepath {

VersionInfo::VersionInfo(Value current, std::optional<Value> previous, VersionInfoConfig config)
    : current_(std::move(current))
    , previous_(std::move(previous))
    , config_(std::move(config))
{}

VersionInfo VersionInfo::map(const std::function<Value(const Value&)>& fn,
                             std::optional<VersionInfoConfig> config) const
{
    std::optional<Value> previous;
    if (previous_) {
        previous = fn(*previous_);
    }
    return VersionInfo{fn(current_), std::move(previous), config ? std::move(*config) : config_};
}

const std::optional<Changeset>& VersionInfo::changes() const
{
    if (!changes_) {
        if (previous_) {
            changes_.emplace(config_.diff.changeset(*previous_, current_));
        } else {
            changes_.emplace(std::nullopt);
        }
    }
    return *changes_;
}

const std::optional<std::vector<std::string>>& VersionInfo::changed_paths() const
{
    if (!changed_paths_) {
        const auto& changes = this->changes();
        if (changes) {
            changed_paths_.emplace(changes->keys());
        } else {
            changed_paths_.emplace(std::nullopt);
        }
    }
    return *changed_paths_;
}

const std::vector<std::string>& VersionInfo::paths() const
{
    if (!paths_) {
        if (const auto& changed = changed_paths()) {
            paths_ = *changed;
        } else {
            paths_ = config_.diff.all_paths(current_);
        }
    }
    return *paths_;
}

const std::optional<Value>& VersionInfo::previous_values() const
{
    if (!previous_values_) {
        std::optional<Value> result;
        if (previous_ && !config_.previous_values.empty()) {
            for (const auto& [key, change] : *changes()) {
                const bool selected = std::any_of(
                    config_.previous_values.begin(), config_.previous_values.end(),
                    [&](const PathMatcher& m) { return m.match(change.path); });
                if (!selected) {
                    continue;
                }
                if (!result) {
                    result = previous_->is_array() ? Value{ValueArray{}} : Value{ValueObject{}};
                }
                change.path.set(*result, change.old_value.value_or(Value{}));
            }
        }
        previous_values_.emplace(std::move(result));
    }
    return *previous_values_;
}

bool VersionInfo::matches(const PathMatcher& matcher) const
{
    if (previous_) {
        const auto& changes = *this->changes();
        return std::any_of(changes.begin(), changes.end(), [&](const auto& entry) {
            return matcher.prefix_match(entry.second.path);
        });
    }
    return matcher.find_first(current_).has_value();
}

bool VersionInfo::matches(std::string_view expression) const
{
    return matches(parse_path_matcher(expression));
}

bool VersionInfo::matches_any(const std::vector<PathMatcher>& matchers) const
{
    return std::any_of(matchers.begin(), matchers.end(),
                       [&](const PathMatcher& m) { return matches(m); });
}

bool VersionInfo::matches_any(const std::vector<std::string>& expressions) const
{
    return std::any_of(expressions.begin(), expressions.end(),
                       [&](const std::string& e) { return matches(std::string_view{e}); });
}

Value VersionInfo::to_json() const
{
    Value changed;
    if (const auto& paths = changed_paths()) {
        auto trans = ValueArray{}.transient();
        for (const auto& path : *paths) {
            trans.push_back(ValueBox{Value{path}});
        }
        changed = Value{trans.persistent()};
    }
    return Value::object({
        {"current", current_},
        {"changedPaths", changed},
        {"previous", previous_values().value_or(Value{})},
    });
}

} // namespace treepath
