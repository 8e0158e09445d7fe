// diff.cpp - Structural diff of two Value trees

#include <treepath/diff.h>
#include <treepath/errors.h>

#include <algorithm>
#include <iostream>
#include <unordered_map>

namespace treepath {

bool default_diff_filter(const Path&, const Value& value)
{
    return !value.is_undefined();
}

namespace {

struct Leaf {
    Path path;
    std::string key;
    Value value;
    Diff::LeafKind kind;
};

Value base_value(const Value& value)
{
    if (value.is_object()) return Value{ValueObject{}};
    if (value.is_array()) return Value{ValueArray{}};
    return Value{};
}

} // anonymous namespace

// ============================================================
// Traversal
// ============================================================

bool Diff::is_leaf(const Value& value, const Path& path) const
{
    if (value.is_primitive()) {
        return true;
    }
    return config_.is_primitive && config_.is_primitive(value, path);
}

void Diff::collect_leaves(const Value& value, const LeafVisitor& visitor) const
{
    collect_leaves(value, Path::root(), visitor);
}

std::optional<Diff::LeafKind> Diff::classify(const Value& value, const Path& path) const
{
    const bool accepted = config_.filter ? config_.filter(path, value)
                                         : default_diff_filter(path, value);
    if (!accepted) {
        return std::nullopt;
    }
    if (is_leaf(value, path)) {
        return LeafKind::Primitive;
    }
    if (value.is_array()) {
        return LeafKind::Array;
    }
    if (value.is_object()) {
        return LeafKind::Object;
    }
    throw UnsupportedValueError(std::string(value.type_name()));
}

void Diff::collect_leaves(const Value& value, const Path& path, const LeafVisitor& visitor) const
{
    const auto kind = classify(value, path);
    if (!kind) {
        return;
    }

    switch (*kind) {
        case LeafKind::Primitive:
            visitor(path, value, LeafKind::Primitive);
            break;
        case LeafKind::Array: {
            if (config_.include_objects) {
                visitor(path, Value{ValueArray{}}, LeafKind::Array);
            }
            std::size_t index = 0;
            for (const auto& item : value.as_array()) {
                collect_leaves(item.get(), path.index(index++), visitor);
            }
            break;
        }
        case LeafKind::Object:
            if (config_.include_objects) {
                visitor(path, Value{ValueObject{}}, LeafKind::Object);
            }
            for (const auto entry : value.as_object()) {
                collect_leaves(entry.value, path.property(entry.key), visitor);
            }
            break;
    }
}

// ============================================================
// Changeset
// ============================================================

Changeset Diff::changeset(const Value& before, const Value& after) const
{
    std::vector<Leaf> before_leaves;
    std::unordered_map<std::string, std::size_t> before_index;

    collect_leaves(before, [&](const Path& path, const Value& value, LeafKind kind) {
        auto key = path.to_json();
        before_index.emplace(key, before_leaves.size());
        before_leaves.push_back(Leaf{path, std::move(key), value, kind});
    });

    std::vector<bool> consumed(before_leaves.size(), false);
    Changeset changes;

    collect_leaves(after, [&](const Path& path, const Value& value, LeafKind kind) {
        auto key = path.to_json();
        auto it = before_index.find(key);
        if (it == before_index.end() || consumed[it->second]) {
            changes.insert_or_assign(key, Change{path, std::nullopt, value});
            return;
        }

        consumed[it->second] = true;
        const Leaf& old_leaf = before_leaves[it->second];

        bool equal = old_leaf.kind == kind;
        if (equal && kind == LeafKind::Primitive) {
            equal = identical(old_leaf.value, value) ||
                    (config_.is_equal && config_.is_equal(old_leaf.value, value, path));
        }

        if (!equal) {
            changes.insert_or_assign(key, Change{path, old_leaf.value, value});
        }
    });

    for (std::size_t i = 0; i < before_leaves.size(); ++i) {
        if (!consumed[i]) {
            const Leaf& leaf = before_leaves[i];
            changes.insert_or_assign(leaf.key, Change{leaf.path, leaf.value, std::nullopt});
        }
    }

    return changes;
}

// ============================================================
// Patch
// ============================================================

void Diff::patch_node(const Path& path, const Value* before, const Value* after,
                      std::vector<Patch>& out) const
{
    static const Value missing;
    const Value& old_value = before ? *before : missing;
    const Value& new_value = after ? *after : missing;

    const auto old_kind = classify(old_value, path);
    const auto new_kind = classify(new_value, path);

    if (old_kind != new_kind) {
        if (new_kind) {
            out.push_back(Patch{path, new_value});
        } else {
            out.push_back(Patch{path, std::nullopt});
        }
        return;
    }
    if (!new_kind || identical(old_value, new_value)) {
        return;
    }

    switch (*new_kind) {
        case LeafKind::Primitive:
            if (!(config_.is_equal && config_.is_equal(old_value, new_value, path))) {
                out.push_back(Patch{path, new_value});
            }
            break;
        case LeafKind::Array: {
            const auto& old_arr = old_value.as_array();
            const auto& new_arr = new_value.as_array();
            const std::size_t count = std::max(old_arr.size(), new_arr.size());
            for (std::size_t i = 0; i < count; ++i) {
                patch_node(path.index(i),
                           i < old_arr.size() ? &old_arr[i].get() : nullptr,
                           i < new_arr.size() ? &new_arr[i].get() : nullptr,
                           out);
            }
            break;
        }
        case LeafKind::Object: {
            const auto& old_obj = old_value.as_object();
            const auto& new_obj = new_value.as_object();
            for (const auto entry : old_obj) {
                patch_node(path.property(entry.key), &entry.value, new_obj.find(entry.key), out);
            }
            for (const auto entry : new_obj) {
                if (!old_obj.find(entry.key)) {
                    patch_node(path.property(entry.key), nullptr, &entry.value, out);
                }
            }
            break;
        }
    }
}

std::vector<Patch> Diff::patch(const Value& before, const Value& after) const
{
    std::vector<Patch> result;
    patch_node(Path::root(), &before, &after, result);
    return result;
}

std::vector<std::string> Diff::changed_paths(const Value& before, const Value& after) const
{
    return changeset(before, after).keys();
}

std::vector<std::string> Diff::all_paths(const Value& value) const
{
    return changed_paths(base_value(value), value);
}

PathValueMap Diff::paths_and_values(const Value& value) const
{
    PathValueMap result;
    collect_leaves(value, [&](const Path& path, const Value& leaf, LeafKind) {
        result.insert_or_assign(path.to_json(), Node{path, leaf});
    });
    return result;
}

// ============================================================
// Printing
// ============================================================

void print_changes(const Changeset& changes)
{
    if (changes.empty()) {
        std::cout << "  (no changes)\n";
        return;
    }
    for (const auto& [key, change] : changes) {
        std::string type_str;
        switch (change.type()) {
            case ChangeType::Add:    type_str = "ADD   "; break;
            case ChangeType::Remove: type_str = "REMOVE"; break;
            case ChangeType::Modify: type_str = "MODIFY"; break;
        }
        std::cout << "  " << type_str << " " << key;
        if (change.type() == ChangeType::Modify) {
            std::cout << ": " << value_to_string(change.get_old()) << " -> " << value_to_string(change.get_new());
        } else if (change.type() == ChangeType::Add) {
            std::cout << ": " << value_to_string(change.get_new());
        } else {
            std::cout << ": " << value_to_string(change.get_old());
        }
        std::cout << "\n";
    }
}

} // namespace treepath
