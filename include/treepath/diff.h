// diff.h - Structural diff of two Value trees keyed by canonical paths

#pragma once

#include <treepath/api.h>
#include <treepath/ordered_map.h>
#include <treepath/path_matcher.h>

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace treepath {

/// Pruning predicate applied to every node of both trees before recursion
using DiffFilter = std::function<bool(const Path& path, const Value& value)>;

/// Accepts everything except Undefined
[[nodiscard]] TREEPATH_API bool default_diff_filter(const Path& path, const Value& value);

struct DiffConfig {
    DiffFilter filter = default_diff_filter;

    /// Declares extra leaves (e.g. opaque timestamp values); built-in
    /// primitives are always leaves
    std::function<bool(const Value& value, const Path& path)> is_primitive;

    /// Fallback equality for leaves that are not identical
    std::function<bool(const Value& a, const Value& b, const Path& path)> is_equal;

    /// Also report object / array nodes themselves, as `{}` / `[]`
    bool include_objects = false;
};

enum class ChangeType { Add, Remove, Modify };

struct Change {
    Path path;
    std::optional<Value> old_value;   // absent: no such leaf before
    std::optional<Value> new_value;   // absent: no such leaf after

    [[nodiscard]] ChangeType type() const noexcept {
        if (!old_value) return ChangeType::Add;
        if (!new_value) return ChangeType::Remove;
        return ChangeType::Modify;
    }

    [[nodiscard]] bool has_old() const noexcept { return old_value.has_value(); }
    [[nodiscard]] bool has_new() const noexcept { return new_value.has_value(); }

    [[nodiscard]] const Value& get_old() const {
        if (!old_value) throw std::runtime_error("Change: old value not available at " + path.to_json());
        return *old_value;
    }

    [[nodiscard]] const Value& get_new() const {
        if (!new_value) throw std::runtime_error("Change: new value not available at " + path.to_json());
        return *new_value;
    }

    bool operator==(const Change& other) const {
        return path == other.path && old_value == other.old_value && new_value == other.new_value;
    }
};

/// One step of a patch: write `value` at `path`, or unset `path` when the
/// value is absent
struct Patch {
    Path path;
    std::optional<Value> value;

    bool operator==(const Patch& other) const {
        return path == other.path && value == other.value;
    }
};

/// Canonical path string -> Change, in diff order
using Changeset = OrderedMap<Change>;

/// Canonical path string -> leaf location and value
using PathValueMap = OrderedMap<Node>;

// ============================================================
// Diff
//
// Two passes over canonical path strings:
//   1. collect the leaves of `before` in pre-order
//   2. walk `after` in pre-order; a leaf absent or different in `before`
//      becomes a change, a leaf equal in both is dropped
// Leaves of `before` never seen in step 2 are appended as removals, so the
// result lists every path touched in `after` first, then removed paths.
// ============================================================

class TREEPATH_API Diff {
public:
    enum class LeafKind { Primitive, Object, Array };

    using LeafVisitor = std::function<void(const Path& path, const Value& value, LeafKind kind)>;

    Diff() = default;
    explicit Diff(DiffConfig config) : config_(std::move(config)) {}

    [[nodiscard]] const DiffConfig& config() const noexcept { return config_; }

    /// @throws UnsupportedValueError for opaque values not claimed by is_primitive
    [[nodiscard]] Changeset changeset(const Value& before, const Value& after) const;

    /// Keys of changeset(before, after), in order
    [[nodiscard]] std::vector<std::string> changed_paths(const Value& before, const Value& after) const;

    /// Every leaf path of @p value
    [[nodiscard]] std::vector<std::string> all_paths(const Value& value) const;

    [[nodiscard]] PathValueMap paths_and_values(const Value& value) const;

    /// Minimal list of writes that turns @p before into @p after.
    /// A node whose kind changed (primitive, object, array or filtered out)
    /// is replaced as a whole; otherwise containers recurse, visiting the
    /// keys of @p before first and then the keys only @p after has.
    /// @throws UnsupportedValueError for opaque values not claimed by is_primitive
    [[nodiscard]] std::vector<Patch> patch(const Value& before, const Value& after) const;

    /// Pre-order leaf traversal honouring filter, is_primitive and
    /// include_objects. Container markers are reported as `{}` / `[]`.
    void collect_leaves(const Value& value, const LeafVisitor& visitor) const;

private:
    void collect_leaves(const Value& value, const Path& path, const LeafVisitor& visitor) const;

    [[nodiscard]] bool is_leaf(const Value& value, const Path& path) const;

    /// Kind of the node at @p path, std::nullopt when the filter rejects it
    [[nodiscard]] std::optional<LeafKind> classify(const Value& value, const Path& path) const;

    void patch_node(const Path& path, const Value* before, const Value* after,
                    std::vector<Patch>& out) const;

    DiffConfig config_;
};

/// Print changes to stdout, one per line
TREEPATH_API void print_changes(const Changeset& changes);

} // namespace treepath
