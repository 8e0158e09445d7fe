// test_diff.cpp - Tests for Diff changesets, leaf collection and configuration

#include <catch2/catch_all.hpp>
#include <treepath/diff.h>
#include <treepath/json_clone.h>

#include <cmath>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace treepath;

namespace {

class Timestamp : public OpaqueValue {
public:
    explicit Timestamp(std::string iso) : iso_(std::move(iso)) {}

    std::string_view type_name() const noexcept override { return "Timestamp"; }
    Value to_json() const override { return Value{iso_}; }

private:
    std::string iso_;
};

Value timestamp(const std::string& iso)
{
    return Value{std::make_shared<Timestamp>(iso)};
}

} // namespace

// ============================================================
// Basic changesets
// ============================================================

TEST_CASE("Diff end-to-end", "[diff]") {
    const Value before = Value::object({{"id", 1}, {"name", Value::object({{"first", "a"}})}});
    const Value after = Value::object({{"id", 2}, {"name", Value::object({{"first", "a"}, {"last", "b"}})}});

    const auto changes = Diff{}.changeset(before, after);
    REQUIRE(changes.keys() == std::vector<std::string>{"$.id", "$.name.last"});

    const auto& id = changes.at("$.id");
    REQUIRE(id.type() == ChangeType::Modify);
    REQUIRE(id.get_old() == Value{1});
    REQUIRE(id.get_new() == Value{2});

    const auto& last = changes.at("$.name.last");
    REQUIRE(last.type() == ChangeType::Add);
    REQUIRE_FALSE(last.has_old());
    REQUIRE(last.get_new() == Value{"b"});
    REQUIRE_THROWS_AS(last.get_old(), std::runtime_error);
    REQUIRE(last.path == Path::of("name", "last"));
}

TEST_CASE("Diff change kinds", "[diff]") {
    const Diff diff;

    SECTION("removals follow the changes found in the new tree") {
        const auto changes = diff.changeset(Value::object({{"a", 1}, {"b", 2}, {"c", 3}}),
                                            Value::object({{"b", 20}}));
        REQUIRE(changes.keys() == std::vector<std::string>{"$.b", "$.a", "$.c"});
        REQUIRE(changes.at("$.a").type() == ChangeType::Remove);
        REQUIRE(changes.at("$.a").get_old() == Value{1});
        REQUIRE_FALSE(changes.at("$.c").has_new());
    }

    SECTION("array items are compared by index") {
        const auto changes = diff.changeset(Value::array({1, 2, 3}), Value::array({1, 3}));
        REQUIRE(changes.keys() == std::vector<std::string>{"$[1]", "$[2]"});
        REQUIRE(changes.at("$[1]").type() == ChangeType::Modify);
        REQUIRE(changes.at("$[2]").type() == ChangeType::Remove);
    }

    SECTION("null is a present value") {
        const auto changes = diff.changeset(Value::object({{"a", nullptr}}), Value::object({}));
        REQUIRE(changes.size() == 1);
        REQUIRE(changes.at("$.a").has_old());
        REQUIRE(changes.at("$.a").get_old().is_null());
    }

    SECTION("undefined values are ignored by the default filter") {
        REQUIRE(diff.changeset(Value::object({{"a", Value{}}}), Value::object({})).empty());
    }

    SECTION("a primitive replaced by a container") {
        const auto changes = diff.changeset(Value::object({{"a", 1}}),
                                            Value::object({{"a", Value::object({{"b", 1}})}}));
        REQUIRE(changes.keys() == std::vector<std::string>{"$.a.b", "$.a"});
    }

    SECTION("root primitives") {
        const auto changes = diff.changeset(Value{1}, Value{2});
        REQUIRE(changes.keys() == std::vector<std::string>{"$"});
    }

    SECTION("keys with special characters use canonical paths") {
        const auto changes = diff.changeset(Value::object({}), Value::object({{"a b", 1}}));
        REQUIRE(changes.keys() == std::vector<std::string>{R"($["a b"])"});
    }
}

// ============================================================
// Properties
// ============================================================

TEST_CASE("Diff idempotence and symmetry", "[diff][property]") {
    const Diff diff;
    const std::vector<Value> trees{
        Value{},
        Value{"scalar"},
        Value::object({{"a", 1}, {"list", Value::array({1, Value::object({{"x", true}})})}}),
        Value::object({{"a", 2}, {"list", Value::array({Value::object({{"x", false}}), 3, 4})}, {"b", nullptr}}),
        Value::array({Value::array({}), Value::object({})}),
    };

    SECTION("a tree never differs from itself or its clone") {
        for (const auto& a : trees) {
            REQUIRE(diff.changeset(a, a).empty());
            REQUIRE(diff.changeset(a, json_clone(a)).empty());
        }
    }

    SECTION("reversing the arguments swaps old and new") {
        for (const auto& a : trees) {
            for (const auto& b : trees) {
                const auto forward = diff.changeset(a, b);
                const auto backward = diff.changeset(b, a);
                REQUIRE(forward.size() == backward.size());
                for (const auto& [key, change] : forward) {
                    INFO(key);
                    const Change* reversed = backward.find(key);
                    REQUIRE(reversed != nullptr);
                    REQUIRE(reversed->old_value == change.new_value);
                    REQUIRE(reversed->new_value == change.old_value);
                }
            }
        }
    }
}

// ============================================================
// Configuration
// ============================================================

TEST_CASE("Diff filter prunes subtrees", "[diff][config]") {
    DiffConfig config;
    config.filter = [](const Path& path, const Value&) {
        return path.empty() || !elements_equal(path.component_at(0), PathElement{std::string("secret")});
    };
    const Diff diff{config};

    const auto changes = diff.changeset(Value::object({{"secret", 1}, {"a", 1}}),
                                        Value::object({{"secret", 2}, {"a", 2}}));
    REQUIRE(changes.keys() == std::vector<std::string>{"$.a"});
}

TEST_CASE("Diff include_objects reports container markers", "[diff][config]") {
    DiffConfig config;
    config.include_objects = true;
    const Diff diff{config};

    SECTION("new containers are added as markers") {
        const auto changes = diff.changeset(Value::object({}),
                                            Value::object({{"a", Value::object({{"b", Value::array({1})}})}}));
        REQUIRE(changes.keys() == std::vector<std::string>{"$.a", "$.a.b", "$.a.b[0]"});
        REQUIRE(changes.at("$.a").get_new() == Value::object({}));
        REQUIRE(changes.at("$.a.b").get_new() == Value::array({}));
    }

    SECTION("unchanged containers are not reported") {
        const auto changes = diff.changeset(Value::object({{"a", Value::object({{"b", 1}})}}),
                                            Value::object({{"a", Value::object({{"b", 2}})}}));
        REQUIRE(changes.keys() == std::vector<std::string>{"$.a.b"});
    }

    SECTION("an object replaced by an array is a modification") {
        const auto changes = diff.changeset(Value::object({{"a", Value::object({})}}),
                                            Value::object({{"a", Value::array({})}}));
        REQUIRE(changes.keys() == std::vector<std::string>{"$.a"});
        REQUIRE(changes.at("$.a").type() == ChangeType::Modify);
        REQUIRE(changes.at("$.a").get_old() == Value::object({}));
    }

    SECTION("all paths include containers") {
        REQUIRE(diff.all_paths(Value::object({{"a", Value::array({1})}})) ==
                std::vector<std::string>{"$.a", "$.a[0]"});
    }
}

TEST_CASE("Diff opaque values", "[diff][config]") {
    const Value before = Value::object({{"at", timestamp("2024-01-01")}});
    const Value after = Value::object({{"at", timestamp("2024-01-01")}});

    SECTION("unclaimed opaque values are rejected") {
        REQUIRE_THROWS_AS(Diff{}.changeset(before, after), UnsupportedValueError);
        try {
            (void)Diff{}.all_paths(before);
            FAIL("expected UnsupportedValueError");
        } catch (const UnsupportedValueError& e) {
            REQUIRE(e.type_name() == "Timestamp");
            REQUIRE(std::string(e.what()) ==
                    R"(only primitives, arrays and plain objects are supported, got "Timestamp")");
        }
    }

    DiffConfig config;
    config.is_primitive = [](const Value& value, const Path&) { return value.is_opaque(); };

    SECTION("claimed opaque values compare by identity") {
        const auto changes = Diff{config}.changeset(before, after);
        REQUIRE(changes.keys() == std::vector<std::string>{"$.at"});
        REQUIRE(Diff{config}.changeset(before, before).empty());
    }

    SECTION("is_equal decides between distinct leaves") {
        config.is_equal = [](const Value& a, const Value& b, const Path&) {
            if (a.is_opaque() && b.is_opaque()) {
                return a.as_opaque()->to_json() == b.as_opaque()->to_json();
            }
            return false;
        };
        REQUIRE(Diff{config}.changeset(before, after).empty());
        REQUIRE(Diff{config}.changeset(before, Value::object({{"at", timestamp("2025-01-01")}})).size() == 1);
    }
}

TEST_CASE("Diff is_equal on numbers", "[diff][config]") {
    DiffConfig config;
    config.is_equal = [](const Value& a, const Value& b, const Path&) {
        return a.is_number() && b.is_number() && std::abs(a.as_number() - b.as_number()) < 0.01;
    };
    const Diff diff{config};

    REQUIRE(diff.changeset(Value::array({1.0, 2.0}), Value::array({1.001, 3.0})).keys() ==
            std::vector<std::string>{"$[1]"});
}

// ============================================================
// Patch
// ============================================================

TEST_CASE("Diff patch", "[diff][patch]") {
    const Diff diff;
    const Value object = Value::object({
        {"string", "string"},
        {"undefined", Value{}},
        {"object", Value::object({{"number", 1}})},
        {"array", Value::array({1, Value::object({{"boolean", true}})})},
    });

    SECTION("a new value replaces the root") {
        REQUIRE(diff.patch(Value{}, Value{"string"}) == std::vector<Patch>{{Path::root(), Value{"string"}}});
        REQUIRE(diff.patch(Value{}, object) == std::vector<Patch>{{Path::root(), object}});
    }

    SECTION("nested modifications") {
        Value clone = json_clone(object);
        Path::of("object").unset(clone);
        Path::of("array", 1, "boolean").set(clone, false);
        Path::of("array", 1, "newProp").set(clone, "newProp");

        REQUIRE(diff.patch(object, clone) == std::vector<Patch>{
            {Path::of("object"), std::nullopt},
            {Path::of("array", 1, "boolean"), Value{false}},
            {Path::of("array", 1, "newProp"), Value{"newProp"}},
        });
        REQUIRE(diff.patch(clone, object) == std::vector<Patch>{
            {Path::of("array", 1, "boolean"), Value{true}},
            {Path::of("array", 1, "newProp"), std::nullopt},
            {Path::of("object"), Value::object({{"number", 1}})},
        });
    }

    SECTION("applying a patch reproduces the new tree") {
        const Value target = Value::object({
            {"string", "other"},
            {"array", Value::array({1})},
            {"added", Value::array({Value::object({{"x", 1}})})},
        });
        Value result = object;
        for (const auto& step : diff.patch(object, target)) {
            INFO(step.path.to_json());
            if (step.value) {
                step.path.set(result, *step.value);
            } else {
                step.path.unset(result);
            }
        }
        REQUIRE(diff.changeset(result, target).empty());
    }

    SECTION("equal trees need no patch") {
        REQUIRE(diff.patch(object, object).empty());
        REQUIRE(diff.patch(object, json_clone(object)).empty());
        REQUIRE(diff.patch(Value{}, Value{}).empty());
    }
}

TEST_CASE("Diff patch on type changes", "[diff][patch]") {
    const Diff diff;

    SECTION("array to object") {
        const Value after = Value::object({{"0", 1}});
        REQUIRE(diff.patch(Value::array({1}), after) == std::vector<Patch>{{Path::root(), after}});
    }

    SECTION("object to array") {
        const Value after = Value::array({1});
        REQUIRE(diff.patch(Value::object({{"0", 1}}), after) == std::vector<Patch>{{Path::root(), after}});
    }

    SECTION("string to object") {
        const Value after = Value::object({{"string", "string"}});
        REQUIRE(diff.patch(Value{"string"}, after) == std::vector<Patch>{{Path::root(), after}});
    }

    SECTION("object to boolean") {
        REQUIRE(diff.patch(Value::object({{"boolean", true}}), Value{true}) ==
                std::vector<Patch>{{Path::root(), Value{true}}});
    }

    SECTION("value to undefined unsets") {
        REQUIRE(diff.patch(Value::object({{"a", 1}}), Value{}) ==
                std::vector<Patch>{{Path::root(), std::nullopt}});
    }
}

TEST_CASE("Diff patch honours the configuration", "[diff][patch][config]") {
    SECTION("filtered nodes are treated as missing") {
        DiffConfig config;
        config.filter = [](const Path& path, const Value& value) {
            return !value.is_undefined() &&
                   (path.empty() || !elements_equal(path.component_at(0), PathElement{std::string("secret")}));
        };
        const auto steps = Diff{config}.patch(Value::object({{"secret", 1}, {"a", 1}}),
                                              Value::object({{"secret", 2}, {"a", 2}}));
        REQUIRE(steps == std::vector<Patch>{{Path::of("a"), Value{2}}});
    }

    SECTION("is_equal suppresses leaf writes") {
        DiffConfig config;
        config.is_equal = [](const Value& a, const Value& b, const Path&) {
            return a.is_number() && b.is_number() && std::abs(a.as_number() - b.as_number()) < 0.01;
        };
        REQUIRE(Diff{config}.patch(Value::array({1.0, 2.0}), Value::array({1.001, 3.0})) ==
                std::vector<Patch>{{Path::of(1), Value{3.0}}});
    }

    SECTION("opaque values need is_primitive") {
        const Value before = Value::object({{"at", timestamp("2024-01-01")}});
        const Value after = Value::object({{"at", timestamp("2025-01-01")}});
        REQUIRE_THROWS_AS(Diff{}.patch(before, after), UnsupportedValueError);

        DiffConfig config;
        config.is_primitive = [](const Value& value, const Path&) { return value.is_opaque(); };
        const auto steps = Diff{config}.patch(before, after);
        REQUIRE(steps.size() == 1);
        REQUIRE(steps[0].path == Path::of("at"));
        REQUIRE(identical(*steps[0].value, after.at("at")));
    }
}

// ============================================================
// Leaf listings
// ============================================================

TEST_CASE("Diff all_paths and paths_and_values", "[diff][paths]") {
    const Diff diff;
    const Value tree = Value::object({{"a", 1}, {"b", Value::array({"x", Value::object({{"c", true}})})}});

    SECTION("all_paths lists leaves in pre-order") {
        REQUIRE(diff.all_paths(tree) == std::vector<std::string>{"$.a", "$.b[0]", "$.b[1].c"});
        REQUIRE(diff.all_paths(Value{5}) == std::vector<std::string>{"$"});
        REQUIRE(diff.all_paths(Value::object({})).empty());
    }

    SECTION("paths_and_values") {
        const auto leaves = diff.paths_and_values(tree);
        REQUIRE(leaves.keys() == std::vector<std::string>{"$.a", "$.b[0]", "$.b[1].c"});
        REQUIRE(leaves.at("$.b[1].c").value == Value{true});
        REQUIRE(leaves.at("$.b[1].c").path == Path::of("b", 1, "c"));
    }

    SECTION("changed_paths equals the changeset keys") {
        const Value other = Value::object({{"a", 2}});
        REQUIRE(diff.changed_paths(tree, other) == diff.changeset(tree, other).keys());
    }
}
