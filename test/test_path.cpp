// test_path.cpp - Tests for Path construction, canonical form and navigation

#include <catch2/catch_all.hpp>
#include <treepath/path.h>
#include <treepath/serialization.h>

#include <string>
#include <vector>

using namespace treepath;

// ============================================================
// Construction
// ============================================================

TEST_CASE("Path construction", "[path]") {
    SECTION("root") {
        REQUIRE(Path::root().empty());
        REQUIRE(Path::root().to_json() == "$");
        REQUIRE(Path::of() == Path::root());
    }

    SECTION("of mixes properties and indices") {
        auto p = Path::of("users", 0, "name");
        REQUIRE(p.size() == 3);
        REQUIRE(std::get<std::string>(p.component_at(0)) == "users");
        REQUIRE(std::get<std::size_t>(p.component_at(1)) == 0);
    }

    SECTION("incremental construction") {
        auto p = Path::root().property("a").index(2).property("b");
        REQUIRE(p == Path::of("a", 2, "b"));
    }

    SECTION("negative index is rejected") {
        REQUIRE_THROWS_AS(Path::of("a", -1), PathError);
        REQUIRE_THROWS_AS(Path::root().index(-3), PathError);
    }

    SECTION("non-integer index is rejected") {
        REQUIRE_THROWS_AS(Path::root().index(1.5), PathError);
        REQUIRE(Path::root().index(2.0) == Path::of(2));
    }

    SECTION("from runtime values") {
        REQUIRE(Path::from_values({Value{"a"}, Value{1}}) == Path::of("a", 1));
        REQUIRE_THROWS_AS(Path::from_values({Value{true}}), PathError);
        REQUIRE_THROWS_AS(Path::from_values({Value{nullptr}}), PathError);
        REQUIRE_THROWS_AS(Path::from_values({Value{-1}}), PathError);
        REQUIRE_THROWS_AS(Path::from_values({Value{0.5}}), PathError);
    }

    SECTION("component_at out of range") {
        REQUIRE_THROWS_AS(Path::of("a").component_at(1), std::out_of_range);
    }
}

TEST_CASE("Path components exclude characters and bool", "[path]") {
    STATIC_REQUIRE(PathComponentLike<int>);
    STATIC_REQUIRE(PathComponentLike<std::size_t>);
    STATIC_REQUIRE(PathComponentLike<const char*>);
    STATIC_REQUIRE(PathComponentLike<std::string>);
    STATIC_REQUIRE_FALSE(PathComponentLike<char>);
    STATIC_REQUIRE_FALSE(PathComponentLike<char32_t>);
    STATIC_REQUIRE_FALSE(PathComponentLike<bool>);
    STATIC_REQUIRE_FALSE(IndexInteger<unsigned char>);
    STATIC_REQUIRE(IndexInteger<long long>);
}

TEST_CASE("Path derivation", "[path]") {
    const auto base = Path::of("a", 1);

    SECTION("parent") {
        REQUIRE(base.parent() == Path::of("a"));
        REQUIRE(Path::of("a").parent() == Path::root());
        REQUIRE_FALSE(Path::root().parent().has_value());
    }

    SECTION("child") {
        REQUIRE(base.child(PathElement{std::string("b")}) == Path::of("a", 1, "b"));
        REQUIRE(base.child(PathElement{std::size_t{7}}) == Path::of("a", 1, 7));
    }

    SECTION("concat and connect_to") {
        const auto tail = Path::of("x", 2);
        REQUIRE(base.concat(tail) == Path::of("a", 1, "x", 2));
        REQUIRE(base.connect_to(tail) == Path::of("x", 2, "a", 1));
    }

    SECTION("derivation never changes the original") {
        auto derived = base.property("c");
        REQUIRE(base.size() == 2);
        REQUIRE(derived.size() == 3);
    }

    SECTION("iteration is restartable") {
        std::vector<std::string> first;
        std::vector<std::string> second;
        for (const auto& elem : base) first.push_back(component_to_string(elem));
        for (const auto& elem : base) second.push_back(component_to_string(elem));
        REQUIRE(first == std::vector<std::string>{".a", "[1]"});
        REQUIRE(first == second);
    }
}

// ============================================================
// Equality and canonical form
// ============================================================

TEST_CASE("Path equality normalizes indices", "[path][equality]") {
    REQUIRE(Path::of("a", 1) == Path::of("a", "1"));
    REQUIRE(Path::of("0") == Path::of(0));
    REQUIRE_FALSE(Path::of("01") == Path::of(1));
    REQUIRE_FALSE(Path::of("a") == Path::of("a", "b"));
    REQUIRE_FALSE(Path::of("a") == Path::of("b"));
}

TEST_CASE("Path canonical string", "[path][json]") {
    REQUIRE(Path::of("a", 0, "b_c").to_json() == "$.a[0].b_c");
    REQUIRE(Path::of("s p a c e s", 5, "regular").to_json() == R"($["s p a c e s"][5].regular)");
    REQUIRE(Path::of("1abc").to_json() == R"($["1abc"])");
    REQUIRE(Path::of("").to_json() == R"($[""])");
    REQUIRE(Path::of("quote\"d").to_json() == R"($["quote\"d"])");
    REQUIRE(Path::of("line\nbreak").to_json() == R"($["line\nbreak"])");

    SECTION("identifier check") {
        REQUIRE(is_valid_identifier("_private1"));
        REQUIRE_FALSE(is_valid_identifier("9lives"));
        REQUIRE_FALSE(is_valid_identifier("a-b"));
        REQUIRE_FALSE(is_valid_identifier(""));
    }

    SECTION("index numerals") {
        REQUIRE(parse_index("0") == std::size_t{0});
        REQUIRE(parse_index("42") == std::size_t{42});
        REQUIRE_FALSE(parse_index("042").has_value());
        REQUIRE_FALSE(parse_index("-1").has_value());
        REQUIRE_FALSE(parse_index("").has_value());
        REQUIRE_FALSE(parse_index("99999999999999999999999").has_value());
    }
}

// ============================================================
// get
// ============================================================

TEST_CASE("Path get", "[path][get]") {
    const Value root = Value::object({
        {"users", Value::array({Value::object({{"name", "Alice"}})})},
        {"count", 1},
    });

    SECTION("root resolves to the root") {
        REQUIRE(Path::root().get(root) == root);
    }

    SECTION("existing locations") {
        REQUIRE(Path::of("users", 0, "name").get(root) == Value{"Alice"});
        REQUIRE(Path::of("count").get(root) == Value{1});
    }

    SECTION("misses are undefined, never errors") {
        REQUIRE(Path::of("missing").get(root).is_undefined());
        REQUIRE(Path::of("users", 3).get(root).is_undefined());
        REQUIRE(Path::of("count", "deeper").get(root).is_undefined());
        REQUIRE(Path::of("users", "name").get(root).is_undefined());
        REQUIRE(Path::of("a").get(Value{}).is_undefined());
    }

    SECTION("numeral properties address array items") {
        REQUIRE(Path::of("users", "0", "name").get(root) == Value{"Alice"});
    }

    SECTION("indices address numeric object keys") {
        const Value obj = Value::object({{"1", "one"}});
        REQUIRE(Path::of(1).get(obj) == Value{"one"});
    }
}

// ============================================================
// set / unset
// ============================================================

TEST_CASE("Path set", "[path][set]") {
    SECTION("creates intermediate containers by component kind") {
        Value root;
        Path::of("a", 1, "b").set(root, "x");
        REQUIRE(to_json(root, true) == R"({"a":[null,{"b":"x"}]})");
        REQUIRE(Path::of("a", 0).get(root).is_undefined());
    }

    SECTION("replaces a nullish root with a container") {
        Value root{nullptr};
        Path::of(2).set(root, true);
        REQUIRE(root.is_array());
        REQUIRE(root.size() == 3);
    }

    SECTION("empty path replaces the root") {
        Value root = Value::object({{"a", 1}});
        Path::root().set(root, 5);
        REQUIRE(root == Value{5});
    }

    SECTION("writes onto an existing object when an index is expected") {
        Value root = Value::object({{"list", Value::object({{"x", 1}})}});
        Path::of("list", 0).set(root, "zero");
        REQUIRE(root.at("list").is_object());
        REQUIRE(root.at("list").at("0") == Value{"zero"});
        REQUIRE(root.at("list").at("x") == Value{1});
    }

    SECTION("extends existing arrays") {
        Value root = Value::object({{"list", Value::array({1})}});
        Path::of("list", 3).set(root, 4);
        REQUIRE(root.at("list").size() == 4);
        REQUIRE(root.at("list").at(1).is_undefined());
        REQUIRE(root.at("list").at(3) == Value{4});
    }

    SECTION("numeral property writes into an array") {
        Value root = Value::array({1, 2});
        Path::of("1").set(root, 20);
        REQUIRE(root == Value::array({1, 20}));
    }

    SECTION("non-numeral property on an array is rejected") {
        Value root = Value::array({1});
        REQUIRE_THROWS_AS(Path::of("name").set(root, 1), PathError);
    }

    SECTION("huge indices are rejected instead of padding the array") {
        Value root = Value::object({{"a", Value::array({1})}});
        const Value snapshot = root;
        REQUIRE_THROWS_AS(Path::of("a", std::size_t{1} << 40).set(root, 1), PathError);
        REQUIRE(root == snapshot);

        Value fresh;
        REQUIRE_THROWS_AS(Path::of(max_array_padding + 1).set(fresh, 1), PathError);
        REQUIRE(fresh.is_undefined());

        Value edge;
        Path::of(max_array_padding).set(edge, 1);
        REQUIRE(edge.size() == max_array_padding + 1);
    }

    SECTION("setting through a primitive is rejected") {
        Value root = Value::object({{"a", 1}});
        REQUIRE_THROWS_AS(Path::of("a", "b").set(root, 2), PathError);
        REQUIRE(root.at("a") == Value{1});
    }

    SECTION("set never touches other references to the old tree") {
        Value root = Value::object({{"a", 1}});
        const Value snapshot = root;
        Path::of("a").set(root, 2);
        REQUIRE(snapshot.at("a") == Value{1});
        REQUIRE(root.at("a") == Value{2});
    }
}

TEST_CASE("Path unset", "[path][unset]") {
    SECTION("deletes an object property") {
        Value root = Value::object({{"a", 1}, {"b", 2}});
        Path::of("a").unset(root);
        REQUIRE(root == Value::object({{"b", 2}}));
    }

    SECTION("setting undefined is unset") {
        Value root = Value::object({{"a", 1}, {"b", 2}});
        Path::of("b").set(root, Value{});
        REQUIRE_FALSE(root.contains("b"));
    }

    SECTION("last index truncates the trailing undefined run") {
        Value root = Value::array({1, Value{}, 3});
        Path::of(2).unset(root);
        REQUIRE(root == Value::array({1}));
    }

    SECTION("interior index leaves a hole") {
        Value root = Value::array({1, 2, 3});
        Path::of(1).unset(root);
        REQUIRE(root.size() == 3);
        REQUIRE(root.at(1).is_undefined());
    }

    SECTION("missing intermediates are not materialized") {
        Value root = Value::object({{"a", 1}});
        Path::of("x", "y").set(root, Value{});
        REQUIRE(root == Value::object({{"a", 1}}));

        Value empty;
        Path::of("x", 0).unset(empty);
        REQUIRE(empty.is_undefined());
    }

    SECTION("nested unset rebuilds only the touched branch") {
        Value root = Value::object({{"a", Value::object({{"b", 1}, {"c", 2}})}, {"d", Value::array({1})}});
        const Value untouched = root.at("d");
        Path::of("a", "b").unset(root);
        REQUIRE(root.at("a") == Value::object({{"c", 2}}));
        REQUIRE(identical(root.at("d"), untouched));
    }
}
