// main.cpp
// treepath example - addressing, matching and diffing JSON-shaped trees
//
// Walks through the main pieces of the library on one small document:
//
// 1. Path: build, print, parse, get / set / unset
// 2. PathMatcher: wildcards, unions and tree search
// 3. Diff: changesets and patches between two versions
// 4. Projection and VersionInfo on top of the above

#include <treepath/diff.h>
#include <treepath/path_parser.h>
#include <treepath/projection.h>
#include <treepath/serialization.h>
#include <treepath/version_info.h>

#include <iostream>
#include <string>

using namespace treepath;

// ============================================================
// Sample data
// ============================================================

Value make_document()
{
    return from_json(R"({
        "title": "inventory",
        "items": [
            {"name": "bolt", "count": 120, "tags": ["metal"]},
            {"name": "nut", "count": 80},
            {"name": "washer", "count": 0}
        ],
        "owner": {"first": "Ada"}
    })");
}

// ============================================================
// Demos
// ============================================================

void demo_path(const Value& doc)
{
    std::cout << "=== Path ===\n";

    auto path = Path::of("items", 0, "name");
    std::cout << "  " << path << " = " << path.get(doc) << "\n";

    auto quoted = Path::root().property("display name").index(3);
    std::cout << "  canonical form: " << quoted.to_json() << "\n";

    auto parsed = parse_path(R"($.owner["first"])");
    std::cout << "  parsed " << parsed << " = " << parsed.get(doc) << "\n";

    Value copy = doc;
    Path::of("owner", "last").set(copy, "Lovelace");
    Path::of("items", 2).unset(copy);
    std::cout << "  after set/unset:\n" << to_json(copy) << "\n";

    try {
        Path::of("title", "inner").set(copy, 1);
    } catch (const PathError& e) {
        std::cout << "  error: " << e.what() << "\n";
    }
    std::cout << "\n";
}

void demo_matcher(const Value& doc)
{
    std::cout << "=== PathMatcher ===\n";

    auto names = PathMatcher::of("items", any_index, "name");
    names.find(doc, [](const Path& path, const Value& value) {
        std::cout << "  " << path << " = " << value << "\n";
    });

    auto counts = parse_path_matcher("$.items[0,2].count");
    std::cout << "  " << counts << " allows gaps: " << std::boolalpha << counts.allows_gaps() << "\n";
    for (const auto& value : counts.find_values(doc)) {
        std::cout << "    " << value << "\n";
    }

    if (auto first = parse_path_matcher("$.*.first").find_first(doc)) {
        std::cout << "  first match: " << first->path << "\n";
    }
    std::cout << "\n";
}

void demo_diff(const Value& before)
{
    std::cout << "=== Diff ===\n";

    Value after = before;
    Path::of("items", 1, "count").set(after, 75);
    Path::of("items", 0, "tags").unset(after);
    Path::of("owner", "last").set(after, "Lovelace");

    print_changes(Diff{}.changeset(before, after));

    DiffConfig config;
    config.filter = [](const Path& path, const Value& value) {
        return !value.is_undefined() && path.to_json() != "$.owner";
    };
    std::cout << "  ignoring $.owner:\n";
    print_changes(Diff{config}.changeset(before, after));

    std::cout << "  as a patch:\n";
    for (const auto& step : Diff{}.patch(before, after)) {
        std::cout << "  " << step.path.to_json() << " = "
                  << (step.value ? value_to_string(*step.value) : std::string("(unset)")) << "\n";
    }
    std::cout << "\n";
}

void demo_versions(const Value& before)
{
    std::cout << "=== Projection / VersionInfo ===\n";

    auto projection = Projection::of({parse_path_matcher("$.items[*].name")});
    std::cout << to_json(projection.map(before), true) << "\n";

    Value after = before;
    Path::of("title").set(after, "stock");

    VersionInfo info{after, before};
    std::cout << "  title changed: " << std::boolalpha << info.matches("$.title") << "\n";
    std::cout << "  items changed: " << info.matches("$.items") << "\n";
    std::cout << "  " << to_json(info.to_json(), true) << "\n";
}

int main()
{
    std::cout << "=== treepath example ===\n\n";

    const Value doc = make_document();
    demo_path(doc);
    demo_matcher(doc);
    demo_diff(doc);
    demo_versions(doc);

    return 0;
}
