// test_diff.cpp - Tests for the diff engine

#include <catch2/catch_all.hpp>
#include <state_observer/value_diff.h>

#include "patch_apply.h"

#include <string>

using namespace state_observer;
using state_observer::testing::apply_patches;

// ============================================================
// Helper Functions
// ============================================================

namespace {

Value numbers(int first, int last) {
    auto v = Value::vector();
    for (int i = first; i <= last; ++i) {
        v = v.push_back(i);
    }
    return v;
}

Value create_state_v1() {
    return Value::record({
        {"name", "Alice"},
        {"age", 30},
        {"items", Value::vector({1, 2, 3})}
    });
}

Value create_state_v2() {
    return Value::record({
        {"name", "Bob"},                      // Changed
        {"age", 30},                           // Same
        {"items", Value::vector({1, 2, 4})},  // Changed
        {"email", "bob@test.com"}             // Added
    });
}

std::string pointers(const Patches& patches) {
    std::string out;
    for (const auto& p : patches) {
        out += std::string{op_to_string(p.op)} + " " + p.pointer() + ";";
    }
    return out;
}

} // anonymous namespace

// ============================================================
// Scalars and kinds
// ============================================================

TEST_CASE("diff of equal values is empty", "[diff][collector]") {
    REQUIRE(diff(Value{1}, Value{1}).empty());
    REQUIRE(diff(Value{}, Value{}).empty());
    REQUIRE(diff(create_state_v1(), create_state_v1()).empty());

    auto v = create_state_v1();
    REQUIRE(diff(v, v).empty());
}

TEST_CASE("diff of unequal scalars is one replace", "[diff][collector][replace]") {
    auto patches = diff(Value{1}, Value{2});
    REQUIRE(patches.size() == 1);
    REQUIRE(patches[0].op == PatchOp::Replace);
    REQUIRE(patches[0].path.empty());
    REQUIRE(patches[0].pointer().empty());
    REQUIRE(patches[0].get_value() == Value{2});
}

TEST_CASE("diff across kinds does not recurse", "[diff][collector][replace]") {
    SECTION("int and double") {
        auto patches = diff(Value{1}, Value{1.0});
        REQUIRE(patches.size() == 1);
        REQUIRE(patches[0].get_value().is<double>());
    }

    SECTION("record to sequence") {
        auto prev = Value::record({{"a", Value::record({{"x", 1}})}});
        auto cur  = Value::record({{"a", Value::vector({1})}});
        auto patches = diff(prev, cur);
        REQUIRE(patches.size() == 1);
        REQUIRE(patches[0] == PatchOperation{PatchOp::Replace, Path{std::string{"a"}}, Value::vector({1})});
    }

    SECTION("scalar to record") {
        auto patches = diff(Value{"x"}, Value::record({{"a", 1}}));
        REQUIRE(patches.size() == 1);
        REQUIRE(patches[0].op == PatchOp::Replace);
    }
}

// ============================================================
// Records
// ============================================================

TEST_CASE("diff of records", "[diff][collector][record]") {
    auto patches = diff(create_state_v1(), create_state_v2());

    REQUIRE(patches.size() == 3);
    // Previous keys last to first, then new keys
    REQUIRE(pointers(patches) == "replace /items/2;replace /name;add /email;");
    REQUIRE(patches[0].get_value() == Value{4});
    REQUIRE(patches[1].get_value() == Value{"Bob"});
    REQUIRE(patches[2].get_value() == Value{"bob@test.com"});
}

TEST_CASE("diff reports removed keys", "[diff][collector][remove]") {
    auto prev = Value::record({{"a", 1}, {"b", Value::record({{"c", 2}})}});
    auto cur  = Value::record({{"a", 1}});

    auto patches = diff(prev, cur);
    REQUIRE(patches.size() == 1);
    REQUIRE(patches[0].op == PatchOp::Remove);
    REQUIRE(patches[0].pointer() == "/b");
    REQUIRE(patches[0].get_value().is_null());
}

TEST_CASE("diff adds whole subtrees", "[diff][collector][add]") {
    auto prev = Value::record({});
    auto cur  = Value::record({{"obj", Value::record({{"x", 1}, {"y", 2}})}});

    auto patches = diff(prev, cur);
    REQUIRE(patches.size() == 1);
    REQUIRE(patches[0].op == PatchOp::Add);
    REQUIRE(patches[0].get_value() == Value::record({{"x", 1}, {"y", 2}}));
}

TEST_CASE("diff ignores record key order", "[diff][collector][record]") {
    auto prev = Value::record({{"a", 1}, {"b", 2}});
    auto cur  = Value::record({{"b", 2}, {"a", 1}});
    REQUIRE(diff(prev, cur).empty());
}

TEST_CASE("diff adds new keys in enumeration order", "[diff][collector][add]") {
    auto prev = Value::record({{"a", 1}});
    auto cur  = Value::record({{"a", 1}, {"z", 1}, {"m", 2}, {"b", 3}});
    REQUIRE(pointers(diff(prev, cur)) == "add /z;add /m;add /b;");
}

TEST_CASE("diff escapes keys in pointers", "[diff][collector][pointer]") {
    auto prev = Value::record({{"a/b", 1}});
    auto cur  = Value::record({{"a/b", 2}, {"m~n", 1}});
    REQUIRE(pointers(diff(prev, cur)) == "replace /a~1b;add /m~0n;");
}

// ============================================================
// Sequences
// ============================================================

TEST_CASE("diff of growing sequence", "[diff][collector][vector]") {
    auto patches = diff(numbers(1, 3), numbers(1, 5));
    REQUIRE(pointers(patches) == "add /3;add /4;");
    REQUIRE(patches[0].get_value() == Value{4});
    REQUIRE(patches[1].get_value() == Value{5});
}

TEST_CASE("diff of shrinking sequence removes from the end", "[diff][collector][vector]") {
    auto patches = diff(numbers(1, 11), numbers(1, 9));
    REQUIRE(pointers(patches) == "remove /10;remove /9;");
    REQUIRE(apply_patches(numbers(1, 11), patches) == numbers(1, 9));
}

TEST_CASE("diff has no move detection", "[diff][collector][vector]") {
    auto prev = Value::vector({1, 2, 3});
    auto cur  = Value::vector({1, 9, 2, 3});
    auto patches = diff(prev, cur);
    REQUIRE(pointers(patches) == "replace /2;replace /1;add /3;");
    REQUIRE(apply_patches(prev, patches) == cur);
}

TEST_CASE("diff visits sequences highest index first", "[diff][collector][vector]") {
    auto prev = Value::record({
        {"array", numbers(1, 10)},
        {"objs", Value::vector({Value::record({{"x", 0}}), Value::record({{"x", 0}}), Value::record({{"x", 0}})})}
    });
    auto cur = prev
        .set("array", numbers(1, 10).set(std::size_t{9}, 20).push_back(21))
        .set("objs", prev.at("objs").set(std::size_t{2}, Value::record({{"x", 100}}))
                                    .push_back(Value::record({{"hp", 80}})));

    REQUIRE(pointers(diff(prev, cur)) ==
            "replace /objs/2/x;add /objs/3;replace /array/9;add /array/10;");
}

// ============================================================
// Structural sharing
// ============================================================

TEST_CASE("diff skips shared subtrees", "[diff][collector][sharing]") {
    auto big = numbers(1, 1000);
    auto prev = Value::record({{"big", big}, {"n", 1}});
    auto cur  = prev.set("n", 2);

    auto patches = diff(prev, cur);
    REQUIRE(patches.size() == 1);
    REQUIRE(patches[0].pointer() == "/n");
}

TEST_CASE("patch values share the current snapshot's nodes", "[diff][collector][sharing]") {
    auto prev = Value::record({});
    auto cur  = Value::record({{"obj", Value::record({{"x", 1}})}});

    auto patches = diff(prev, cur);
    const auto* box = cur.get_if<ValueRecord>()->find("obj");
    REQUIRE(&patches[0].value.get() == &box->get());
}

// ============================================================
// PatchCollector
// ============================================================

TEST_CASE("PatchCollector state", "[diff][collector]") {
    PatchCollector collector;
    REQUIRE_FALSE(collector.has_changes());

    collector.diff(create_state_v1(), create_state_v2());
    REQUIRE(collector.has_changes());
    REQUIRE(collector.get_patches().size() == 3);

    SECTION("diff replaces the previous result") {
        collector.diff(Value{1}, Value{1});
        REQUIRE_FALSE(collector.has_changes());
    }

    SECTION("take_patches empties the collector") {
        auto taken = collector.take_patches();
        REQUIRE(taken.size() == 3);
        collector.clear();
        REQUIRE_FALSE(collector.has_changes());
    }
}

// ============================================================
// has_any_difference
// ============================================================

TEST_CASE("has_any_difference", "[diff][difference]") {
    auto v1 = create_state_v1();
    auto v2 = create_state_v2();

    REQUIRE(has_any_difference(v1, v2));
    REQUIRE_FALSE(has_any_difference(v1, v1));
    REQUIRE_FALSE(has_any_difference(v1, create_state_v1()));
    REQUIRE(has_any_difference(Value{1}, Value{1.0}));

    SECTION("same key count, different keys") {
        REQUIRE(has_any_difference(Value::record({{"a", 1}}), Value::record({{"b", 1}})));
    }

    SECTION("shallow mode reports any rebuilt container") {
        auto copy = create_state_v1();
        REQUIRE(has_any_difference(v1, copy, false));
        REQUIRE_FALSE(has_any_difference(v1, v1, false));
    }

    SECTION("agrees with diff") {
        REQUIRE(has_any_difference(v1, v2) == !diff(v1, v2).empty());
        REQUIRE(has_any_difference(v1, create_state_v1()) == !diff(v1, create_state_v1()).empty());
    }
}

// ============================================================
// Rendering
// ============================================================

TEST_CASE("patches_to_json", "[diff][json]") {
    Patches patches{
        {PatchOp::Replace, Path{std::string{"objs"}, std::size_t{0}, std::string{"x"}}, Value{100}},
        {PatchOp::Add, Path{std::string{"objs"}, std::size_t{1}}, Value::record({{"hp", 80}, {"x", 100}})},
        {PatchOp::Remove, Path{std::string{"array"}, std::size_t{10}}}
    };

    REQUIRE(patches_to_json(patches) ==
            R"([{"op":"replace","path":"/objs/0/x","value":100},)"
            R"({"op":"add","path":"/objs/1","value":{"hp":80,"x":100}},)"
            R"({"op":"remove","path":"/array/10"}])");
    REQUIRE(patches_to_json({}) == "[]");
}
