// test_value.cpp - Tests for the observed Value type

#include <catch2/catch_all.hpp>
#include <state_observer/value.h>

#include <limits>
#include <string>

using namespace state_observer;

// ============================================================
// Construction and kinds
// ============================================================

TEST_CASE("Value default construction", "[value][construction]") {
    Value v;
    REQUIRE(v.is_null());
    REQUIRE_FALSE(v.is_container());
    REQUIRE(v.shape() == ValueShape::Scalar);
}

TEST_CASE("Value scalar construction", "[value][construction]") {
    SECTION("bool") {
        Value v{true};
        REQUIRE(v.is_bool());
        REQUIRE(v.as_bool());
    }

    SECTION("integers widen to int64_t") {
        Value v{42};
        REQUIRE(v.is<int64_t>());
        REQUIRE(v.as_int() == 42);

        Value u{static_cast<unsigned short>(7)};
        REQUIRE(u.is<int64_t>());
    }

    SECTION("floats widen to double") {
        Value v{1.5f};
        REQUIRE(v.is<double>());
        REQUIRE(v.as_double() == 1.5);
    }

    SECTION("strings") {
        REQUIRE(Value{"abc"}.as_string() == "abc");
        REQUIRE(Value{std::string{"abc"}}.as_string_view() == "abc");
        REQUIRE(Value{std::string_view{"abc"}}.is_string());
    }
}

TEST_CASE("Value container construction", "[value][construction]") {
    SECTION("record keeps insertion order") {
        auto v = Value::record({{"b", 1}, {"a", 2}, {"c", 3}});
        REQUIRE(v.is_record());
        REQUIRE(v.shape() == ValueShape::Record);
        const auto& rec = *v.get_if<ValueRecord>();
        REQUIRE(rec.size() == 3);
        REQUIRE(rec.keys[0] == "b");
        REQUIRE(rec.keys[1] == "a");
        REQUIRE(rec.keys[2] == "c");
    }

    SECTION("record with duplicate key keeps the first position and the last value") {
        auto v = Value::record({{"x", 1}, {"y", 2}, {"x", 3}});
        REQUIRE(v.size() == 2);
        REQUIRE(v.at("x").as_int() == 3);
        REQUIRE(v.get_if<ValueRecord>()->keys[0] == "x");
    }

    SECTION("vector") {
        auto v = Value::vector({1, "two", 3.0});
        REQUIRE(v.is_vector());
        REQUIRE(v.shape() == ValueShape::Sequence);
        REQUIRE(v.size() == 3);
        REQUIRE(v.at(1).as_string() == "two");
    }
}

// ============================================================
// Equality
// ============================================================

TEST_CASE("Value equality", "[value][equality]") {
    SECTION("int64_t and double are distinct kinds") {
        REQUIRE(Value{1} != Value{1.0});
        REQUIRE(Value{1} == Value{1});
    }

    SECTION("records ignore key order") {
        auto a = Value::record({{"x", 1}, {"y", 2}});
        auto b = Value::record({{"y", 2}, {"x", 1}});
        REQUIRE(a == b);
    }

    SECTION("records differ by value") {
        auto a = Value::record({{"x", 1}});
        auto b = Value::record({{"x", 2}});
        REQUIRE(a != b);
    }

    SECTION("vectors compare element-wise") {
        REQUIRE(Value::vector({1, 2}) == Value::vector({1, 2}));
        REQUIRE(Value::vector({1, 2}) != Value::vector({2, 1}));
    }

    SECTION("null equals null") {
        REQUIRE(Value{} == Value{});
        REQUIRE(Value{} != Value{false});
    }
}

// ============================================================
// Access
// ============================================================

TEST_CASE("Value access", "[value][access]") {
    auto v = Value::record({{"hp", 100}, {"items", Value::vector({1, 2})}});

    SECTION("at on missing key returns null") {
        REQUIRE(v.at("missing").is_null());
    }

    SECTION("at on wrong kind returns null") {
        REQUIRE(v.at(0).is_null());
        REQUIRE(v.at("items").at("x").is_null());
    }

    SECTION("at_or returns the default") {
        REQUIRE(v.at_or("missing", Value{7}).as_int() == 7);
        REQUIRE(v.at("items").at_or(5, Value{"none"}).as_string() == "none");
    }

    SECTION("as_* return the default on a kind mismatch") {
        REQUIRE(v.at("hp").as_string("n/a") == "n/a");
        REQUIRE(v.at("hp").as_number() == 100.0);
        REQUIRE(Value{"x"}.as_int(-1) == -1);
    }

    SECTION("contains") {
        REQUIRE(v.contains("hp"));
        REQUIRE_FALSE(v.contains("mp"));
        REQUIRE(v.at("items").contains(std::size_t{1}));
        REQUIRE_FALSE(v.at("items").contains(std::size_t{2}));
    }
}

// ============================================================
// Persistent edits
// ============================================================

TEST_CASE("Value record edits", "[value][record]") {
    auto v = Value::record({{"a", 1}, {"b", 2}});

    SECTION("set on an existing key keeps its position") {
        auto w = v.set("a", 10);
        REQUIRE(w.at("a").as_int() == 10);
        REQUIRE(w.get_if<ValueRecord>()->keys[0] == "a");
        REQUIRE(v.at("a").as_int() == 1);
    }

    SECTION("set on a new key appends it") {
        auto w = v.set("c", 3);
        REQUIRE(w.size() == 3);
        REQUIRE(w.get_if<ValueRecord>()->keys[2] == "c");
    }

    SECTION("erase drops the key from the enumeration order") {
        auto w = v.erase("a");
        REQUIRE(w.size() == 1);
        REQUIRE_FALSE(w.contains("a"));
        REQUIRE(w.get_if<ValueRecord>()->keys[0] == "b");
    }

    SECTION("set on a non-record is a no-op") {
        Value n{5};
        REQUIRE(n.set("a", 1) == n);
    }
}

TEST_CASE("Value vector edits", "[value][vector]") {
    auto v = Value::vector({1, 2, 3});

    SECTION("push_back") {
        REQUIRE(v.push_back(4) == Value::vector({1, 2, 3, 4}));
    }

    SECTION("insert in the middle") {
        REQUIRE(v.insert(1, 9) == Value::vector({1, 9, 2, 3}));
    }

    SECTION("insert at size appends") {
        REQUIRE(v.insert(3, 9) == Value::vector({1, 2, 3, 9}));
    }

    SECTION("insert past the end is a no-op") {
        REQUIRE(v.insert(5, 9) == v);
    }

    SECTION("erase last and middle") {
        REQUIRE(v.erase(std::size_t{2}) == Value::vector({1, 2}));
        REQUIRE(v.erase(std::size_t{0}) == Value::vector({2, 3}));
    }

    SECTION("set out of range is a no-op") {
        REQUIRE(v.set(std::size_t{3}, 0) == v);
    }
}

TEST_CASE("ValueRecord storage sharing", "[value][record][sharing]") {
    auto v = Value::record({{"a", 1}});
    const auto& rec = *v.get_if<ValueRecord>();

    auto copy = v;
    REQUIRE(rec.shares_storage_with(*copy.get_if<ValueRecord>()));

    auto edited = v.set("a", 2);
    REQUIRE_FALSE(rec.shares_storage_with(*edited.get_if<ValueRecord>()));
}

// ============================================================
// Rendering
// ============================================================

TEST_CASE("value_to_json", "[value][json]") {
    SECTION("scalars") {
        REQUIRE(value_to_json(Value{}) == "null");
        REQUIRE(value_to_json(Value{true}) == "true");
        REQUIRE(value_to_json(Value{-3}) == "-3");
        REQUIRE(value_to_json(Value{2.0}) == "2");
        REQUIRE(value_to_json(Value{0.5}) == "0.5");
        REQUIRE(value_to_json(Value{"a\"b"}) == "\"a\\\"b\"");
    }

    SECTION("non-finite doubles render as null") {
        REQUIRE(value_to_json(Value{std::numeric_limits<double>::infinity()}) == "null");
        REQUIRE(value_to_json(Value{std::numeric_limits<double>::quiet_NaN()}) == "null");
    }

    SECTION("containers keep enumeration order") {
        auto v = Value::record({{"hp", 80}, {"x", 100}, {"tags", Value::vector({"a"})}});
        REQUIRE(value_to_json(v) == R"({"hp":80,"x":100,"tags":["a"]})");
    }
}

TEST_CASE("value_to_string and path_to_string", "[value][debug]") {
    REQUIRE(value_to_string(Value::record({{"a", 1}})) == "{record:1}");
    REQUIRE(value_to_string(Value::vector({1, 2})) == "[vector:2]");
    REQUIRE(value_to_string(Value{"s"}) == "\"s\"");

    Path path{std::string{"objs"}, std::size_t{0}, std::string{"x"}};
    REQUIRE(path_to_string(path) == ".objs[0].x");
}
