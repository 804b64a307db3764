// test_terminal.cpp - Tests for leaf/mapping classification
// Module 2: Terminal classifier

#include <catch2/catch_all.hpp>
#include <imval/terminal.h>

using namespace imval;

TEST_CASE("is_terminal classifies leaves", "[terminal]") {
    SECTION("null and scalars are terminal") {
        REQUIRE(is_terminal(Value{}));
        REQUIRE(is_terminal(Value{false}));
        REQUIRE(is_terminal(Value{0}));
        REQUIRE(is_terminal(Value{int64_t{1}}));
        REQUIRE(is_terminal(Value{0.5}));
        REQUIRE(is_terminal(Value{""}));
    }

    SECTION("arrays are terminal") {
        REQUIRE(is_terminal(Value::vector({})));
        REQUIRE(is_terminal(Value::vector({Value::map({{"a", 1}})})));
    }

    SECTION("maps and objects are not") {
        REQUIRE_FALSE(is_terminal(Value::map({})));
        REQUIRE_FALSE(is_terminal(Value::object({{"a", 1}})));
        REQUIRE(is_mapping(Value::map({})));
        REQUIRE(is_mapping(Value::object({})));
    }
}

TEST_CASE("mapping_fields exposes both mapping kinds", "[terminal]") {
    auto plain = Value::map({{"a", 1}});
    auto sealed = Value::object({{"a", 1}});

    REQUIRE(mapping_fields(plain) != nullptr);
    REQUIRE(mapping_fields(sealed) != nullptr);
    REQUIRE(*mapping_fields(plain) == *mapping_fields(sealed));
    REQUIRE(mapping_fields(Value{1}) == nullptr);
    REQUIRE(mapping_fields(Value::vector({1})) == nullptr);
}

TEST_CASE("check_merge_object_args", "[terminal][errors]") {
    auto mapping = Value::map({{"a", 1}});

    SECTION("accepts two mappings") {
        REQUIRE_NOTHROW(check_merge_object_args(mapping, Value::object({}), Path{}));
    }

    SECTION("rejects a leaf on either side") {
        REQUIRE_THROWS_AS(check_merge_object_args(Value{1}, mapping, Path{}), MalformedMergePairError);
        REQUIRE_THROWS_AS(check_merge_object_args(mapping, Value::vector({}), Path{}), MalformedMergePairError);
    }

    SECTION("reports the location and both types") {
        try {
            check_merge_object_args(Value{"text"}, mapping, Path{"settings", "theme"});
            FAIL("expected MalformedMergePairError");
        } catch (const MalformedMergePairError& e) {
            REQUIRE(e.path() == ".settings.theme");
            REQUIRE(e.base_type() == "string");
            REQUIRE(e.patch_type() == "map");
        }
    }

    SECTION("is an ImmutableValueError") {
        REQUIRE_THROWS_AS(check_merge_object_args(Value{}, Value{}, Path{}), ImmutableValueError);
    }
}
