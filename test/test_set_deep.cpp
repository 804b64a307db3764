// test_set_deep.cpp - Tests for set_deep and deep_merge
// Module 4: Deep merge engine

#include <catch2/catch_all.hpp>
#include <imval/immutable_object.h>

#include <string>
#include <thread>
#include <vector>

using namespace imval;

namespace {

template <typename MemoryPolicy>
std::vector<std::string> key_list(const BasicValue<MemoryPolicy>& val) {
    const auto* fields = mapping_fields(val);
    if (!fields) return {};
    return {fields->keys().begin(), fields->keys().end()};
}

std::vector<std::string> key_list(const ImmutableObject& obj) {
    return {obj.keys().begin(), obj.keys().end()};
}

} // namespace

// ============================================================
// set_deep
// ============================================================

TEST_CASE("set_deep replaces a mapping with a terminal", "[deep][set_deep]") {
    auto base = create({Value::map({{"k", Value::map({{"m", 1}})}})});
    auto next = set_deep(base, Value::map({{"k", 5}}));

    REQUIRE(next.at("k").as_int() == 5);
    REQUIRE(base.at("k").at("m").as_int() == 1);
}

TEST_CASE("set_deep replaces a terminal with a mapping", "[deep][set_deep]") {
    auto base = create({Value::map({{"k", 5}})});
    auto next = set_deep(base, Value::map({{"k", Value::map({{"m", 1}})}}));

    REQUIRE(next.at("k").is_map());
    REQUIRE(next.at("k").at("m").as_int() == 1);
}

TEST_CASE("set_deep merges nested mappings key-wise", "[deep][set_deep]") {
    auto base = create({Value::map({{"k", Value::map({{"m", 1}, {"n", 2}})}})});
    auto next = set_deep(base, Value::map({{"k", Value::map({{"n", 9}, {"p", 3}})}}));

    auto inner = next.at("k");
    REQUIRE(key_list(inner) == std::vector<std::string>{"m", "n", "p"});
    REQUIRE(inner.at("m").as_int() == 1);
    REQUIRE(inner.at("n").as_int() == 9);
    REQUIRE(inner.at("p").as_int() == 3);

    // base untouched at every depth
    REQUIRE(key_list(base.at("k")) == std::vector<std::string>{"m", "n"});
    REQUIRE(base.at("k").at("n").as_int() == 2);
}

TEST_CASE("set_deep recurses several levels", "[deep][set_deep]") {
    auto base = create({Value::map({
        {"a", Value::map({{"b", Value::map({{"c", 1}, {"d", 2}})}, {"e", 3}})},
        {"f", 4},
    })});
    auto next = set_deep(base, Value::map({{"a", Value::map({{"b", Value::map({{"d", 20}})}})}}));

    REQUIRE(next.at("a").at("b").at("c").as_int() == 1);
    REQUIRE(next.at("a").at("b").at("d").as_int() == 20);
    REQUIRE(next.at("a").at("e").as_int() == 3);
    REQUIRE(next.at("f").as_int() == 4);
    REQUIRE(key_list(next) == std::vector<std::string>{"a", "f"});
}

TEST_CASE("set_deep replaces arrays wholesale", "[deep][set_deep]") {
    auto base = create({Value::map({{"list", Value::vector({1, 2, 3})}})});
    auto next = set_deep(base, Value::map({{"list", Value::vector({9})}}));

    REQUIRE(next.at("list") == Value::vector({9}));
    REQUIRE(base.at("list").size() == 3);
}

TEST_CASE("set_deep appends new keys in patch order", "[deep][set_deep]") {
    auto base = create({Value::map({{"a", 1}, {"b", 2}})});
    auto next = set_deep(base, Value::map({{"z", 26}, {"a", 10}, {"y", 25}}));

    REQUIRE(key_list(next) == std::vector<std::string>{"a", "b", "z", "y"});
    REQUIRE(next.at("a").as_int() == 10);
}

TEST_CASE("set_deep with an empty patch shares everything", "[deep][set_deep][sharing]") {
    auto base = create({Value::map({
        {"nested", Value::map({{"x", 1}})},
        {"sealed", Value::object({{"y", 2}})},
        {"leaf", "text"},
    })});
    auto next = set_deep(base, Value::map({}));

    REQUIRE(next == base);
    for (const auto& key : base.keys()) {
        REQUIRE(&next.find(key)->get() == &base.find(key)->get());
    }
}

TEST_CASE("set_deep shares untouched siblings", "[deep][set_deep][sharing]") {
    auto base = create({Value::map({
        {"left", Value::map({{"x", 1}})},
        {"right", Value::map({{"y", Value::map({{"z", 2}})}, {"w", 3}})},
    })});
    auto next = set_deep(base, Value::map({{"right", Value::map({{"w", 30}})}}));

    REQUIRE(&next.find("left")->get() == &base.find("left")->get());

    // at() returns by value; keep both nested values alive while comparing
    auto old_right_val = base.at("right");
    auto new_right_val = next.at("right");
    const auto* old_right = mapping_fields(old_right_val);
    const auto* new_right = mapping_fields(new_right_val);
    REQUIRE(old_right != nullptr);
    REQUIRE(new_right != nullptr);
    REQUIRE(&new_right->find("y")->get() == &old_right->find("y")->get());
    REQUIRE(new_right->find("w")->get().as_int() == 30);
}

TEST_CASE("set_deep keeps the base's nesting kind", "[deep][set_deep]") {
    SECTION("plain nested stays plain") {
        auto base = create({Value::map({{"k", Value::map({{"m", 1}})}})});
        auto next = set_deep(base, Value::map({{"k", Value::map({{"n", 2}})}}));
        REQUIRE(next.at("k").is_map());
    }

    SECTION("sealed nested stays sealed") {
        auto base = create({Value::map({{"k", Value::object({{"m", 1}})}})});
        auto next = set_deep(base, Value::map({{"k", Value::map({{"n", 2}})}}));
        REQUIRE(is_sealed(next.at("k")));
        REQUIRE(key_list(next.at("k")) == std::vector<std::string>{"m", "n"});
    }

    SECTION("a sealed patch seals the merged level") {
        auto base = create({Value::map({{"k", Value::map({{"m", 1}})}})});
        auto next = set_deep(base, Value::map({{"k", Value::object({{"n", 2}})}}));
        REQUIRE(is_sealed(next.at("k")));
        REQUIRE(next.at("k").at("m").as_int() == 1);
    }

    SECTION("a new mapping is stored verbatim") {
        auto base = create<unsafe_memory_policy>({});
        auto next = set_deep(base, Value::map({{"k", Value::map({{"m", 1}})}}));
        REQUIRE(next.at("k").is_map());
    }
}

TEST_CASE("set_deep accepts a sealed patch", "[deep][set_deep]") {
    auto base = create({Value::map({{"k", Value::map({{"m", 1}})}})});
    auto patch = Value{create({Value::map({{"k", Value::map({{"n", 2}})}})})};
    auto next = set_deep(base, patch);

    REQUIRE(next.at("k").at("m").as_int() == 1);
    REQUIRE(next.at("k").at("n").as_int() == 2);
}

TEST_CASE("set_deep error handling", "[deep][set_deep][errors]") {
    auto base = create({Value::map({{"k", Value::map({{"m", 1}})}})});

    SECTION("null patch") {
        REQUIRE_THROWS_AS(set_deep(base, Value{}), InvalidPatchError);
    }

    SECTION("array patch") {
        REQUIRE_THROWS_AS(set_deep(base, Value::vector({Value::map({})})), InvalidPatchError);
    }

    SECTION("scalar patch") {
        try {
            auto unused = set_deep(base, Value{"str"});
            (void)unused;
            FAIL("expected InvalidPatchError");
        } catch (const InvalidPatchError& e) {
            REQUIRE(e.operation() == "set_deep");
            REQUIRE(e.actual_type() == "string");
        }
    }

    SECTION("non-sealed base") {
        REQUIRE_THROWS_AS(set_deep(Value::map({{"k", 1}}), Value::map({})), NotImmutableError);
        REQUIRE_THROWS_AS(set_deep(Value{}, Value::map({})), NotImmutableError);
    }

    REQUIRE(base.at("k").at("m").as_int() == 1);
}

// ============================================================
// deep_merge
// ============================================================

TEST_CASE("deep_merge keeps plain roots plain", "[deep][deep_merge]") {
    auto merged = deep_merge(Value::map({{"a", 1}}), Value::map({{"b", 2}}));
    REQUIRE(merged.is_map());
    REQUIRE(key_list(merged) == std::vector<std::string>{"a", "b"});
}

TEST_CASE("deep_merge seals when either root is sealed", "[deep][deep_merge]") {
    REQUIRE(is_sealed(deep_merge(Value::map({}), Value::object({{"a", 1}}))));
    REQUIRE(is_sealed(deep_merge(Value::object({}), Value::map({{"a", 1}}))));
}

TEST_CASE("deep_merge rejects a non-mapping root", "[deep][deep_merge][errors]") {
    SECTION("array base") {
        try {
            auto unused = deep_merge(Value::vector({1}), Value::map({}));
            (void)unused;
            FAIL("expected MalformedMergePairError");
        } catch (const MalformedMergePairError& e) {
            REQUIRE(e.path() == "/");
            REQUIRE(e.base_type() == "vector");
            REQUIRE(e.patch_type() == "map");
        }
    }

    SECTION("null patch") {
        REQUIRE_THROWS_AS(deep_merge(Value::map({}), Value{}), MalformedMergePairError);
    }
}

// ============================================================
// Thread-safe policy
// ============================================================

#if IMVAL_ENABLE_THREAD_SAFE
TEST_CASE("set_deep on SyncImmutableObject from several threads", "[deep][set_deep][sync]") {
    auto base = create({SyncValue::map({
        {"shared", SyncValue::map({{"x", 1}})},
        {"counter", 0},
    })});

    constexpr int thread_count = 4;
    std::vector<SyncImmutableObject> results(thread_count, base);
    std::vector<std::thread> threads;
    for (int i = 0; i < thread_count; ++i) {
        threads.emplace_back([&, i] {
            for (int round = 0; round < 100; ++round) {
                results[i] = set_deep(results[i], SyncValue::map({
                    {"shared", SyncValue::map({{"owner", i}})},
                    {"counter", round + 1},
                }));
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (int i = 0; i < thread_count; ++i) {
        REQUIRE(results[i].at("counter").as_int() == 100);
        REQUIRE(results[i].at("shared").at("x").as_int() == 1);
        REQUIRE(results[i].at("shared").at("owner").as_int() == i);
    }
    REQUIRE(base.at("counter").as_int() == 0);
    REQUIRE_FALSE(base.at("shared").contains("owner"));
}
#endif
