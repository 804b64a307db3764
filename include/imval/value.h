// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Dynamic Value type, ordered persistent map and sealed ImmutableObject.
///
/// This file defines the core types every other imval header works with:
/// - Leaves: null (std::monostate), bool, int32_t, int64_t, double, string
/// - Arrays: immer::vector of boxed values (always treated as leaves by merges)
/// - ValueMap: plain, insertion-ordered persistent mapping (patches, nested
///   plain records)
/// - ImmutableObject: sealed, insertion-ordered mapping. It has no mutating
///   member functions and can only be obtained through named factories, so
///   "sealed" is a property of the type rather than a runtime flag.
///
/// Every nested value is held by an immer::box. Copying a box only bumps a
/// reference count, which is what lets derived values share unchanged
/// sub-trees with their base.
///
/// All types are templated on an immer memory policy, see the aliases at
/// the bottom of this file.

#pragma once

#include "imval_config.h"
#include "api.h"
#include "value_fwd.h"

#include <immer/box.hpp>
#include <immer/flex_vector.hpp>
#include <immer/flex_vector_transient.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <iterator>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace imval {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if IMVAL_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if IMVAL_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

/// Report a rejected argument. Used by the merge engine, where the
/// interesting location is the caller's, not the library's.
inline void log_validation_error(std::string_view func, std::string_view message) noexcept
{
#if IMVAL_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message << "\n";
#else
    (void)func;
    (void)message;
#endif
}

} // namespace detail

/// Sequence of keys leading from a root mapping to a nested value
using Path = std::vector<std::string>;

// Forward declaration
template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueVector = immer::vector<BasicValueBox<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicKeyOrder = immer::flex_vector<std::string, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicFieldTable = immer::map<std::string,
                                   BasicValueBox<MemoryPolicy>,
                                   std::hash<std::string>,
                                   std::equal_to<std::string>,
                                   MemoryPolicy>;

// ============================================================
// BasicValueMap - insertion-ordered persistent mapping
//
// keys_ records first-insertion order, fields_ answers lookups.
//   - set() on an existing key replaces the box in place (order kept)
//   - set() on a new key appends it
//   - erase() drops the key from both; re-adding it later appends
// Equality is order-sensitive.
// ============================================================
template <typename MemoryPolicy>
class BasicValueMap {
public:
    using value_type  = BasicValue<MemoryPolicy>;
    using value_box   = BasicValueBox<MemoryPolicy>;
    using key_order   = BasicKeyOrder<MemoryPolicy>;
    using field_table = BasicFieldTable<MemoryPolicy>;

    /// Iterates entries in key order. Dereferencing yields a pair of
    /// references into the map, valid as long as the map is alive.
    class const_iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = std::pair<std::string, value_box>;
        using reference         = std::pair<const std::string&, const value_box&>;
        using difference_type   = std::ptrdiff_t;
        using pointer           = void;

        reference operator*() const { return {*it_, *fields_->find(*it_)}; }

        const_iterator& operator++() {
            ++it_;
            return *this;
        }

        const_iterator operator++(int) {
            auto tmp = *this;
            ++it_;
            return tmp;
        }

        bool operator==(const const_iterator& other) const { return it_ == other.it_; }
        bool operator!=(const const_iterator& other) const { return it_ != other.it_; }

    private:
        friend class BasicValueMap;
        using key_iterator = typename key_order::const_iterator;

        const_iterator(key_iterator it, const field_table* fields)
            : it_(std::move(it)), fields_(fields) {}

        key_iterator it_;
        const field_table* fields_;
    };

    /// Batch construction through immer transients - O(n) for n inserts.
    class transient_type {
    public:
        void set(const std::string& key, value_box box) {
            if (!fields_.count(key)) {
                keys_.push_back(key);
            }
            fields_.set(key, std::move(box));
        }

        [[nodiscard]] const value_box* find(const std::string& key) const { return fields_.find(key); }
        [[nodiscard]] bool contains(const std::string& key) const { return fields_.count(key) > 0; }
        [[nodiscard]] std::size_t size() const { return fields_.size(); }

        [[nodiscard]] BasicValueMap persistent() {
            return BasicValueMap{keys_.persistent(), fields_.persistent()};
        }

    private:
        friend class BasicValueMap;

        explicit transient_type(const BasicValueMap& from)
            : keys_(from.keys_.transient()), fields_(from.fields_.transient()) {}

        typename key_order::transient_type keys_;
        typename field_table::transient_type fields_;
    };

    BasicValueMap() = default;

    [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }
    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }
    [[nodiscard]] std::size_t count(const std::string& key) const { return fields_.count(key); }
    [[nodiscard]] bool contains(const std::string& key) const { return count(key) > 0; }

    /// Box stored under key, or nullptr
    [[nodiscard]] const value_box* find(const std::string& key) const { return fields_.find(key); }

    [[nodiscard]] const key_order& keys() const noexcept { return keys_; }

    [[nodiscard]] const_iterator begin() const { return const_iterator{keys_.begin(), &fields_}; }
    [[nodiscard]] const_iterator end() const { return const_iterator{keys_.end(), &fields_}; }

    [[nodiscard]] BasicValueMap set(const std::string& key, value_box box) const {
        if (fields_.count(key)) {
            return BasicValueMap{keys_, fields_.set(key, std::move(box))};
        }
        return BasicValueMap{keys_.push_back(key), fields_.set(key, std::move(box))};
    }

    [[nodiscard]] BasicValueMap erase(const std::string& key) const {
        if (!fields_.count(key)) {
            return *this;
        }
        return BasicValueMap{keys_.erase(position_of(key)), fields_.erase(key)};
    }

    [[nodiscard]] transient_type transient() const { return transient_type{*this}; }

    bool operator==(const BasicValueMap& other) const {
        return keys_ == other.keys_ && fields_ == other.fields_;
    }

    bool operator!=(const BasicValueMap& other) const { return !(*this == other); }

private:
    BasicValueMap(key_order keys, field_table fields)
        : keys_(std::move(keys)), fields_(std::move(fields)) {}

    std::size_t position_of(const std::string& key) const {
        std::size_t pos = 0;
        for (const auto& k : keys_) {
            if (k == key) break;
            ++pos;
        }
        return pos;
    }

    key_order keys_;
    field_table fields_;
};

// ============================================================
// BasicImmutableObject - sealed ordered mapping
//
// Read-only view over a BasicValueMap. The constructor is private; new
// objects come from seal(), create() (immutable_object.h), ObjectBuilder
// (builders.h) or the merge engine. Deriving a new version never touches
// an existing object.
// ============================================================
template <typename MemoryPolicy>
class BasicImmutableObject {
public:
    using value_type     = BasicValue<MemoryPolicy>;
    using value_box      = BasicValueBox<MemoryPolicy>;
    using value_map      = BasicValueMap<MemoryPolicy>;
    using key_order      = BasicKeyOrder<MemoryPolicy>;
    using const_iterator = typename value_map::const_iterator;

    /// Seal an ordered map into an ImmutableObject
    [[nodiscard]] static BasicImmutableObject seal(value_map fields) {
        return BasicImmutableObject{std::move(fields)};
    }

    [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }
    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }
    [[nodiscard]] std::size_t count(const std::string& key) const { return fields_.count(key); }
    [[nodiscard]] bool contains(const std::string& key) const { return fields_.contains(key); }
    [[nodiscard]] const value_box* find(const std::string& key) const { return fields_.find(key); }
    [[nodiscard]] const key_order& keys() const noexcept { return fields_.keys(); }

    /// The sealed entries, in key order
    [[nodiscard]] const value_map& fields() const noexcept { return fields_; }

    [[nodiscard]] const_iterator begin() const { return fields_.begin(); }
    [[nodiscard]] const_iterator end() const { return fields_.end(); }

    /// Value stored under key; null (and a verbose log line) when absent
    [[nodiscard]] value_type at(const std::string& key) const;

    bool operator==(const BasicImmutableObject& other) const { return fields_ == other.fields_; }
    bool operator!=(const BasicImmutableObject& other) const { return !(*this == other); }

private:
    explicit BasicImmutableObject(value_map fields) : fields_(std::move(fields)) {}

    value_map fields_;
};

// ============================================================
// BasicValue - tagged variant decided once at construction
// ============================================================
template <typename MemoryPolicy = immer::default_memory_policy>
struct BasicValue
{
    using memory_policy    = MemoryPolicy;
    using value_box        = BasicValueBox<MemoryPolicy>;
    using value_vector     = BasicValueVector<MemoryPolicy>;
    using value_map        = BasicValueMap<MemoryPolicy>;
    using immutable_object = BasicImmutableObject<MemoryPolicy>;

    std::variant<std::monostate,
                 bool,
                 int32_t,
                 int64_t,
                 double,
                 std::string,
                 value_vector,
                 value_map,
                 immutable_object>
        data;

    constexpr BasicValue() noexcept : data(std::monostate{}) {}
    constexpr BasicValue(bool v) noexcept : data(v) {}
    constexpr BasicValue(int32_t v) noexcept : data(v) {}
    constexpr BasicValue(int64_t v) noexcept : data(v) {}
    constexpr BasicValue(double v) noexcept : data(v) {}
    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_vector v) : data(std::move(v)) {}
    BasicValue(value_map v) : data(std::move(v)) {}
    BasicValue(immutable_object v) : data(std::move(v)) {}

    /// Plain (unsealed) ordered map; later duplicates overwrite in place
    static BasicValue map(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        auto t = value_map{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    /// Sealed ImmutableObject built from key/value pairs
    static BasicValue object(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        auto t = value_map{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, value_box{val});
        }
        return BasicValue{immutable_object::seal(t.persistent())};
    }

    static BasicValue vector(std::initializer_list<BasicValue> init) {
        auto t = value_vector{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    /// Checked access; throws std::bad_variant_access on type mismatch
    template <typename T>
    [[nodiscard]] const T& as() const { return std::get<T>(data); }

    [[nodiscard]] std::size_t type_index() const noexcept { return data.index(); }
    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_vector() const noexcept { return is<value_vector>(); }
    [[nodiscard]] bool is_map() const noexcept { return is<value_map>(); }
    [[nodiscard]] bool is_object() const noexcept { return is<immutable_object>(); }
    [[nodiscard]] bool is_number() const noexcept {
        return is<int32_t>() || is<int64_t>() || is<double>();
    }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* m = get_if<value_map>()) {
            if (auto* found = m->find(key)) return found->get();
        }
        if (auto* o = get_if<immutable_object>()) {
            if (auto* found = o->find(key)) return found->get();
        }
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return (*v)[index].get();
        }
        detail::log_access_error("Value::at", "index " + std::to_string(index) + " out of range or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at_or(const std::string& key, BasicValue default_val) const {
        auto result = at(key);
        return result.is_null() ? std::move(default_val) : std::move(result);
    }

    [[nodiscard]] int32_t as_int(int32_t default_val = 0) const {
        if (auto* p = get_if<int32_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] int64_t as_int64(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        if (auto* p = get_if<int32_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_double(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
        if (auto* p = get_if<int32_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool contains(const std::string& key) const { return count(key) > 0; }

    [[nodiscard]] std::size_t count(const std::string& key) const {
        if (auto* m = get_if<value_map>()) return m->count(key);
        if (auto* o = get_if<immutable_object>()) return o->count(key);
        return 0;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<value_map>()) return m->size();
        if (auto* o = get_if<immutable_object>()) return o->size();
        if (auto* v = get_if<value_vector>()) return v->size();
        return 0;
    }

    using size_type = std::size_t;
};

template <typename MemoryPolicy>
typename BasicImmutableObject<MemoryPolicy>::value_type
BasicImmutableObject<MemoryPolicy>::at(const std::string& key) const
{
    if (auto* found = fields_.find(key)) return found->get();
    detail::log_key_error("ImmutableObject::at", key, "not found");
    return value_type{};
}

/// Equality: same alternative and equal contents (maps compare in key order)
template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return a.data == b.data;
}

template <typename MemoryPolicy>
bool operator!=(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return !(a == b);
}

/// Human-readable name of the active alternative, used in error messages
template <typename MemoryPolicy>
[[nodiscard]] std::string type_name(const BasicValue<MemoryPolicy>& val)
{
    using V = BasicValue<MemoryPolicy>;
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) return "null";
        else if constexpr (std::is_same_v<T, bool>) return "bool";
        else if constexpr (std::is_same_v<T, int32_t>) return "int32";
        else if constexpr (std::is_same_v<T, int64_t>) return "int64";
        else if constexpr (std::is_same_v<T, double>) return "double";
        else if constexpr (std::is_same_v<T, std::string>) return "string";
        else if constexpr (std::is_same_v<T, typename V::value_vector>) return "vector";
        else if constexpr (std::is_same_v<T, typename V::value_map>) return "map";
        else return "object";
    }, val.data);
}

// ============================================================
// Value - default single-threaded types
//
// Fastest choice when a value tree never leaves its thread.
// WARNING: sharing these across threads is a data race on the refcounts.
// Value, ValueMap and ImmutableObject themselves live in value_fwd.h.
// ============================================================
using ValueBox    = BasicValueBox<unsafe_memory_policy>;
using ValueVector = BasicValueVector<unsafe_memory_policy>;

#if IMVAL_ENABLE_THREAD_SAFE
// ============================================================
// SyncValue - atomic refcounts
//
// Use when several threads derive new versions from the same base.
// ============================================================
using SyncValueBox    = BasicValueBox<thread_safe_memory_policy>;
using SyncValueVector = BasicValueVector<thread_safe_memory_policy>;
#endif

// ============================================================
// Utility functions
// ============================================================

/// Single-line rendering, e.g. `object{a: 1, b: {c: "x"}, d: [1, 2]}`
[[nodiscard]] IMVAL_API std::string value_to_string(const Value& val);

/// Print Value with indentation, one entry per line
IMVAL_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

/// Convert Path to dot-notation string (e.g. ".settings.theme"), "/" for the root
[[nodiscard]] IMVAL_API std::string path_to_string(const Path& path);

// ============================================================
// Extern Template Declarations
//
// Instantiated once in value.cpp.
// ============================================================

IMVAL_EXTERN_TEMPLATE struct BasicValue<unsafe_memory_policy>;
IMVAL_EXTERN_TEMPLATE class BasicValueMap<unsafe_memory_policy>;
IMVAL_EXTERN_TEMPLATE class BasicImmutableObject<unsafe_memory_policy>;

#if IMVAL_ENABLE_THREAD_SAFE
IMVAL_EXTERN_TEMPLATE struct BasicValue<thread_safe_memory_policy>;
IMVAL_EXTERN_TEMPLATE class BasicValueMap<thread_safe_memory_policy>;
IMVAL_EXTERN_TEMPLATE class BasicImmutableObject<thread_safe_memory_policy>;
#endif

} // namespace imval
