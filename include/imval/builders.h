// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for O(n) construction of patches, arrays and sealed objects.
///
/// - MapBuilder: builds a plain ValueMap, the usual shape of a patch
/// - ObjectBuilder: builds and seals an ImmutableObject
/// - VectorBuilder: builds an array leaf
///
/// Usage:
/// @code
///   #include <imval/builders.h>
///
///   ImmutableObject config = ObjectBuilder()
///       .set("width", 1920)
///       .set("height", 1080)
///       .set("fullscreen", true)
///       .finish();
///
///   Value patch = MapBuilder()
///       .set("fullscreen", false)
///       .finish();
/// @endcode
///
/// Keys keep the order of their first set(); setting a key again replaces its
/// value in place.

#pragma once

#include "value.h"

namespace imval {

/// Builder for a plain (unsealed) ordered map
template <typename MemoryPolicy>
class BasicMapBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_box  = BasicValueBox<MemoryPolicy>;
    using value_map  = BasicValueMap<MemoryPolicy>;

    BasicMapBuilder() : transient_(value_map{}.transient()) {}
    explicit BasicMapBuilder(const value_map& existing) : transient_(existing.transient()) {}

    BasicMapBuilder(BasicMapBuilder&&) noexcept = default;
    BasicMapBuilder& operator=(BasicMapBuilder&&) noexcept = default;

    // A copied transient would alias the same nodes
    BasicMapBuilder(const BasicMapBuilder&) = delete;
    BasicMapBuilder& operator=(const BasicMapBuilder&) = delete;

    /// Set a key-value pair
    /// @param key The key
    /// @param val The value (any type convertible to BasicValue)
    /// @return Reference to this builder for chaining
    template <typename T>
    BasicMapBuilder& set(const std::string& key, T&& val) {
        transient_.set(key, value_box{value_type{std::forward<T>(val)}});
        return *this;
    }

    /// Set a key with an already boxed value (shares it, no copy)
    BasicMapBuilder& set_box(const std::string& key, value_box box) {
        transient_.set(key, std::move(box));
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const { return transient_.contains(key); }

    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    /// Get a previously set value by key
    /// @param key The key to look up
    /// @param default_val Value to return if key doesn't exist (default: null)
    [[nodiscard]] value_type get(const std::string& key, value_type default_val = value_type{}) const {
        if (auto* found = transient_.find(key)) {
            return found->get();
        }
        return default_val;
    }

    /// Finish building and return the map
    /// @note The builder should not be used after calling finish()
    [[nodiscard]] value_type finish() { return value_type{transient_.persistent()}; }

    /// Finish building and return the raw ordered map
    [[nodiscard]] value_map finish_map() { return transient_.persistent(); }

private:
    typename value_map::transient_type transient_;
};

/// Builder for a sealed ImmutableObject
///
/// Same interface as BasicMapBuilder; finish() seals the result.
///   auto next = ObjectBuilder(current)
///       .set("updated", true)
///       .finish();
template <typename MemoryPolicy>
class BasicObjectBuilder {
public:
    using value_type       = BasicValue<MemoryPolicy>;
    using value_box        = BasicValueBox<MemoryPolicy>;
    using value_map        = BasicValueMap<MemoryPolicy>;
    using immutable_object = BasicImmutableObject<MemoryPolicy>;

    BasicObjectBuilder() = default;

    /// Start from the entries of an existing object; the object itself is untouched
    explicit BasicObjectBuilder(const immutable_object& existing) : entries_(existing.fields()) {}

    BasicObjectBuilder(BasicObjectBuilder&&) noexcept = default;
    BasicObjectBuilder& operator=(BasicObjectBuilder&&) noexcept = default;

    BasicObjectBuilder(const BasicObjectBuilder&) = delete;
    BasicObjectBuilder& operator=(const BasicObjectBuilder&) = delete;

    template <typename T>
    BasicObjectBuilder& set(const std::string& key, T&& val) {
        entries_.set(key, std::forward<T>(val));
        return *this;
    }

    BasicObjectBuilder& set_box(const std::string& key, value_box box) {
        entries_.set_box(key, std::move(box));
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const { return entries_.contains(key); }
    [[nodiscard]] std::size_t size() const { return entries_.size(); }

    [[nodiscard]] value_type get(const std::string& key, value_type default_val = value_type{}) const {
        return entries_.get(key, std::move(default_val));
    }

    /// Seal and return the object
    /// @note The builder should not be used after calling finish()
    [[nodiscard]] immutable_object finish() { return immutable_object::seal(entries_.finish_map()); }

private:
    BasicMapBuilder<MemoryPolicy> entries_;
};

/// Builder for an array leaf
template <typename MemoryPolicy>
class BasicVectorBuilder {
public:
    using value_type   = BasicValue<MemoryPolicy>;
    using value_box    = BasicValueBox<MemoryPolicy>;
    using value_vector = BasicValueVector<MemoryPolicy>;

    BasicVectorBuilder() : transient_(value_vector{}.transient()) {}

    BasicVectorBuilder(BasicVectorBuilder&&) noexcept = default;
    BasicVectorBuilder& operator=(BasicVectorBuilder&&) noexcept = default;

    BasicVectorBuilder(const BasicVectorBuilder&) = delete;
    BasicVectorBuilder& operator=(const BasicVectorBuilder&) = delete;

    template <typename T>
    BasicVectorBuilder& push_back(T&& val) {
        transient_.push_back(value_box{value_type{std::forward<T>(val)}});
        return *this;
    }

    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    [[nodiscard]] value_type finish() { return value_type{transient_.persistent()}; }

private:
    typename value_vector::transient_type transient_;
};

// MapBuilder, ObjectBuilder, VectorBuilder and their Sync* variants are
// declared in value_fwd.h.

} // namespace imval
