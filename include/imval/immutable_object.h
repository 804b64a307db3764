// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file immutable_object.h
/// @brief Merge engine: derive new ImmutableObjects from a base plus a patch.
///
/// Every operation returns a fresh value and leaves its inputs untouched.
/// Key order rules shared by all of them:
/// - keys present in the base keep the base's order, changed or not
/// - keys only present in the patch are appended, in the patch's order
/// - a deleted key that is set again is appended, not restored
///
/// Entries the patch doesn't touch are carried over as the same immer::box,
/// so unchanged sub-trees are shared between the base and the result.
///
/// Operations taking a base come in two flavours:
/// - typed: `set(const ImmutableObject&, ...)`
/// - dynamic: `set(const Value&, ...)`, which throws NotImmutableError unless
///   the Value holds an ImmutableObject
///
/// Usage:
/// @code
///   auto base = create({Value::map({{"a", 1}, {"b", 2}, {"c", 3}})});
///   auto next = set(base, Value::map({{"b", 20}, {"d", 4}}));
///   // next: {a: 1, b: 20, c: 3, d: 4}, base unchanged
///
///   auto deep = set_deep(next, Value::map({{"e", Value::map({{"f", true}})}}));
/// @endcode
///
/// All functions are defined in immutable_object.cpp and instantiated for
/// unsafe_memory_policy and thread_safe_memory_policy.

#pragma once

#include "errors.h"
#include "terminal.h"
#include "value.h"

#include <initializer_list>
#include <string>
#include <type_traits>
#include <vector>

namespace imval {

/// Parameter type excluded from template argument deduction, so call sites
/// can pass anything convertible to BasicValue (ints, strings, objects...)
template <typename MemoryPolicy>
using value_arg = std::type_identity_t<BasicValue<MemoryPolicy>>;

// ============================================================
// Construction
// ============================================================

/// @brief Shallow-merge every source, in order, into a blank sealed object
///
/// Null sources are skipped.
/// @throws InvalidPatchError if a source is neither null nor a mapping
template <typename MemoryPolicy>
[[nodiscard]] BasicImmutableObject<MemoryPolicy>
create(const std::vector<BasicValue<MemoryPolicy>>& sources);

template <typename MemoryPolicy>
[[nodiscard]] BasicImmutableObject<MemoryPolicy>
create(std::initializer_list<BasicValue<MemoryPolicy>> sources);

/// @brief True if the value holds a sealed ImmutableObject
template <typename MemoryPolicy>
[[nodiscard]] bool is_sealed(const BasicValue<MemoryPolicy>& val) noexcept
{
    return val.is_object();
}

// ============================================================
// Shallow merge
// ============================================================

/// @brief Overlay the patch's entries one level deep
///
/// Shared keys take the patch's value verbatim, even when both sides are
/// mappings.
/// @throws InvalidPatchError if patch is not a map or object
template <typename MemoryPolicy>
[[nodiscard]] BasicImmutableObject<MemoryPolicy>
set(const BasicImmutableObject<MemoryPolicy>& base, const value_arg<MemoryPolicy>& patch);

/// @throws NotImmutableError if base is not an ImmutableObject
/// @throws InvalidPatchError if patch is not a map or object
template <typename MemoryPolicy>
[[nodiscard]] BasicImmutableObject<MemoryPolicy>
set(const BasicValue<MemoryPolicy>& base, const value_arg<MemoryPolicy>& patch);

/// Sugar for `set(base, {name: value})`
template <typename MemoryPolicy>
[[nodiscard]] BasicImmutableObject<MemoryPolicy>
set_property(const BasicImmutableObject<MemoryPolicy>& base, const std::string& name,
             value_arg<MemoryPolicy> value);

template <typename MemoryPolicy>
[[nodiscard]] BasicImmutableObject<MemoryPolicy>
set_property(const BasicValue<MemoryPolicy>& base, const std::string& name,
             value_arg<MemoryPolicy> value);

/// @brief Copy of base without name; remaining keys keep their order
///
/// Deleting an absent key is not an error and yields an equal copy.
template <typename MemoryPolicy>
[[nodiscard]] BasicImmutableObject<MemoryPolicy>
delete_property(const BasicImmutableObject<MemoryPolicy>& base, const std::string& name);

template <typename MemoryPolicy>
[[nodiscard]] BasicImmutableObject<MemoryPolicy>
delete_property(const BasicValue<MemoryPolicy>& base, const std::string& name);

// ============================================================
// Deep merge
// ============================================================

/// @brief Recursively overlay the patch onto base
///
/// For each key of the patch:
/// - absent from base: appended with the patch's value
/// - either side terminal (see is_terminal): the patch's value replaces
/// - both mappings: merged recursively
/// Nested levels are sealed only if the base or the patch at that level was
/// an ImmutableObject; plain nested maps stay plain.
///
/// Arrays are terminal: the patch's array replaces the base's, no
/// element-wise merge.
/// @throws InvalidPatchError if patch is not a map or object
template <typename MemoryPolicy>
[[nodiscard]] BasicImmutableObject<MemoryPolicy>
set_deep(const BasicImmutableObject<MemoryPolicy>& base, const value_arg<MemoryPolicy>& patch);

template <typename MemoryPolicy>
[[nodiscard]] BasicImmutableObject<MemoryPolicy>
set_deep(const BasicValue<MemoryPolicy>& base, const value_arg<MemoryPolicy>& patch);

/// @brief The recursive step behind set_deep, for any two mappings
///
/// Accepts plain maps as well as objects on either side; the result is an
/// ImmutableObject if either input is one, a plain map otherwise.
/// @throws MalformedMergePairError if either side is not a mapping
template <typename MemoryPolicy>
[[nodiscard]] BasicValue<MemoryPolicy>
deep_merge(const BasicValue<MemoryPolicy>& base, const value_arg<MemoryPolicy>& patch);

// ============================================================
// Accessors
// ============================================================

/// @brief Entry values in key order
template <typename MemoryPolicy>
[[nodiscard]] std::vector<BasicValue<MemoryPolicy>>
values(const BasicImmutableObject<MemoryPolicy>& obj);

/// @throws NotImmutableError if val is not an ImmutableObject
template <typename MemoryPolicy>
[[nodiscard]] std::vector<BasicValue<MemoryPolicy>>
values(const BasicValue<MemoryPolicy>& val);

} // namespace imval
