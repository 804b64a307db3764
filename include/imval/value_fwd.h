// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_fwd.h
/// @brief Forward declarations for Value, ImmutableObject and Builder types
///
/// Lets headers declare functions over imval types without pulling in
/// value.h (and with it the immer container headers).
///
/// Usage:
/// @code
///   // In header file:
///   #include <imval/value_fwd.h>
///   ImmutableObject load_defaults();
///
///   // In implementation file:
///   #include <imval/immutable_object.h>
///   ImmutableObject load_defaults() { return create<unsafe_memory_policy>({}); }
/// @endcode

#pragma once

#include "imval_config.h"

#include <immer/memory_policy.hpp>

namespace imval {

// ============================================================
// Memory Policy Forward Declarations (must match value.h)
// ============================================================

using unsafe_memory_policy = immer::memory_policy<immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
                                                  immer::unsafe_refcount_policy, immer::no_lock_policy>;

using thread_safe_memory_policy = immer::default_memory_policy;

// ============================================================
// Value Type Forward Declarations
// ============================================================

template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
class BasicValueMap;

template <typename MemoryPolicy>
class BasicImmutableObject;

using Value           = BasicValue<unsafe_memory_policy>;
using ValueMap        = BasicValueMap<unsafe_memory_policy>;
using ImmutableObject = BasicImmutableObject<unsafe_memory_policy>;

#if IMVAL_ENABLE_THREAD_SAFE
using SyncValue           = BasicValue<thread_safe_memory_policy>;
using SyncValueMap        = BasicValueMap<thread_safe_memory_policy>;
using SyncImmutableObject = BasicImmutableObject<thread_safe_memory_policy>;
#endif

// ============================================================
// Builder Type Forward Declarations
// ============================================================

template <typename MemoryPolicy>
class BasicMapBuilder;
template <typename MemoryPolicy>
class BasicObjectBuilder;
template <typename MemoryPolicy>
class BasicVectorBuilder;

using MapBuilder    = BasicMapBuilder<unsafe_memory_policy>;
using ObjectBuilder = BasicObjectBuilder<unsafe_memory_policy>;
using VectorBuilder = BasicVectorBuilder<unsafe_memory_policy>;

#if IMVAL_ENABLE_THREAD_SAFE
using SyncMapBuilder    = BasicMapBuilder<thread_safe_memory_policy>;
using SyncObjectBuilder = BasicObjectBuilder<thread_safe_memory_policy>;
using SyncVectorBuilder = BasicVectorBuilder<thread_safe_memory_policy>;
#endif

} // namespace imval
