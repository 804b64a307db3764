// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// immutable_object.cpp - Shallow and deep merge of ImmutableObjects

#include <imval/immutable_object.h>

namespace imval {

namespace {

template <typename MemoryPolicy>
const BasicImmutableObject<MemoryPolicy>& require_immutable(const BasicValue<MemoryPolicy>& base,
                                                            const char* operation)
{
    if (auto* obj = base.template get_if<BasicImmutableObject<MemoryPolicy>>()) {
        return *obj;
    }
#if IMVAL_VERBOSE_LOG
    detail::log_validation_error(operation, "base is a " + type_name(base) + ", not an ImmutableObject");
#endif
    throw NotImmutableError(operation, type_name(base));
}

template <typename MemoryPolicy>
const BasicValueMap<MemoryPolicy>& require_patch(const BasicValue<MemoryPolicy>& patch,
                                                 const char* operation)
{
    if (auto* fields = mapping_fields(patch)) {
        return *fields;
    }
#if IMVAL_VERBOSE_LOG
    detail::log_validation_error(operation, "patch is a " + type_name(patch) + ", expected a map or object");
#endif
    throw InvalidPatchError(operation, type_name(patch));
}

// Shallow overlay: existing keys keep their slot, new keys are appended
template <typename MemoryPolicy>
BasicValueMap<MemoryPolicy> overlay(const BasicValueMap<MemoryPolicy>& base,
                                    const BasicValueMap<MemoryPolicy>& patch)
{
    if (patch.empty()) {
        return base;
    }
    auto merged = base.transient();
    for (const auto& [key, box] : patch) {
        merged.set(key, box);
    }
    return merged.persistent();
}

template <typename MemoryPolicy>
BasicValue<MemoryPolicy> merge_deep(const BasicValue<MemoryPolicy>& base,
                                    const BasicValue<MemoryPolicy>& patch,
                                    Path& path)
{
    using value_type = BasicValue<MemoryPolicy>;
    using value_box  = BasicValueBox<MemoryPolicy>;
    using object     = BasicImmutableObject<MemoryPolicy>;

    check_merge_object_args(base, patch, path);
    const auto& base_fields  = *mapping_fields(base);
    const auto& patch_fields = *mapping_fields(patch);

    // Starting from the base keeps its order and shares every box the
    // patch doesn't mention; walking the patch in order appends its new keys.
    auto merged = base_fields.transient();
    for (const auto& [key, patch_box] : patch_fields) {
        const value_box* base_box = base_fields.find(key);
        if (!base_box || is_terminal(base_box->get()) || is_terminal(patch_box.get())) {
            merged.set(key, patch_box);
            continue;
        }
        path.push_back(key);
        merged.set(key, value_box{merge_deep(base_box->get(), patch_box.get(), path)});
        path.pop_back();
    }

    if (base.is_object() || patch.is_object()) {
        return value_type{object::seal(merged.persistent())};
    }
    return value_type{merged.persistent()};
}

} // anonymous namespace

// ============================================================
// Construction
// ============================================================

template <typename MemoryPolicy>
BasicImmutableObject<MemoryPolicy> create(const std::vector<BasicValue<MemoryPolicy>>& sources)
{
    BasicValueMap<MemoryPolicy> fields;
    for (const auto& source : sources) {
        if (source.is_null()) {
            continue;
        }
        fields = overlay(fields, require_patch(source, "create"));
    }
    return BasicImmutableObject<MemoryPolicy>::seal(std::move(fields));
}

template <typename MemoryPolicy>
BasicImmutableObject<MemoryPolicy> create(std::initializer_list<BasicValue<MemoryPolicy>> sources)
{
    return create(std::vector<BasicValue<MemoryPolicy>>(sources));
}

// ============================================================
// Shallow merge
// ============================================================

template <typename MemoryPolicy>
BasicImmutableObject<MemoryPolicy> set(const BasicImmutableObject<MemoryPolicy>& base,
                                       const value_arg<MemoryPolicy>& patch)
{
    const auto& patch_fields = require_patch(patch, "set");
    return BasicImmutableObject<MemoryPolicy>::seal(overlay(base.fields(), patch_fields));
}

template <typename MemoryPolicy>
BasicImmutableObject<MemoryPolicy> set(const BasicValue<MemoryPolicy>& base,
                                       const value_arg<MemoryPolicy>& patch)
{
    return set(require_immutable(base, "set"), patch);
}

template <typename MemoryPolicy>
BasicImmutableObject<MemoryPolicy> set_property(const BasicImmutableObject<MemoryPolicy>& base,
                                                const std::string& name,
                                                value_arg<MemoryPolicy> value)
{
    auto fields = base.fields().set(name, BasicValueBox<MemoryPolicy>{std::move(value)});
    return BasicImmutableObject<MemoryPolicy>::seal(std::move(fields));
}

template <typename MemoryPolicy>
BasicImmutableObject<MemoryPolicy> set_property(const BasicValue<MemoryPolicy>& base,
                                                const std::string& name,
                                                value_arg<MemoryPolicy> value)
{
    return set_property(require_immutable(base, "set_property"), name, std::move(value));
}

template <typename MemoryPolicy>
BasicImmutableObject<MemoryPolicy> delete_property(const BasicImmutableObject<MemoryPolicy>& base,
                                                   const std::string& name)
{
    return BasicImmutableObject<MemoryPolicy>::seal(base.fields().erase(name));
}

template <typename MemoryPolicy>
BasicImmutableObject<MemoryPolicy> delete_property(const BasicValue<MemoryPolicy>& base,
                                                   const std::string& name)
{
    return delete_property(require_immutable(base, "delete_property"), name);
}

// ============================================================
// Deep merge
// ============================================================

template <typename MemoryPolicy>
BasicImmutableObject<MemoryPolicy> set_deep(const BasicImmutableObject<MemoryPolicy>& base,
                                            const value_arg<MemoryPolicy>& patch)
{
    using object = BasicImmutableObject<MemoryPolicy>;

    require_patch(patch, "set_deep");
    Path path;
    // base is sealed, so the merged root always is too
    auto merged = merge_deep(BasicValue<MemoryPolicy>{base}, patch, path);
    return merged.template as<object>();
}

template <typename MemoryPolicy>
BasicImmutableObject<MemoryPolicy> set_deep(const BasicValue<MemoryPolicy>& base,
                                            const value_arg<MemoryPolicy>& patch)
{
    return set_deep(require_immutable(base, "set_deep"), patch);
}

template <typename MemoryPolicy>
BasicValue<MemoryPolicy> deep_merge(const BasicValue<MemoryPolicy>& base,
                                    const value_arg<MemoryPolicy>& patch)
{
    Path path;
    return merge_deep(base, patch, path);
}

// ============================================================
// Accessors
// ============================================================

template <typename MemoryPolicy>
std::vector<BasicValue<MemoryPolicy>> values(const BasicImmutableObject<MemoryPolicy>& obj)
{
    std::vector<BasicValue<MemoryPolicy>> result;
    result.reserve(obj.size());
    for (const auto& [key, box] : obj) {
        result.push_back(box.get());
    }
    return result;
}

template <typename MemoryPolicy>
std::vector<BasicValue<MemoryPolicy>> values(const BasicValue<MemoryPolicy>& val)
{
    return values(require_immutable(val, "values"));
}

// ============================================================
// Explicit Instantiations
// ============================================================

#define IMVAL_INSTANTIATE_MERGE_ENGINE(MP)                                                              \
    IMVAL_EXPORT_TEMPLATE BasicImmutableObject<MP> create<MP>(const std::vector<BasicValue<MP>>&);      \
    IMVAL_EXPORT_TEMPLATE BasicImmutableObject<MP> create<MP>(std::initializer_list<BasicValue<MP>>);   \
    IMVAL_EXPORT_TEMPLATE BasicImmutableObject<MP> set<MP>(const BasicImmutableObject<MP>&,             \
                                                           const value_arg<MP>&);                       \
    IMVAL_EXPORT_TEMPLATE BasicImmutableObject<MP> set<MP>(const BasicValue<MP>&, const value_arg<MP>&); \
    IMVAL_EXPORT_TEMPLATE BasicImmutableObject<MP> set_property<MP>(const BasicImmutableObject<MP>&,    \
                                                                    const std::string&, value_arg<MP>); \
    IMVAL_EXPORT_TEMPLATE BasicImmutableObject<MP> set_property<MP>(const BasicValue<MP>&,              \
                                                                    const std::string&, value_arg<MP>); \
    IMVAL_EXPORT_TEMPLATE BasicImmutableObject<MP> delete_property<MP>(const BasicImmutableObject<MP>&, \
                                                                       const std::string&);             \
    IMVAL_EXPORT_TEMPLATE BasicImmutableObject<MP> delete_property<MP>(const BasicValue<MP>&,           \
                                                                       const std::string&);             \
    IMVAL_EXPORT_TEMPLATE BasicImmutableObject<MP> set_deep<MP>(const BasicImmutableObject<MP>&,        \
                                                                const value_arg<MP>&);                  \
    IMVAL_EXPORT_TEMPLATE BasicImmutableObject<MP> set_deep<MP>(const BasicValue<MP>&,                  \
                                                                const value_arg<MP>&);                  \
    IMVAL_EXPORT_TEMPLATE BasicValue<MP> deep_merge<MP>(const BasicValue<MP>&, const value_arg<MP>&);   \
    IMVAL_EXPORT_TEMPLATE std::vector<BasicValue<MP>> values<MP>(const BasicImmutableObject<MP>&);      \
    IMVAL_EXPORT_TEMPLATE std::vector<BasicValue<MP>> values<MP>(const BasicValue<MP>&)

IMVAL_INSTANTIATE_MERGE_ENGINE(unsafe_memory_policy);

#if IMVAL_ENABLE_THREAD_SAFE
IMVAL_INSTANTIATE_MERGE_ENGINE(thread_safe_memory_policy);
#endif

#undef IMVAL_INSTANTIATE_MERGE_ENGINE

} // namespace imval
