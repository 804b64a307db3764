// terminal.h - Leaf/mapping classification used by the merge engine

#pragma once

#include "errors.h"
#include "value.h"

namespace imval {

/// @brief True if a deep merge must replace this value wholesale
///
/// Everything except plain maps and sealed objects is terminal: null,
/// scalars, strings and arrays. Arrays are never merged element-wise.
template <typename MemoryPolicy>
[[nodiscard]] bool is_terminal(const BasicValue<MemoryPolicy>& val) noexcept
{
    using V = BasicValue<MemoryPolicy>;
    return !(val.template is<typename V::value_map>() ||
             val.template is<typename V::immutable_object>());
}

template <typename MemoryPolicy>
[[nodiscard]] bool is_mapping(const BasicValue<MemoryPolicy>& val) noexcept
{
    return !is_terminal(val);
}

/// @brief Ordered entries of a mapping of either kind, nullptr for terminals
template <typename MemoryPolicy>
[[nodiscard]] const BasicValueMap<MemoryPolicy>* mapping_fields(const BasicValue<MemoryPolicy>& val) noexcept
{
    using V = BasicValue<MemoryPolicy>;
    if (auto* m = val.template get_if<typename V::value_map>()) return m;
    if (auto* o = val.template get_if<typename V::immutable_object>()) return &o->fields();
    return nullptr;
}

/// @brief Reject a deep-merge pair unless both sides are mappings
/// @param path Location of the pair, reported in the exception
/// @throws MalformedMergePairError
template <typename MemoryPolicy>
void check_merge_object_args(const BasicValue<MemoryPolicy>& base,
                             const BasicValue<MemoryPolicy>& patch,
                             const Path& path)
{
    if (is_mapping(base) && is_mapping(patch)) {
        return;
    }
    auto where = path_to_string(path);
#if IMVAL_VERBOSE_LOG
    detail::log_validation_error("check_merge_object_args",
                                 "cannot merge " + type_name(patch) + " into " + type_name(base) + " at " + where);
#endif
    throw MalformedMergePairError(std::move(where), type_name(base), type_name(patch));
}

} // namespace imval
