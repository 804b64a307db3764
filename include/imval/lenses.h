// lenses.h - lager lenses over ImmutableObject properties

#pragma once

#include "api.h"
#include "immutable_object.h"
#include "value.h"

#include <lager/lens.hpp>
#include <lager/lenses.hpp>

#include <string>

namespace imval {

using ValueLens = lager::lens<Value, Value>;

namespace detail {

/// Write one property of a whole-state Value.
/// Sealed objects go through the merge engine; plain maps are updated as
/// plain maps. Anything else can't hold properties.
[[nodiscard]] IMVAL_API Value write_property(const Value& whole, const std::string& name, Value part);

} // namespace detail

/// @brief Lens focusing the property `name` of an object or plain map
///
/// - view: the property's value, null when absent
/// - set/over: a new whole with the property replaced (shallow, like
///   set_property); the old whole is untouched
/// @throws NotImmutableError from set/over when the whole is not a mapping
///
/// @code
///   auto state = Value{create({Value::map({{"theme", "dark"}})})};
///   auto lens  = property_lens("theme");
///   lager::view(lens, state);                      // "dark"
///   auto next = lager::set(lens, state, Value{"light"});
/// @endcode
[[nodiscard]] inline auto property_lens(const std::string& name)
{
    return lager::lenses::getset(
        // Getter
        [name](const Value& whole) -> Value {
            if (auto* obj = whole.get_if<ImmutableObject>()) {
                if (auto* found = obj->find(name)) return found->get();
                return Value{};
            }
            if (auto* map = whole.get_if<ValueMap>()) {
                if (auto* found = map->find(name)) return found->get();
            }
            return Value{};
        },
        // Setter
        [name](Value whole, Value part) -> Value {
            return detail::write_property(whole, name, std::move(part));
        });
}

/// @brief property_lens, type-erased
[[nodiscard]] IMVAL_API ValueLens object_lens(const std::string& name);

/// @brief Composition of object_lens for every key of path
///
/// The empty path is the identity lens. Setting through a path rebuilds
/// each level on the way up with set_property, so siblings along the path
/// stay shared with the old whole.
[[nodiscard]] IMVAL_API ValueLens path_lens(const Path& path);

} // namespace imval
