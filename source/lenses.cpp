// lenses.cpp - Type-erased property and path lenses

#include <imval/lenses.h>

#include <zug/compose.hpp>

namespace imval {

namespace detail {

Value write_property(const Value& whole, const std::string& name, Value part)
{
    if (auto* obj = whole.get_if<ImmutableObject>()) {
        return Value{set_property(*obj, name, std::move(part))};
    }
    if (auto* map = whole.get_if<ValueMap>()) {
        return Value{map->set(name, ValueBox{std::move(part)})};
    }
#if IMVAL_VERBOSE_LOG
    log_validation_error("property_lens", "cannot set '" + name + "' on " + type_name(whole));
#endif
    throw NotImmutableError("property_lens", type_name(whole));
}

} // namespace detail

ValueLens object_lens(const std::string& name)
{
    return property_lens(name);
}

// zug::comp is spelled out rather than operator| so lookup doesn't depend
// on ADL finding zug's operator for two lager::lens operands.
ValueLens path_lens(const Path& path)
{
    ValueLens lens = zug::identity;
    for (const auto& key : path) {
        lens = zug::comp(lens, object_lens(key));
    }
    return lens;
}

} // namespace imval
