// value.cpp - Value type utilities and explicit instantiations

#include <imval/value.h>

#include <iomanip>  // for std::setprecision
#include <iostream>
#include <sstream>  // for std::ostringstream

namespace imval {

namespace {

std::string quote(const std::string& s)
{
    std::ostringstream oss;
    oss << std::quoted(s);
    return oss.str();
}

std::string entries_to_string(const ValueMap& fields)
{
    std::string result = "{";
    bool first = true;
    for (const auto& [key, box] : fields) {
        if (!first) result += ", ";
        first = false;
        result += key + ": " + value_to_string(box.get());
    }
    return result + "}";
}

} // anonymous namespace

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return quote(arg);
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int32_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg) + "L";
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << std::setprecision(6) << arg;
            return oss.str();
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            std::string result = "[";
            for (std::size_t i = 0; i < arg.size(); ++i) {
                if (i > 0) result += ", ";
                result += value_to_string(arg[i].get());
            }
            return result + "]";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return entries_to_string(arg);
        } else if constexpr (std::is_same_v<T, ImmutableObject>) {
            return "object" + entries_to_string(arg.fields());
        } else {
            return "null";
        }
    }, val.data);
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    const std::string indent(depth * 2, ' ');
    std::visit(
        [&](const auto& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, ValueMap> || std::is_same_v<T, ImmutableObject>) {
                if constexpr (std::is_same_v<T, ImmutableObject>) {
                    std::cout << indent << prefix << "(sealed)\n";
                }
                for (const auto& [k, v] : arg) {
                    std::cout << indent << prefix << k << ":\n";
                    print_value(v.get(), "", depth + 1);
                }
            } else if constexpr (std::is_same_v<T, ValueVector>) {
                for (std::size_t i = 0; i < arg.size(); ++i) {
                    std::cout << indent << prefix << "[" << i << "]:\n";
                    print_value(arg[i].get(), "", depth + 1);
                }
            } else {
                std::cout << indent << prefix << value_to_string(val) << "\n";
            }
        },
        val.data);
}

std::string path_to_string(const Path& path)
{
    std::string result;
    for (const auto& key : path) {
        result += "." + key;
    }
    return result.empty() ? "/" : result;
}

// ============================================================
// Explicit Template Instantiations
// ============================================================

IMVAL_EXPORT_TEMPLATE struct BasicValue<unsafe_memory_policy>;
IMVAL_EXPORT_TEMPLATE class BasicValueMap<unsafe_memory_policy>;
IMVAL_EXPORT_TEMPLATE class BasicImmutableObject<unsafe_memory_policy>;

#if IMVAL_ENABLE_THREAD_SAFE
IMVAL_EXPORT_TEMPLATE struct BasicValue<thread_safe_memory_policy>;
IMVAL_EXPORT_TEMPLATE class BasicValueMap<thread_safe_memory_policy>;
IMVAL_EXPORT_TEMPLATE class BasicImmutableObject<thread_safe_memory_policy>;
#endif

} // namespace imval
