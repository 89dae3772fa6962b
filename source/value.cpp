// value.cpp - Value type utilities

#include <diffx/value.h>
#include <diffx/serialization.h>

#include <iostream>

namespace diffx {

std::string_view kind_name(ValueKind kind) noexcept
{
    switch (kind) {
        case ValueKind::Null:     return "null";
        case ValueKind::Bool:     return "bool";
        case ValueKind::Number:   return "number";
        case ValueKind::String:   return "string";
        case ValueKind::Sequence: return "sequence";
        case ValueKind::Mapping:  return "mapping";
    }
    return "unknown";
}

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, double>) {
            return number_to_string(arg);
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "{mapping:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "[sequence:" + std::to_string(arg.size()) + "]";
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

            if constexpr (std::is_same_v<T, ValueMap>) {
                for (const auto& [k, v] : arg) {
                    std::cout << indent << prefix << k << ":\n";
                    print_value(*v, "", depth + 1);
                }
            } else if constexpr (std::is_same_v<T, ValueVector>) {
                for (std::size_t i = 0; i < arg.size(); ++i) {
                    std::cout << indent << prefix << "[" << i << "]:\n";
                    print_value(*arg[i], "", depth + 1);
                }
            } else if constexpr (std::is_same_v<T, std::string>) {
                std::cout << indent << prefix << arg << "\n";
            } else {
                std::cout << indent << prefix << value_to_string(val) << "\n";
            }
        },
        val.data);
}

std::string path_to_string(const Path& path)
{
    std::string result;
    for (const auto& elem : path) {
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                if (!result.empty()) result += '.';
                result += v;
            } else if constexpr (std::is_same_v<T, IdSelector>) {
                result += "[" + v.key + "=" + v.id + "]";
            } else {
                result += "[" + std::to_string(v) + "]";
            }
        }, elem);
    }
    return result;
}

namespace {

template <typename To, typename From>
BasicValue<To> convert_policy(const BasicValue<From>& val)
{
    return std::visit([](const auto& arg) -> BasicValue<To> {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, typename BasicValue<From>::value_map>) {
            auto t = typename BasicValue<To>::value_map{}.transient();
            for (const auto& [k, v] : arg) {
                t.set(k, typename BasicValue<To>::value_box{convert_policy<To>(*v)});
            }
            return BasicValue<To>{t.persistent()};
        } else if constexpr (std::is_same_v<T, typename BasicValue<From>::value_vector>) {
            auto t = typename BasicValue<To>::value_vector{}.transient();
            for (const auto& v : arg) {
                t.push_back(typename BasicValue<To>::value_box{convert_policy<To>(*v)});
            }
            return BasicValue<To>{t.persistent()};
        } else if constexpr (std::is_same_v<T, std::monostate>) {
            return BasicValue<To>{};
        } else {
            return BasicValue<To>{arg};
        }
    }, val.data);
}

} // anonymous namespace

SyncValue to_sync_value(const Value& val)
{
    return convert_policy<thread_safe_memory_policy>(val);
}

Value from_sync_value(const SyncValue& val)
{
    return convert_policy<unsafe_memory_policy>(val);
}

// ============================================================
// Explicit Template Instantiations
//
// Matching 'extern template' declarations live in value.h.
// ============================================================

template struct BasicValue<unsafe_memory_policy>;
template struct BasicValue<thread_safe_memory_policy>;
template class BasicValueMap<unsafe_memory_policy>;
template class BasicValueMap<thread_safe_memory_policy>;

} // namespace diffx
