#ifndef BRIDGE_META_UTILS_HPP
#define BRIDGE_META_UTILS_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cxxabi.h>
#include <iostream>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

namespace bridge::meta {

[[gnu::always_inline]] constexpr void precondition(bool cond, const std::source_location loc = std::source_location::current()) {
    if consteval {
        if (not cond) {
            std::unreachable();
        }
    } else {
        struct handle {
            [[noreturn]] static void failure(std::source_location const& location) {
                std::clog << "failed precondition in " << location.file_name() << ':' << location.line() << ':' << location.column() << ": `" << location.function_name() << "`\n";
                __builtin_trap();
            }
        };

        if (not cond) [[unlikely]] {
            handle::failure(loc);
        }
    }
}

template<template<typename...> class Template, typename Class>
struct is_instantiation : std::false_type {};

template<template<typename...> class Template, typename... Args>
struct is_instantiation<Template, Template<Args...>> : std::true_type {};

template<typename Class, template<typename...> class Template>
concept is_instantiation_of = is_instantiation<Template, Class>::value;

// structural shapes ////////////
template<typename T>
concept vector_type = is_instantiation_of<std::remove_cv_t<T>, std::vector>;

template<typename T>
concept optional_type = is_instantiation_of<std::remove_cv_t<T>, std::optional>;

template<typename T>
concept unique_ptr_type = is_instantiation_of<std::remove_cv_t<T>, std::unique_ptr>;

template<typename T>
concept pair_type = is_instantiation_of<std::remove_cv_t<T>, std::pair>;

template<typename T>
struct is_std_array_type : std::false_type {};

template<typename T, std::size_t N>
struct is_std_array_type<std::array<T, N>> : std::true_type {};

template<typename T>
concept array_type = is_std_array_type<std::remove_cv_t<T>>::value;

/// std::tuple with an arity in [MinArity, MaxArity]
template<typename T, std::size_t MinArity = 0UZ, std::size_t MaxArity = static_cast<std::size_t>(-1)>
concept std_tuple_type = is_instantiation_of<std::remove_cv_t<T>, std::tuple> && (std::tuple_size_v<std::remove_cv_t<T>> >= MinArity) && (std::tuple_size_v<std::remove_cv_t<T>> <= MaxArity);

// type names ///////////////
namespace detail {
template<typename T>
[[nodiscard]] std::string local_type_name() noexcept {
    std::string type_name = typeid(T).name();
    int         status;
    char*       demangled_name = abi::__cxa_demangle(type_name.c_str(), nullptr, nullptr, &status);
    if (status == 0) {
        std::string ret(demangled_name);
        free(demangled_name);
        return ret;
    } else {
        free(demangled_name);
        return typeid(T).name();
    }
}

std::string makePortableTypeName(std::string_view name);

} // namespace detail

/**
 * @brief platform-independent spelling of T, e.g. 'int32', 'float64', 'string' or 'std::vector<uint8>'.
 *
 * Defaulted allocator and deleter arguments as well as implementation-private namespaces
 * (e.g. 'std::__cxx11') are dropped so that names are identical across standard libraries.
 */
template<typename T>
[[nodiscard]] std::string type_name() noexcept {
    return detail::makePortableTypeName(detail::local_type_name<T>());
}

} // namespace bridge::meta

#endif // BRIDGE_META_UTILS_HPP
