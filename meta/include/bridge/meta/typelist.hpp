#ifndef BRIDGE_META_TYPELIST_HPP
#define BRIDGE_META_TYPELIST_HPP

#include <concepts>
#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>

namespace bridge::meta {

template<typename... Ts>
struct typelist;

// concat ///////////////
namespace detail {
template<typename...>
struct concat_impl;

template<>
struct concat_impl<> {
    using type = typelist<>;
};

template<typename A>
struct concat_impl<A> {
    using type = typelist<A>;
};

template<typename... As>
struct concat_impl<typelist<As...>> {
    using type = typelist<As...>;
};

template<typename A, typename B>
struct concat_impl<A, B> {
    using type = typelist<A, B>;
};

template<typename... As, typename B>
struct concat_impl<typelist<As...>, B> {
    using type = typelist<As..., B>;
};

template<typename A, typename... Bs>
struct concat_impl<A, typelist<Bs...>> {
    using type = typelist<A, Bs...>;
};

template<typename... As, typename... Bs>
struct concat_impl<typelist<As...>, typelist<Bs...>> {
    using type = typelist<As..., Bs...>;
};

template<typename A, typename B, typename C, typename... More>
struct concat_impl<A, B, C, More...> {
    using type = typename concat_impl<typename concat_impl<A, B>::type, typename concat_impl<C, More...>::type>::type;
};
} // namespace detail

/// flattens typelists (one level) and plain types into a single typelist, preserving order
template<typename... Ts>
using concat = typename detail::concat_impl<Ts...>::type;

// typelist /////////////////
template<typename... Ts>
struct typelist {
    static inline constexpr std::integral_constant<std::size_t, sizeof...(Ts)> size = {};

    static inline constexpr auto index_sequence = std::make_index_sequence<sizeof...(Ts)>();

    template<class F, std::size_t... Is>
    static constexpr void for_each_impl(F&& f, std::index_sequence<Is...>) {
        (f(std::integral_constant<std::size_t, Is>{}, static_cast<Ts*>(nullptr)), ...);
    }

    template<class F>
    static constexpr void for_each(F&& f) {
        for_each_impl(std::forward<F>(f), index_sequence);
    }

    template<std::size_t I>
    requires(I < sizeof...(Ts))
    using at = std::tuple_element_t<I, std::tuple<Ts...>>;

    template<template<typename...> typename Pred>
    constexpr static bool all_of = (Pred<Ts>::value && ...);

    template<template<typename...> typename Pred>
    constexpr static bool any_of = (Pred<Ts>::value || ...);

    template<template<typename...> typename Pred>
    constexpr static bool none_of = (!Pred<Ts>::value && ...);

    template<typename Needle>
    static constexpr std::size_t index_of() {
        std::size_t result = static_cast<std::size_t>(-1);
        meta::typelist<Ts...>::for_each([&](auto index, auto* t) {
            if constexpr (std::is_same_v<Needle, std::remove_pointer_t<decltype(t)>>) {
                if (result == static_cast<std::size_t>(-1)) {
                    result = index;
                }
            }
        });
        return result;
    }

    template<typename T>
    inline static constexpr bool contains = std::disjunction_v<std::is_same<T, Ts>...>;
};

static_assert(std::same_as<concat<typelist<int>, typelist<>, typelist<float, char>>, typelist<int, float, char>>);

} // namespace bridge::meta

#endif // BRIDGE_META_TYPELIST_HPP
