#ifndef BRIDGE_BOUNDARYREPRESENTABLE_HPP
#define BRIDGE_BOUNDARYREPRESENTABLE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <bridge/LeafTypes.hpp>
#include <bridge/SharedHandle.hpp>
#include <bridge/ZeroCopyBuffer.hpp>
#include <bridge/meta/typelist.hpp>

namespace bridge {

/**
 * @brief capability of a type to be physically transported across the language boundary.
 *
 * This is the property every conversion target must have. It is owned by the transport layer:
 * specialise it (to std::true_type) for boundary-native types that are not part of the built-in leaf set.
 */
template<typename T>
struct is_boundary_representable : std::bool_constant<leaves::identity_leaves::contains<T>> {};

template<typename T>
concept BoundaryRepresentable = is_boundary_representable<std::remove_cv_t<T>>::value;

template<typename T, typename Alloc>
struct is_boundary_representable<std::vector<T, Alloc>> : is_boundary_representable<T> {};

template<typename T>
struct is_boundary_representable<std::optional<T>> : is_boundary_representable<T> {};

template<typename T, std::size_t N>
struct is_boundary_representable<std::array<T, N>> : is_boundary_representable<T> {};

template<typename A, typename B>
struct is_boundary_representable<std::pair<A, B>> : std::conjunction<is_boundary_representable<A>, is_boundary_representable<B>> {};

template<typename... Ts>
requires(sizeof...(Ts) >= 2UZ && sizeof...(Ts) <= 5UZ)
struct is_boundary_representable<std::tuple<Ts...>> : std::conjunction<is_boundary_representable<Ts>...> {};

template<BoundarySafe T>
struct is_boundary_representable<SharedHandle<T>> : std::true_type {};

// typed-data payloads: contiguous numeric buffers the transport hands over without copying
using typed_data_elements = meta::typelist<std::int8_t, std::int16_t, std::int32_t, std::int64_t, std::uint8_t, std::uint16_t, std::uint32_t, std::uint64_t, float, double>;

template<typename T, typename Alloc>
struct is_boundary_representable<ZeroCopyBuffer<std::vector<T, Alloc>>> : std::bool_constant<typed_data_elements::contains<T>> {};

// a box has to be unwrapped before it may cross
template<typename T, typename Deleter>
struct is_boundary_representable<std::unique_ptr<T, Deleter>> : std::false_type {};

} // namespace bridge

#endif // BRIDGE_BOUNDARYREPRESENTABLE_HPP
