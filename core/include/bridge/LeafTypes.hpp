#ifndef BRIDGE_LEAFTYPES_HPP
#define BRIDGE_LEAFTYPES_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>

#include <bridge/Config.hpp>
#include <bridge/NativeTypes.hpp>
#include <bridge/SharedHandle.hpp>
#include <bridge/ZeroCopyBuffer.hpp>
#include <bridge/meta/typelist.hpp>
#include <bridge/meta/utils.hpp>

#if BRIDGE_ENABLE_UUID
#include <boost/uuid/uuid.hpp>
#endif

#if BRIDGE_ENABLE_STACKTRACE
#include <stacktrace>
#endif

namespace bridge {

/// the unit value, e.g. the result of a callback that returns nothing
using Unit = std::monostate;

namespace leaves {

// std::size_t may alias one of the fixed-width types; duplicates are harmless for membership tests
using primitive_leaves = meta::typelist<std::int8_t, std::int16_t, std::int32_t, std::int64_t, //
    std::uint8_t, std::uint16_t, std::uint32_t, std::uint64_t, std::size_t,                   //
    float, double, bool, Unit, std::string>;

#if BRIDGE_RESTRICTED_PLATFORM
using native_leaves = meta::typelist<ForeignObject, ScriptValue>;
#else
using native_leaves = meta::typelist<ForeignObject, NativeCarrier>;
#endif

#if BRIDGE_ENABLE_DATE_TIME
#if __cpp_lib_chrono >= 201907L
// zoned local date-times need the time-zone database of the standard library
using zoned_date_time_leaves = meta::typelist<std::chrono::zoned_time<std::chrono::microseconds>>;
#else
using zoned_date_time_leaves = meta::typelist<>;
#endif
using date_time_leaves = meta::concat<meta::typelist<std::chrono::nanoseconds, std::chrono::microseconds, std::chrono::milliseconds, std::chrono::seconds, //
                                          std::chrono::system_clock::time_point, std::chrono::sys_time<std::chrono::microseconds>,                    //
                                          std::chrono::local_time<std::chrono::microseconds>>,
    zoned_date_time_leaves>;
#else
using date_time_leaves = meta::typelist<>;
#endif

#if BRIDGE_ENABLE_UUID
using unique_id_leaves = meta::typelist<boost::uuids::uuid>;
#else
using unique_id_leaves = meta::typelist<>;
#endif

#if BRIDGE_ENABLE_STACKTRACE
using diagnostic_leaves = meta::typelist<std::stacktrace>;
#else
using diagnostic_leaves = meta::typelist<>;
#endif

/// every built-in identity leaf of this build configuration
using identity_leaves = meta::concat<primitive_leaves, native_leaves, date_time_leaves, unique_id_leaves, diagnostic_leaves>;

/// container shapes that have a structural conversion rule; leaves must never be one of these
template<typename T>
struct is_structural_shape : std::bool_constant<meta::vector_type<T> || meta::optional_type<T> || meta::array_type<T> || meta::unique_ptr_type<T> || meta::pair_type<T> || meta::std_tuple_type<T> //
                                               || is_shared_handle<std::remove_cv_t<T>>::value || meta::is_instantiation_of<std::remove_cv_t<T>, ZeroCopyBuffer>> {};

static_assert(identity_leaves::none_of<is_structural_shape>, "an identity leaf must not overlap with a structural conversion rule");

} // namespace leaves

/**
 * @brief registry entry point for identity leaves, i.e. types that cross the boundary unchanged.
 *
 * Specialise to std::true_type to register a boundary-native type of your own. The type must also be
 * boundary-representable (see is_boundary_representable) and must not be a container shape that already
 * has a structural rule, otherwise the rule lookup becomes ambiguous and the build fails.
 */
template<typename T>
struct is_identity_leaf : std::bool_constant<leaves::identity_leaves::contains<T>> {};

template<typename T>
concept IdentityLeaf = is_identity_leaf<T>::value;

} // namespace bridge

#endif // BRIDGE_LEAFTYPES_HPP
