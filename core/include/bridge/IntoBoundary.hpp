#ifndef BRIDGE_INTOBOUNDARY_HPP
#define BRIDGE_INTOBOUNDARY_HPP

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <bridge/BoundaryRepresentable.hpp>
#include <bridge/LeafTypes.hpp>
#include <bridge/SharedHandle.hpp>
#include <bridge/ZeroCopyBuffer.hpp>
#include <bridge/meta/utils.hpp>

namespace bridge {

/**
 * @brief conversion rule lowering a value of shape `Source` into its boundary-representable shape.
 *
 * There is exactly one rule per structural shape (sequence, optional, shared handle, zero-copy buffer,
 * fixed-size array, box, pair and tuples of arity 2..5) plus the identity rule for registered leaves.
 * Each rule provides:
 *  - `target_type`, determined by the source shape alone,
 *  - `rule`, a short name of the shape it handles,
 *  - `static target_type convert(Source&&)`, recursing into `IntoBoundary<Nested>` for nested shapes,
 *  - `static std::string describe()`, the rule chain selected for `Source`.
 *
 * The primary template is intentionally left undefined: a shape without a rule is a build error, and so
 * is a shape matched by two rules. There is no generic "any T converts to itself" rule, since it would
 * overlap with every container rule; leaves have to be registered (see is_identity_leaf).
 */
template<typename Source>
struct IntoBoundary;

template<typename S>
concept ConvertibleIntoBoundary = requires { typename IntoBoundary<S>::target_type; } && BoundaryRepresentable<typename IntoBoundary<S>::target_type>;

template<ConvertibleIntoBoundary S>
using into_boundary_t = typename IntoBoundary<S>::target_type;

template<typename S, typename D>
concept ConvertsTo = ConvertibleIntoBoundary<S> && std::same_as<into_boundary_t<S>, D>;

// sequence /////////////////
template<ConvertibleIntoBoundary T, typename Alloc>
struct IntoBoundary<std::vector<T, Alloc>> {
    using source_type  = std::vector<T, Alloc>;
    using element_type = into_boundary_t<T>;
    using target_type  = std::vector<element_type, typename std::allocator_traits<Alloc>::template rebind_alloc<element_type>>;

    static constexpr std::string_view rule = "sequence";

    [[nodiscard]] static constexpr target_type convert(source_type&& value) {
        if constexpr (std::same_as<target_type, source_type> && IdentityLeaf<T>) {
            return std::move(value); // element-wise identity: hand over the storage
        } else {
            typename target_type::allocator_type allocator(value.get_allocator()); // keeps the state of stateful allocators
            target_type                          result(allocator);
            result.reserve(value.size());
            std::ranges::transform(value, std::back_inserter(result), [](T& element) { return IntoBoundary<T>::convert(std::move(element)); });
            return result;
        }
    }

    [[nodiscard]] static std::string describe() { return fmt::format("{}<{}>", rule, IntoBoundary<T>::describe()); }
};

// optional /////////////////
template<ConvertibleIntoBoundary T>
struct IntoBoundary<std::optional<T>> {
    using source_type = std::optional<T>;
    using target_type = std::optional<into_boundary_t<T>>;

    static constexpr std::string_view rule = "optional";

    [[nodiscard]] static constexpr target_type convert(source_type&& value) {
        return std::move(value).transform([](T&& inner) { return IntoBoundary<T>::convert(std::move(inner)); });
    }

    [[nodiscard]] static std::string describe() { return fmt::format("{}<{}>", rule, IntoBoundary<T>::describe()); }
};

// shared opaque handle /////
template<BoundarySafe T>
struct IntoBoundary<SharedHandle<T>> {
    using source_type = SharedHandle<T>;
    using target_type = SharedHandle<T>;

    static constexpr std::string_view rule = "shared-handle";

    // the payload is opaque to this layer: the handle itself crosses, untouched
    [[nodiscard]] static target_type convert(source_type&& value) noexcept { return std::move(value); }

    [[nodiscard]] static std::string describe() { return fmt::format("{}<{}>", rule, meta::type_name<T>()); }
};

// zero-copy buffer /////////
template<ConvertibleIntoBoundary T>
requires BoundaryRepresentable<ZeroCopyBuffer<into_boundary_t<T>>>
struct IntoBoundary<ZeroCopyBuffer<T>> {
    using source_type = ZeroCopyBuffer<T>;
    using target_type = ZeroCopyBuffer<into_boundary_t<T>>;

    static constexpr std::string_view rule = "zero-copy";

    [[nodiscard]] static constexpr target_type convert(source_type&& value) { return target_type{IntoBoundary<T>::convert(std::move(value.value))}; }

    [[nodiscard]] static std::string describe() { return fmt::format("{}<{}>", rule, IntoBoundary<T>::describe()); }
};

// fixed-size array /////////
template<BoundaryRepresentable T, std::size_t N>
requires BoundaryRepresentable<std::array<T, N>>
struct IntoBoundary<std::array<T, N>> {
    using source_type = std::array<T, N>;
    using target_type = std::array<T, N>;

    static constexpr std::string_view rule = "array";

    // elements are boundary-representable already, no element-wise recursion
    [[nodiscard]] static constexpr target_type convert(source_type&& value) noexcept(std::is_nothrow_move_constructible_v<source_type>) { return std::move(value); }

    [[nodiscard]] static std::string describe() { return fmt::format("{}<{}, {}>", rule, meta::type_name<T>(), N); }
};

// box //////////////////////
template<BoundaryRepresentable T>
struct IntoBoundary<std::unique_ptr<T>> {
    using source_type = std::unique_ptr<T>;
    using target_type = T;

    static constexpr std::string_view rule = "box";

    [[nodiscard]] static constexpr target_type convert(source_type&& value) {
        meta::precondition(value != nullptr);
        source_type box = std::move(value); // the box is released when leaving scope
        return std::move(*box);
    }

    [[nodiscard]] static std::string describe() { return fmt::format("{}<{}>", rule, meta::type_name<T>()); }
};

// pair and tuples //////////
template<ConvertibleIntoBoundary A, ConvertibleIntoBoundary B>
struct IntoBoundary<std::pair<A, B>> {
    using source_type = std::pair<A, B>;
    using target_type = std::pair<into_boundary_t<A>, into_boundary_t<B>>;

    static constexpr std::string_view rule = "pair";

    [[nodiscard]] static constexpr target_type convert(source_type&& value) { //
        return target_type{IntoBoundary<A>::convert(std::move(value.first)), IntoBoundary<B>::convert(std::move(value.second))};
    }

    [[nodiscard]] static std::string describe() { return fmt::format("{}<{}, {}>", rule, IntoBoundary<A>::describe(), IntoBoundary<B>::describe()); }
};

template<ConvertibleIntoBoundary... Ts>
requires(sizeof...(Ts) >= 2UZ && sizeof...(Ts) <= 5UZ)
struct IntoBoundary<std::tuple<Ts...>> {
    using source_type = std::tuple<Ts...>;
    using target_type = std::tuple<into_boundary_t<Ts>...>;

    static constexpr std::string_view rule = "tuple";

    [[nodiscard]] static constexpr target_type convert(source_type&& value) {
        return std::apply([](Ts&&... slots) { return target_type{IntoBoundary<Ts>::convert(std::move(slots))...}; }, std::move(value));
    }

    [[nodiscard]] static std::string describe() {
        const std::array<std::string, sizeof...(Ts)> slots{IntoBoundary<Ts>::describe()...};
        return fmt::format("{}<{}>", rule, fmt::join(slots, ", "));
    }
};

// identity leaves //////////
template<IdentityLeaf T>
struct IntoBoundary<T> {
    static_assert(BoundaryRepresentable<T>, "a registered identity leaf must also be boundary-representable (specialise bridge::is_boundary_representable<T>)");

    using source_type = T;
    using target_type = T;

    static constexpr std::string_view rule = "identity";

    [[nodiscard]] static constexpr target_type convert(source_type&& value) noexcept(std::is_nothrow_move_constructible_v<T>) { return std::move(value); }

    [[nodiscard]] static std::string describe() { return meta::type_name<T>(); }
};

/**
 * @brief lowers `value` into its boundary-representable shape, consuming it.
 *
 * The rule is selected at compile time from the structural type of `value` alone. Only rvalues are
 * accepted since the source must not be used after the conversion.
 *
 * @code
 * std::vector<std::optional<std::tuple<std::uint8_t, std::string>>> rows{std::tuple{std::uint8_t{1}, std::string{"a"}}, std::nullopt};
 * auto lowered = bridge::convert(std::move(rows)); // same shape, every leaf converted
 * auto answer  = bridge::convert(std::make_unique<std::int32_t>(42)); // bare int32, the box is dropped
 * @endcode
 */
template<typename S>
requires(!std::is_lvalue_reference_v<S>) && ConvertibleIntoBoundary<S>
[[nodiscard]] constexpr into_boundary_t<S> convert(S&& value) {
    return IntoBoundary<S>::convert(std::move(value));
}

// conversion consumes the source, lvalues have to be moved in explicitly
template<typename S>
void convert(S& value) = delete;

/// as convert(), with the expected boundary shape spelled out at the call site
template<typename D, typename S>
requires(!std::is_lvalue_reference_v<S>) && ConvertsTo<S, D>
[[nodiscard]] constexpr D convertTo(S&& value) {
    return IntoBoundary<S>::convert(std::move(value));
}

template<typename D, typename S>
D convertTo(S& value) = delete;

} // namespace bridge

#endif // BRIDGE_INTOBOUNDARY_HPP
