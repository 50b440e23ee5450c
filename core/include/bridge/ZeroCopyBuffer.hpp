#ifndef BRIDGE_ZEROCOPYBUFFER_HPP
#define BRIDGE_ZEROCOPYBUFFER_HPP

#include <concepts>

#include <fmt/format.h>

#include <bridge/meta/utils.hpp>

namespace bridge {

/// marks a payload that the transport may hand over to the foreign runtime without copying it
template<typename T>
struct ZeroCopyBuffer {
    using value_type = T;

    T value;

    friend constexpr bool operator==(const ZeroCopyBuffer& lhs, const ZeroCopyBuffer& rhs)
    requires std::equality_comparable<T>
    {
        return lhs.value == rhs.value;
    }
};

template<typename T>
ZeroCopyBuffer(T) -> ZeroCopyBuffer<T>;

} // namespace bridge

template<typename T>
struct fmt::formatter<bridge::ZeroCopyBuffer<T>> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    auto format(const bridge::ZeroCopyBuffer<T>& buffer, fmt::format_context& ctx) const {
        if constexpr (requires { buffer.value.size(); }) {
            return fmt::format_to(ctx.out(), "ZeroCopyBuffer<{}>(size={})", bridge::meta::type_name<T>(), buffer.value.size());
        } else {
            return fmt::format_to(ctx.out(), "ZeroCopyBuffer<{}>", bridge::meta::type_name<T>());
        }
    }
};

#endif // BRIDGE_ZEROCOPYBUFFER_HPP
