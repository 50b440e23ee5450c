#ifndef BRIDGE_NATIVETYPES_HPP
#define BRIDGE_NATIVETYPES_HPP

#include <cstdint>

#include <fmt/format.h>
#include <magic_enum.hpp>

namespace bridge {

/**
 * @brief handle to an object that lives in, and is owned by, the foreign runtime.
 *
 * The handle value and owning port are assigned by the transport; this layer only passes them through.
 */
class ForeignObject {
    std::uint64_t _handle    = 0UZ;
    std::int64_t  _ownerPort = 0;

public:
    constexpr ForeignObject() noexcept = default;
    constexpr explicit ForeignObject(std::uint64_t handle, std::int64_t ownerPort = 0) noexcept : _handle(handle), _ownerPort(ownerPort) {}

    [[nodiscard]] constexpr std::uint64_t handle() const noexcept { return _handle; }
    [[nodiscard]] constexpr std::int64_t  ownerPort() const noexcept { return _ownerPort; }
    [[nodiscard]] constexpr bool          valid() const noexcept { return _handle != 0UZ; }

    friend constexpr bool operator==(const ForeignObject&, const ForeignObject&) noexcept = default;
};

/// boundary-native tagged message carrier, the unit the physical transport moves
struct NativeCarrier {
    enum class Kind : std::uint8_t { Null, Bool, Int32, Int64, Double, String, Array, TypedData, ExternalTypedData, SendPort, Capability, NativePointer };

    Kind           kind    = Kind::Null;
    std::uintptr_t payload = 0UZ; ///< kind-dependent, owned by the transport

    friend constexpr bool operator==(const NativeCarrier&, const NativeCarrier&) noexcept = default;
};

/// handle into the scripting-value table of a restricted (sandboxed) platform
class ScriptValue {
    std::uint32_t _slot = 0U;

public:
    constexpr ScriptValue() noexcept = default;
    constexpr explicit ScriptValue(std::uint32_t slot) noexcept : _slot(slot) {}

    [[nodiscard]] constexpr std::uint32_t slot() const noexcept { return _slot; }

    friend constexpr bool operator==(const ScriptValue&, const ScriptValue&) noexcept = default;
};

} // namespace bridge

template<>
struct fmt::formatter<bridge::ForeignObject> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    auto format(const bridge::ForeignObject& object, fmt::format_context& ctx) const { return fmt::format_to(ctx.out(), "ForeignObject(handle={:#x}, port={})", object.handle(), object.ownerPort()); }
};

template<>
struct fmt::formatter<bridge::NativeCarrier> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    auto format(const bridge::NativeCarrier& carrier, fmt::format_context& ctx) const { return fmt::format_to(ctx.out(), "NativeCarrier({}, {:#x})", magic_enum::enum_name(carrier.kind), carrier.payload); }
};

template<>
struct fmt::formatter<bridge::ScriptValue> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    auto format(const bridge::ScriptValue& value, fmt::format_context& ctx) const { return fmt::format_to(ctx.out(), "ScriptValue(slot={})", value.slot()); }
};

#endif // BRIDGE_NATIVETYPES_HPP
