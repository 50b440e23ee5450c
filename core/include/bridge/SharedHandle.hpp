#ifndef BRIDGE_SHAREDHANDLE_HPP
#define BRIDGE_SHAREDHANDLE_HPP

#include <memory>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

#include <bridge/meta/utils.hpp>

namespace bridge {

/**
 * @brief opt-out point for payloads that must not be shared with the foreign runtime.
 *
 * Specialise to std::false_type for types whose instances are bound to the creating thread.
 */
template<typename T>
struct is_boundary_safe : std::bool_constant<std::is_object_v<T> && !std::is_pointer_v<T> && std::is_nothrow_destructible_v<T>> {};

template<typename T>
concept BoundarySafe = is_boundary_safe<std::remove_cv_t<T>>::value;

/**
 * @brief shared, reference-counted opaque handle over a host-side payload.
 *
 * The foreign runtime only ever sees the handle, never the payload. Copies share the same payload,
 * and equality is payload identity rather than value equality.
 */
template<BoundarySafe T>
class SharedHandle {
    std::shared_ptr<T> _payload;

public:
    using element_type = T;

    template<typename... Args>
    requires std::is_constructible_v<T, Args&&...>
    explicit SharedHandle(std::in_place_t, Args&&... args) : _payload(std::make_shared<T>(std::forward<Args>(args)...)) {}

    explicit SharedHandle(T value) : _payload(std::make_shared<T>(std::move(value))) {}

    explicit SharedHandle(std::shared_ptr<T> payload) noexcept : _payload(std::move(payload)) { meta::precondition(_payload != nullptr); }

    SharedHandle(const SharedHandle&)            = default;
    SharedHandle(SharedHandle&&)                 = default;
    SharedHandle& operator=(const SharedHandle&) = default;
    SharedHandle& operator=(SharedHandle&&)      = default;
    ~SharedHandle()                              = default;

    [[nodiscard]] const T& operator*() const noexcept { return *_payload; }
    [[nodiscard]] const T* operator->() const noexcept { return _payload.get(); }
    [[nodiscard]] const T* get() const noexcept { return _payload.get(); }
    [[nodiscard]] long     useCount() const noexcept { return _payload.use_count(); }

    friend bool operator==(const SharedHandle& lhs, const SharedHandle& rhs) noexcept { return lhs._payload == rhs._payload; }
};

template<typename T>
struct is_shared_handle : std::false_type {};

template<BoundarySafe T>
struct is_shared_handle<SharedHandle<T>> : std::true_type {};

} // namespace bridge

template<bridge::BoundarySafe T>
struct fmt::formatter<bridge::SharedHandle<T>> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    auto format(const bridge::SharedHandle<T>& handle, fmt::format_context& ctx) const { //
        return fmt::format_to(ctx.out(), "SharedHandle<{}>({}, uses={})", bridge::meta::type_name<T>(), fmt::ptr(handle.get()), handle.useCount());
    }
};

#endif // BRIDGE_SHAREDHANDLE_HPP
