#ifndef BRIDGE_ERROR_HPP
#define BRIDGE_ERROR_HPP

#include <exception>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

#include <fmt/format.h>

namespace bridge {

/**
 * @brief runtime error of the collaborators around the dispatcher (sinks, configuration parsing).
 *
 * The conversion itself never produces one: unsupported shapes are rejected at compile time.
 */
struct Error {
    std::string          message;
    std::source_location sourceLocation;

    Error(std::string_view msg = "unknown error", std::source_location location = std::source_location::current()) noexcept : message(msg), sourceLocation(location) {}

    /// wraps an exception escaping an injected collaborator (e.g. a stream transport)
    explicit Error(const std::exception& ex, std::source_location location = std::source_location::current()) noexcept : Error(ex.what(), location) {}

    [[nodiscard]] std::string srcLoc() const noexcept { return fmt::format("{}:{}", sourceLocation.file_name(), sourceLocation.line()); }
};

static_assert(std::is_default_constructible_v<Error>);

} // namespace bridge

template<>
struct fmt::formatter<bridge::Error> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    auto format(const bridge::Error& err, fmt::format_context& ctx) const { return fmt::format_to(ctx.out(), "{} at {}", err.message, err.srcLoc()); }
};

#endif // BRIDGE_ERROR_HPP
