#ifndef BRIDGE_CONVERSIONTRACE_HPP
#define BRIDGE_CONVERSIONTRACE_HPP

#include <cstdio>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

#include <bridge/IntoBoundary.hpp>
#include <bridge/meta/utils.hpp>

namespace bridge {

/// rule chain statically selected for `S`, e.g. "sequence<optional<tuple<uint8, string>>>"
template<ConvertibleIntoBoundary S>
[[nodiscard]] std::string describe() {
    return IntoBoundary<S>::describe();
}

namespace detail {
struct DefaultLogger {
    void operator()(std::string_view ruleChain, std::string_view sourceType, std::string_view targetType, std::source_location loc) const { //
        fmt::print(stderr, "[bridge] {} : {} -> {} @ {}:{}:{}\n", ruleChain, sourceType, targetType, loc.file_name(), loc.line(), loc.column());
    }
};
} // namespace detail

/**
 * @brief converter that reports every conversion to `Logger` before lowering the value.
 *
 * The logger is called with the rule chain, the portable source and target type names and the call site
 * of the conversion. Any callable with that signature can be used, e.g. to collect the conversions a
 * generated binding performs in a test.
 */
template<typename Logger = detail::DefaultLogger>
struct Traced {
    using logger_type = Logger;

    logger_type _logger;

    explicit Traced(logger_type logger = {}) noexcept(std::is_nothrow_move_constructible_v<logger_type>) : _logger(std::move(logger)) {}

    template<typename S>
    requires(!std::is_lvalue_reference_v<S>) && ConvertibleIntoBoundary<S>
    [[nodiscard]] into_boundary_t<S> operator()(S&& value, std::source_location loc = std::source_location::current()) const {
        _logger(IntoBoundary<S>::describe(), meta::type_name<S>(), meta::type_name<into_boundary_t<S>>(), loc);
        return bridge::convert(std::move(value));
    }

    [[nodiscard]] logger_type&       logger() noexcept { return _logger; }
    [[nodiscard]] const logger_type& logger() const noexcept { return _logger; }
};

} // namespace bridge

#endif // BRIDGE_CONVERSIONTRACE_HPP
