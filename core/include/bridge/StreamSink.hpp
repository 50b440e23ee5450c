#ifndef BRIDGE_STREAMSINK_HPP
#define BRIDGE_STREAMSINK_HPP

#include <cstddef>
#include <exception>
#include <expected>
#include <functional>
#include <source_location>
#include <string>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

#include <bridge/BoundaryRepresentable.hpp>
#include <bridge/Error.hpp>
#include <bridge/IntoBoundary.hpp>

namespace bridge {

/**
 * @brief producer end of a stream whose elements cross the boundary as `D`.
 *
 * `add()` accepts any host value that lowers to `D` (not only `D` itself), converts it and forwards the
 * result to the transport. The transport is injected and stays outside this library; an exception it
 * throws is returned as an Error.
 */
template<BoundaryRepresentable D>
class StreamSink {
public:
    using value_type     = D;
    using transport_type = std::function<std::expected<void, Error>(D&&)>;

private:
    transport_type _transport;
    std::string    _name;
    std::size_t    _nSent  = 0UZ;
    bool           _closed = false;

public:
    explicit StreamSink(transport_type transport, std::string name = "stream") : _transport(std::move(transport)), _name(std::move(name)) {}

    template<typename S>
    requires(!std::is_lvalue_reference_v<S>) && ConvertsTo<S, D>
    [[nodiscard]] std::expected<void, Error> add(S&& value, std::source_location location = std::source_location::current()) {
        if (_closed) {
            return std::unexpected(Error(fmt::format("stream sink '{}' is closed", _name), location));
        }
        if (!_transport) {
            return std::unexpected(Error(fmt::format("stream sink '{}' has no transport", _name), location));
        }
        std::expected<void, Error> result;
        try {
            result = _transport(bridge::convert(std::move(value)));
        } catch (const std::exception& ex) {
            return std::unexpected(Error(ex, location));
        }
        if (result.has_value()) {
            _nSent++;
        }
        return result;
    }

    /// further add() calls fail; closing twice is harmless
    void close() noexcept { _closed = true; }

    [[nodiscard]] bool               isClosed() const noexcept { return _closed; }
    [[nodiscard]] std::size_t        sent() const noexcept { return _nSent; }
    [[nodiscard]] const std::string& name() const noexcept { return _name; }
};

} // namespace bridge

#endif // BRIDGE_STREAMSINK_HPP
