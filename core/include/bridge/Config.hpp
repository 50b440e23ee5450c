#ifndef BRIDGE_CONFIG_HPP
#define BRIDGE_CONFIG_HPP

#include <cstdint>
#include <expected>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <magic_enum.hpp>

#include <bridge/Error.hpp>

// build-time feature switches, normally set by the build system (see CMake options of the same name)
#ifndef BRIDGE_ENABLE_DATE_TIME
#define BRIDGE_ENABLE_DATE_TIME 0
#endif

#ifndef BRIDGE_ENABLE_UUID
#define BRIDGE_ENABLE_UUID 0
#endif

#ifndef BRIDGE_RESTRICTED_PLATFORM
#define BRIDGE_RESTRICTED_PLATFORM 0
#endif

#ifndef BRIDGE_ENABLE_STACKTRACE
#define BRIDGE_ENABLE_STACKTRACE 0
#endif

namespace bridge::config {

enum class Feature : std::uint8_t {
    DateTime,           ///< identity rules for calendar and duration leaves
    UniqueId,           ///< identity rule for the UUID leaf
    RestrictedPlatform, ///< swaps the native carrier leaf for the platform scripting-value leaf
    Stacktrace          ///< identity rule for diagnostic-trace values
};

inline constexpr bool kDateTime           = BRIDGE_ENABLE_DATE_TIME != 0;
inline constexpr bool kUniqueId           = BRIDGE_ENABLE_UUID != 0;
inline constexpr bool kRestrictedPlatform = BRIDGE_RESTRICTED_PLATFORM != 0;
inline constexpr bool kStacktrace         = BRIDGE_ENABLE_STACKTRACE != 0;

[[nodiscard]] constexpr bool isEnabled(Feature feature) noexcept {
    switch (feature) {
    case Feature::DateTime: return kDateTime;
    case Feature::UniqueId: return kUniqueId;
    case Feature::RestrictedPlatform: return kRestrictedPlatform;
    case Feature::Stacktrace: return kStacktrace;
    }
    return false;
}

/// option spelling used by build configurations and code-generator front-ends, e.g. "date-time-support"
[[nodiscard]] constexpr std::string_view optionName(Feature feature) noexcept {
    switch (feature) {
    case Feature::DateTime: return "date-time-support";
    case Feature::UniqueId: return "unique-id-support";
    case Feature::RestrictedPlatform: return "restricted-platform-mode";
    case Feature::Stacktrace: return "diagnostic-trace-support";
    }
    return "unknown";
}

[[nodiscard]] std::vector<Feature> enabledFeatures();

[[nodiscard]] std::expected<Feature, Error> parseFeature(std::string_view name, std::source_location location = std::source_location::current());

} // namespace bridge::config

template<>
struct fmt::formatter<bridge::config::Feature> : fmt::formatter<std::string_view> {
    auto format(bridge::config::Feature feature, fmt::format_context& ctx) const { return fmt::formatter<std::string_view>::format(magic_enum::enum_name(feature), ctx); }
};

#endif // BRIDGE_CONFIG_HPP
