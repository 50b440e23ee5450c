#include <bridge/Config.hpp>

#include <algorithm>
#include <ranges>

namespace bridge::config {

std::vector<Feature> enabledFeatures() {
    std::vector<Feature> features;
    for (auto feature : magic_enum::enum_values<Feature>()) {
        if (isEnabled(feature)) {
            features.push_back(feature);
        }
    }
    return features;
}

std::expected<Feature, Error> parseFeature(std::string_view name, std::source_location location) {
    constexpr auto kFeatures = magic_enum::enum_values<Feature>();
    const auto     it        = std::ranges::find_if(kFeatures, [name](Feature feature) { return optionName(feature) == name; });
    if (it == kFeatures.end()) {
        return std::unexpected(Error(fmt::format("unknown feature option '{}'", name), location));
    }
    return *it;
}

} // namespace bridge::config
