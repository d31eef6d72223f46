#include "routegrid/routing/config/RoutingOptions.h"

#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace routegrid {

void RoutingOptions::validate() const {
    if (scalingFactor <= 0) {
        throw std::invalid_argument(
            "Scaling factor must be positive, got " + std::to_string(scalingFactor));
    }
}

std::string RoutingOptions::toJson() const {
    json j;
    j["scalingFactor"] = scalingFactor;
    return j.dump(2);
}

RoutingOptions RoutingOptions::fromJson(const std::string& jsonStr) {
    RoutingOptions options;
    try {
        json j = json::parse(jsonStr);
        options.scalingFactor = j.value("scalingFactor", constants::DEFAULT_SCALING_FACTOR);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse RoutingOptions JSON: ") + e.what());
    }
    options.validate();
    return options;
}

}  // namespace routegrid
