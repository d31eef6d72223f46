#pragma once

#include "RoutingTypes.h"

#include <string>

namespace routegrid {

/// Tunables for one routing engine instance.
///
/// Fixed at construction. A larger scaling factor gives a coarser, cheaper
/// grid for big diagrams.
struct RoutingOptions {
    int scalingFactor = constants::DEFAULT_SCALING_FACTOR;

    /// Throws std::invalid_argument if any value is out of range
    void validate() const;

    /// Serialize to JSON string
    std::string toJson() const;

    /// Parse from JSON string; missing keys keep their defaults
    /// @throws std::runtime_error if parsing fails
    /// @throws std::invalid_argument if a value is out of range
    static RoutingOptions fromJson(const std::string& json);
};

}  // namespace routegrid
