#pragma once

/// @file routegrid.h
/// @brief Main header for the routegrid smart link routing library
///
/// routegrid rasterizes diagram geometry into a walkability grid so a
/// pathfinder can route links around nodes and ports, and turns the
/// resulting cell path back into drawable diagram coordinates.
///
/// Example usage:
/// @code
/// #include <routegrid/routegrid.h>
///
/// routegrid::GeometrySnapshot snapshot;
/// snapshot.viewport = {800.0f, 600.0f};
/// snapshot.nodes.push_back({1, {100.0f, 100.0f, 50.0f, 50.0f}});
///
/// routegrid::SmartRoutingEngine engine;
/// const auto& matrix = engine.routingMatrix(snapshot);
/// @endcode

// Core module
#include "core/Types.h"
#include "geometry/GeometrySnapshot.h"

// Routing module
#include "routing/config/RoutingTypes.h"
#include "routing/config/RoutingOptions.h"
#include "routing/GridMatrix.h"
#include "routing/BoundingBoxCollector.h"
#include "routing/DimensionCalculator.h"
#include "routing/CoordinateTranslator.h"
#include "routing/CanvasMatrixBuilder.h"
#include "routing/ObstacleRasterizer.h"
#include "routing/RoutingMatrixCache.h"
#include "routing/PathEmitter.h"
#include "routing/api/IGridPathFinder.h"
#include "routing/SmartRoutingEngine.h"

// Utilities
#include "util/GeometrySerializer.h"

#include <string>

namespace routegrid {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace routegrid
