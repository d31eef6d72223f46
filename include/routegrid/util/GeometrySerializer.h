#pragma once

#include "../geometry/GeometrySnapshot.h"

#include <string>

namespace routegrid {

/// JSON serialization and file I/O for geometry snapshots.
///
/// Used to record a diagram's geometry for offline inspection of the
/// routing matrix and to load fixtures.
class GeometrySerializer {
public:
    /// Serialize snapshot to JSON string
    static std::string toJson(const GeometrySnapshot& snapshot);

    /// Parse JSON string into a snapshot
    /// @throws std::runtime_error if parsing fails
    static GeometrySnapshot fromJson(const std::string& json);

    /// @return true if save succeeded
    static bool saveToFile(const GeometrySnapshot& snapshot, const std::string& path);

    /// @param snapshot Populated only when loading succeeds
    /// @return true if load succeeded
    static bool loadFromFile(GeometrySnapshot& snapshot, const std::string& path);
};

}  // namespace routegrid
