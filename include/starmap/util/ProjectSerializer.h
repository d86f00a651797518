#pragma once

#include "../model/Route.h"
#include "../model/RouteGroup.h"

#include <optional>
#include <string>

namespace starmap {

class MapDocument;

/// JSON serialization and file I/O for map documents
///
/// Document layout:
/// @code
/// {
///   "metadata": {"name": "...", "version": "1.0"},
///   "systems": [{"id": "...", "name": "...", "x": 0.0, "y": 0.0}],
///   "routes": [{"id": "...", "name": "...", "start_system_id": "...", "end_system_id": "...",
///               "system_chain": [...], "control_points": [[x, y], ...],
///               "route_class": 3, "travel_type": "normal", "hazards": ["nebula"]}],
///   "route_groups": [{"id": "...", "name": "...", "route_ids": [...]}]
/// }
/// @endcode
///
/// Loading is tolerant: missing route attributes take their defaults and
/// invalid routes or empty groups are skipped with a warning.
class ProjectSerializer {
public:
    // === MapDocument serialization ===

    /// Serialize a document to a JSON string
    static std::string toJson(const MapDocument& document);

    /// Replace a document's contents from a JSON string
    /// @param document Target document, untouched on failure
    /// @return true if parsing succeeded
    static bool fromJson(MapDocument& document, const std::string& json);

    /// @return true if save succeeded
    static bool saveToFile(const MapDocument& document, const std::string& path);

    /// @return true if load succeeded
    static bool loadFromFile(MapDocument& document, const std::string& path);

    // === Single records ===

    static std::string routeToJson(const Route& route);

    /// @return std::nullopt if the JSON is malformed or the route has fewer than 2 distinct systems
    static std::optional<Route> routeFromJson(const std::string& json);

    static std::string groupToJson(const RouteGroup& group);

    /// @return std::nullopt if the JSON is malformed
    static std::optional<RouteGroup> groupFromJson(const std::string& json);
};

}  // namespace starmap
