#pragma once

/// @file starmap.h
/// @brief Main header for the StarMap route editing library
///
/// StarMap models hyperlane routes between star systems: simple curved
/// routes, multi-system chains, freehand reshaping, route groups, and the
/// interactive editing rules on top of them.
///
/// Example usage:
/// @code
/// #include <starmap/starmap.h>
///
/// starmap::MapDocument map;
/// map.systems().addSystem("S1", "Sol", {0, 0});
/// map.systems().addSystem("S2", "Vega", {120, 40});
/// auto route = map.createRoute("S1", "S2");
///
/// float hsu = map.getRoute(*route.value).calculateLength(map.systems());
/// starmap::ProjectSerializer::saveToFile(map, "galaxy.json");
/// @endcode

// Core module - Geometry
#include "core/Types.h"
#include "core/GeometryUtils.h"

// Model module - Routes, systems, groups, document
#include "model/RouteAttributes.h"
#include "model/Route.h"
#include "model/SystemCatalog.h"
#include "model/RouteGroup.h"
#include "model/MapDocument.h"

// Editing module - Route editing engine
#include "editing/RouteEditTypes.h"
#include "editing/RouteEditor.h"

// Interactive module - Input decision logic
#include "interactive/InteractionState.h"
#include "interactive/RouteInteractionController.h"

// Support modules
#include "calc/TravelCalculator.h"
#include "config/EditorOptions.h"
#include "util/ProjectSerializer.h"

#include <string>

namespace starmap {

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

}  // namespace starmap
