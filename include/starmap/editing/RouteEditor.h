#pragma once

#include "../core/Types.h"
#include "../model/Route.h"
#include "RouteEditTypes.h"

#include <cstddef>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace starmap {

class ISystemLookup;

using RouteMap = std::map<RouteId, Route>;

/// How two routes join in a merge
/// Names which endpoint of each route is the shared system.
enum class MergeOrientation {
    EndToStart,     ///< end_a == start_b: a + b
    EndToEnd,       ///< end_a == end_b: a + reverse(b)
    StartToEnd,     ///< start_a == end_b: b + a
    StartToStart    ///< start_a == start_b: reverse(b) + a
};

/// Route editing engine
///
/// All operations are pure: they take the current route by const reference
/// and return an updated copy (or pair) on success. A failed operation
/// returns an error and leaves the caller's data untouched.
///
/// Example usage:
/// @code
/// auto result = RouteEditor::splitRoute(route, "S3", ids.next(), ids.next(), catalog);
/// if (!result) {
///     showWarning(errorTitle(result.error), result.reason);
/// }
/// @endcode
class RouteEditor {
public:
    static constexpr size_t DEFAULT_DECIMATE_TARGET = 20;
    static constexpr int DEFAULT_SMOOTHING_WINDOW = 3;

    // === Creation ===

    /// Create a simple-mode route between two systems
    /// Named "<StartName> - <EndName>" from the lookup (snapshot).
    /// @param shapePoints Initial shape points (waypoints clicked while drawing)
    /// @return SameSystem, UnknownSystem or DuplicateRoute on failure
    static RouteEditResult<Route> createRoute(const RouteId& newId,
                                              const SystemId& start, const SystemId& end,
                                              const RouteMap& existingRoutes,
                                              const ISystemLookup& lookup,
                                              const Polyline& shapePoints = {},
                                              int routeClass = RouteAttributes::DEFAULT_CLASS);

    /// True if any route connects {a, b} in either order
    /// @param ignore Routes left out of the check (the ones an edit replaces)
    static bool routeExistsBetween(const SystemId& a, const SystemId& b,
                                   const RouteMap& routes,
                                   const std::vector<RouteId>& ignore = {});

    // === Member systems ===

    /// Insert a system into the member list, converting to chain mode
    /// Shape points are discarded.
    /// @param index Position in the resulting member list, 0..memberCount()
    static RouteEditResult<Route> insertSystem(const Route& route, const SystemId& systemId,
                                               size_t index, const ISystemLookup& lookup);

    /// Member-list position for inserting a system at a world point
    /// The system goes between the two members of the nearest straight
    /// segment, so the route's endpoints never change.
    /// @return std::nullopt if a member system is missing from the lookup
    static std::optional<size_t> insertionIndexFor(const Route& route, const Point& point,
                                                   const ISystemLookup& lookup);

    /// Remove a member system; a 3-member chain demotes to simple mode
    /// @return BelowMinimumSystems if only 2 members remain
    static RouteEditResult<Route> removeSystem(const Route& route, const SystemId& systemId);

    // === Shape points (simple mode only) ===

    /// Insert a shape point at the path segment nearest to the click
    static RouteEditResult<Route> insertPointOnSegment(const Route& route, const Point& clickPosition,
                                                       const ISystemLookup& lookup);

    static RouteEditResult<Route> deleteShapePoint(const Route& route, size_t index);

    static RouteEditResult<Route> moveShapePoint(const Route& route, size_t index, const Point& position);

    /// Replace the shape with a freehand stroke
    /// decimate -> smooth -> snap ends to the current anchors -> keep interior points.
    /// A stroke with fewer than 2 points resets the route to straight.
    static RouteEditResult<Route> reshapeFromStroke(const Route& route, const Polyline& rawStroke,
                                                    const ISystemLookup& lookup,
                                                    size_t decimateTarget = DEFAULT_DECIMATE_TARGET,
                                                    int smoothingWindow = DEFAULT_SMOOTHING_WINDOW);

    /// Clear shape points; idempotent and a no-op for chains
    static Route resetToStraight(const Route& route);

    // === Split / merge ===

    /// Split at an interior member into [start..split] and [split..end]
    /// Both parts inherit attributes and are named from their new endpoints.
    /// @return SystemNotInRoute or SplitAtEndpoint on failure
    static RouteEditResult<std::pair<Route, Route>> splitRoute(const Route& route,
                                                               const SystemId& splitSystem,
                                                               const RouteId& firstId,
                                                               const RouteId& secondId,
                                                               const ISystemLookup& lookup);

    /// Join two routes at a shared endpoint into a chain route
    /// Attributes come from routeA.
    /// @return NoSharedEndpoint, or SystemAlreadyInRoute if the result would repeat a system
    static RouteEditResult<Route> mergeRoutes(const Route& routeA, const Route& routeB,
                                              const RouteId& mergedId,
                                              const ISystemLookup& lookup);

    /// Which of the 4 join orientations applies, checked in order
    /// end_a=start_b, end_a=end_b, start_a=end_b, start_a=start_b
    static std::optional<MergeOrientation> findMergeOrientation(const Route& routeA, const Route& routeB);

    /// True if mergeRoutes would succeed
    static bool canMerge(const Route& routeA, const Route& routeB);

    /// "<StartName> - <EndName>", falling back to IDs for unknown systems
    static std::string defaultRouteName(const SystemId& start, const SystemId& end,
                                        const ISystemLookup& lookup);

private:
    static std::optional<std::vector<SystemId>> mergedMembers(const Route& routeA, const Route& routeB,
                                                              RouteEditError& error);
};

}  // namespace starmap
