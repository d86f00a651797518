#include "starmap/editing/RouteEditor.h"
#include "starmap/core/GeometryUtils.h"
#include "starmap/model/SystemCatalog.h"
#include "starmap/common/Logger.h"

#include <algorithm>
#include <set>

namespace starmap {

namespace {

// Anchor positions of a simple route, nullopt if either system is missing
std::optional<std::pair<Point, Point>> anchorPositions(const Route& route, const ISystemLookup& lookup) {
    auto ends = route.effectiveEndpoints();
    auto start = lookup.getPosition(ends.start);
    auto end = lookup.getPosition(ends.end);
    if (!start || !end) {
        return std::nullopt;
    }
    return std::make_pair(*start, *end);
}

bool hasDuplicates(const std::vector<SystemId>& members) {
    std::set<SystemId> unique(members.begin(), members.end());
    return unique.size() != members.size();
}

}  // namespace

std::string RouteEditor::defaultRouteName(const SystemId& start, const SystemId& end,
                                          const ISystemLookup& lookup) {
    return lookup.getName(start).value_or(start) + " - " + lookup.getName(end).value_or(end);
}

bool RouteEditor::routeExistsBetween(const SystemId& a, const SystemId& b,
                                     const RouteMap& routes,
                                     const std::vector<RouteId>& ignore) {
    for (const auto& [id, route] : routes) {
        if (std::find(ignore.begin(), ignore.end(), id) != ignore.end()) continue;
        if (route.connects(a, b)) {
            return true;
        }
    }
    return false;
}

RouteEditResult<Route> RouteEditor::createRoute(const RouteId& newId,
                                                const SystemId& start, const SystemId& end,
                                                const RouteMap& existingRoutes,
                                                const ISystemLookup& lookup,
                                                const Polyline& shapePoints,
                                                int routeClass) {
    using Result = RouteEditResult<Route>;

    if (start == end) {
        return Result::fail(RouteEditError::SameSystem,
                            "Cannot create a route from a system to itself");
    }
    for (const auto& id : {start, end}) {
        if (!lookup.hasSystem(id)) {
            return Result::fail(RouteEditError::UnknownSystem, "System " + id + " does not exist");
        }
    }
    if (routeExistsBetween(start, end, existingRoutes)) {
        return Result::fail(RouteEditError::DuplicateRoute,
                            "A route between " + defaultRouteName(start, end, lookup) + " already exists");
    }

    Route route(newId, defaultRouteName(start, end, lookup), start, end);
    route.setShapePoints(shapePoints);
    route.attributes().setRouteClass(routeClass);

    LOG_DEBUG("Created route {} '{}' with {} shape points", newId, route.name(), shapePoints.size());
    return Result::ok(std::move(route));
}

RouteEditResult<Route> RouteEditor::insertSystem(const Route& route, const SystemId& systemId,
                                                 size_t index, const ISystemLookup& lookup) {
    using Result = RouteEditResult<Route>;

    if (!lookup.hasSystem(systemId)) {
        return Result::fail(RouteEditError::UnknownSystem, "System " + systemId + " does not exist");
    }
    if (route.containsSystem(systemId)) {
        return Result::fail(RouteEditError::SystemAlreadyInRoute,
                            "This system is already part of the selected route");
    }

    auto members = route.effectiveMemberSystems();
    if (index > members.size()) {
        return Result::fail(RouteEditError::InvalidIndex,
                            "Insert position " + std::to_string(index) + " is out of range");
    }
    members.insert(members.begin() + static_cast<std::ptrdiff_t>(index), systemId);

    Route updated = route;
    updated.setMembers(members);
    LOG_DEBUG("Inserted system {} into route {} at {}", systemId, route.id(), index);
    return Result::ok(std::move(updated));
}

std::optional<size_t> RouteEditor::insertionIndexFor(const Route& route, const Point& point,
                                                     const ISystemLookup& lookup) {
    Polyline anchors;
    for (const auto& systemId : route.effectiveMemberSystems()) {
        auto pos = lookup.getPosition(systemId);
        if (!pos) {
            return std::nullopt;
        }
        anchors.push_back(*pos);
    }

    auto hit = geometry::nearestSegment(point, anchors);
    if (hit.segmentIndex < 0) {
        return std::nullopt;
    }
    return static_cast<size_t>(hit.segmentIndex) + 1;
}

RouteEditResult<Route> RouteEditor::removeSystem(const Route& route, const SystemId& systemId) {
    using Result = RouteEditResult<Route>;

    auto members = route.effectiveMemberSystems();
    auto it = std::find(members.begin(), members.end(), systemId);
    if (it == members.end()) {
        return Result::fail(RouteEditError::SystemNotInRoute,
                            "This system is not part of the selected route");
    }
    if (members.size() <= 2) {
        return Result::fail(RouteEditError::BelowMinimumSystems,
                            "Route must have at least 2 systems. Delete the route instead.");
    }
    members.erase(it);

    Route updated = route;
    updated.setMembers(members);
    LOG_DEBUG("Removed system {} from route {}, {} members left", systemId, route.id(), members.size());
    return Result::ok(std::move(updated));
}

RouteEditResult<Route> RouteEditor::insertPointOnSegment(const Route& route, const Point& clickPosition,
                                                         const ISystemLookup& lookup) {
    using Result = RouteEditResult<Route>;

    if (route.isChain()) {
        return Result::fail(RouteEditError::ChainModeUnsupported,
                            "Shape points are not available on chain routes");
    }
    auto anchors = anchorPositions(route, lookup);
    if (!anchors) {
        return Result::fail(RouteEditError::MissingSystemReference,
                            "Route " + route.id() + " references a missing system");
    }

    // Control polygon: segment i joins controls[i] and controls[i+1],
    // so a point on it becomes shape point i
    Polyline controls;
    controls.push_back(anchors->first);
    controls.insert(controls.end(), route.shapePoints().begin(), route.shapePoints().end());
    controls.push_back(anchors->second);

    auto hit = geometry::nearestSegment(clickPosition, controls);
    Polyline shape = route.shapePoints();
    shape.insert(shape.begin() + hit.segmentIndex, clickPosition);

    Route updated = route;
    updated.setShapePoints(std::move(shape));
    LOG_DEBUG("Inserted shape point into route {} at {}", route.id(), hit.segmentIndex);
    return Result::ok(std::move(updated));
}

RouteEditResult<Route> RouteEditor::deleteShapePoint(const Route& route, size_t index) {
    using Result = RouteEditResult<Route>;

    if (route.isChain()) {
        return Result::fail(RouteEditError::ChainModeUnsupported,
                            "Shape points are not available on chain routes");
    }
    if (index >= route.shapePoints().size()) {
        return Result::fail(RouteEditError::InvalidIndex,
                            "Shape point " + std::to_string(index) + " does not exist");
    }

    Polyline shape = route.shapePoints();
    shape.erase(shape.begin() + static_cast<std::ptrdiff_t>(index));

    Route updated = route;
    updated.setShapePoints(std::move(shape));
    return Result::ok(std::move(updated));
}

RouteEditResult<Route> RouteEditor::moveShapePoint(const Route& route, size_t index, const Point& position) {
    using Result = RouteEditResult<Route>;

    if (route.isChain()) {
        return Result::fail(RouteEditError::ChainModeUnsupported,
                            "Shape points are not available on chain routes");
    }
    if (index >= route.shapePoints().size()) {
        return Result::fail(RouteEditError::InvalidIndex,
                            "Shape point " + std::to_string(index) + " does not exist");
    }

    Polyline shape = route.shapePoints();
    shape[index] = position;

    Route updated = route;
    updated.setShapePoints(std::move(shape));
    return Result::ok(std::move(updated));
}

RouteEditResult<Route> RouteEditor::reshapeFromStroke(const Route& route, const Polyline& rawStroke,
                                                      const ISystemLookup& lookup,
                                                      size_t decimateTarget, int smoothingWindow) {
    using Result = RouteEditResult<Route>;

    if (route.isChain()) {
        return Result::fail(RouteEditError::ChainModeUnsupported,
                            "Freehand reshape is only available on two-system routes");
    }
    auto anchors = anchorPositions(route, lookup);
    if (!anchors) {
        return Result::fail(RouteEditError::MissingSystemReference,
                            "Route " + route.id() + " references a missing system");
    }
    if (rawStroke.size() < 2) {
        return Result::ok(resetToStraight(route));
    }

    Polyline points = geometry::smooth(geometry::decimate(rawStroke, decimateTarget), smoothingWindow);

    // Snap to the live anchors so the path meets its systems exactly
    points.front() = anchors->first;
    points.back() = anchors->second;

    Route updated = route;
    updated.setShapePoints(Polyline(points.begin() + 1, points.end() - 1));
    LOG_DEBUG("Reshaped route {} from {} stroke points to {} shape points",
              route.id(), rawStroke.size(), updated.shapePoints().size());
    return Result::ok(std::move(updated));
}

Route RouteEditor::resetToStraight(const Route& route) {
    Route updated = route;
    updated.clearShapePoints();
    return updated;
}

RouteEditResult<std::pair<Route, Route>> RouteEditor::splitRoute(const Route& route,
                                                                 const SystemId& splitSystem,
                                                                 const RouteId& firstId,
                                                                 const RouteId& secondId,
                                                                 const ISystemLookup& lookup) {
    using Result = RouteEditResult<std::pair<Route, Route>>;

    auto members = route.effectiveMemberSystems();
    int index = route.systemIndex(splitSystem);
    if (index < 0) {
        return Result::fail(RouteEditError::SystemNotInRoute,
                            "This system is not part of the selected route");
    }
    auto splitAt = static_cast<size_t>(index);
    if (splitAt == 0 || splitAt == members.size() - 1) {
        return Result::fail(RouteEditError::SplitAtEndpoint,
                            "Cannot split a route at its first or last system");
    }

    std::vector<SystemId> firstMembers(members.begin(), members.begin() + index + 1);
    std::vector<SystemId> secondMembers(members.begin() + index, members.end());

    Route first(firstId, defaultRouteName(firstMembers.front(), firstMembers.back(), lookup), firstMembers);
    Route second(secondId, defaultRouteName(secondMembers.front(), secondMembers.back(), lookup), secondMembers);
    first.setAttributes(route.attributes());
    second.setAttributes(route.attributes());

    LOG_DEBUG("Split route {} at {} into {} ({} members) and {} ({} members)", route.id(), splitSystem,
              firstId, firstMembers.size(), secondId, secondMembers.size());
    return Result::ok(std::make_pair(std::move(first), std::move(second)));
}

std::optional<MergeOrientation> RouteEditor::findMergeOrientation(const Route& routeA, const Route& routeB) {
    auto a = routeA.effectiveEndpoints();
    auto b = routeB.effectiveEndpoints();
    if (a.end == b.start) return MergeOrientation::EndToStart;
    if (a.end == b.end) return MergeOrientation::EndToEnd;
    if (a.start == b.end) return MergeOrientation::StartToEnd;
    if (a.start == b.start) return MergeOrientation::StartToStart;
    return std::nullopt;
}

std::optional<std::vector<SystemId>> RouteEditor::mergedMembers(const Route& routeA, const Route& routeB,
                                                                RouteEditError& error) {
    if (!findMergeOrientation(routeA, routeB)) {
        error = RouteEditError::NoSharedEndpoint;
        return std::nullopt;
    }

    const auto membersA = routeA.effectiveMemberSystems();
    const auto membersB = routeB.effectiveMemberSystems();
    auto reversedB = membersB;
    std::reverse(reversedB.begin(), reversedB.end());

    // Joins "head" and "tail" where head.back() == tail.front(), dropping the repeated joint
    auto join = [](const std::vector<SystemId>& head, const std::vector<SystemId>& tail) {
        std::vector<SystemId> result = head;
        result.insert(result.end(), tail.begin() + 1, tail.end());
        return result;
    };

    const auto a = routeA.effectiveEndpoints();
    const auto b = routeB.effectiveEndpoints();

    // Routes sharing both endpoints match more than one orientation; try each in order
    std::vector<std::vector<SystemId>> candidates;
    if (a.end == b.start) candidates.push_back(join(membersA, membersB));
    if (a.end == b.end) candidates.push_back(join(membersA, reversedB));
    if (a.start == b.end) candidates.push_back(join(membersB, membersA));
    if (a.start == b.start) candidates.push_back(join(reversedB, membersA));

    for (auto& candidate : candidates) {
        if (!hasDuplicates(candidate)) {
            return candidate;
        }
    }
    error = RouteEditError::SystemAlreadyInRoute;
    return std::nullopt;
}

bool RouteEditor::canMerge(const Route& routeA, const Route& routeB) {
    if (routeA.id() == routeB.id()) {
        return false;
    }
    RouteEditError error = RouteEditError::None;
    return mergedMembers(routeA, routeB, error).has_value();
}

RouteEditResult<Route> RouteEditor::mergeRoutes(const Route& routeA, const Route& routeB,
                                                const RouteId& mergedId,
                                                const ISystemLookup& lookup) {
    using Result = RouteEditResult<Route>;

    RouteEditError error = RouteEditError::None;
    auto members = mergedMembers(routeA, routeB, error);
    if (!members) {
        if (error == RouteEditError::NoSharedEndpoint) {
            return Result::fail(error, "These routes cannot be merged. Routes must share a common endpoint.");
        }
        return Result::fail(error, "Merging these routes would visit a system twice");
    }

    Route merged(mergedId, defaultRouteName(members->front(), members->back(), lookup), *members);
    merged.setAttributes(routeA.attributes());

    LOG_DEBUG("Merged routes {} and {} into {} with {} members", routeA.id(), routeB.id(),
              mergedId, members->size());
    return Result::ok(std::move(merged));
}

}  // namespace starmap
