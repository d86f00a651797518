#pragma once

#include "../core/Types.h"
#include "../editing/RouteEditTypes.h"
#include "../editing/RouteEditor.h"
#include "IdGenerator.h"
#include "Route.h"
#include "RouteGroup.h"
#include "SystemCatalog.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace starmap {

struct MapMetadata {
    std::string name = "Unnamed Map";
    std::string version = "1.0";
};

/// One editable star map: systems, routes and route groups
///
/// Applies RouteEditor results atomically. Every mutating call either
/// succeeds completely or returns an error with the document unchanged.
class MapDocument {
public:
    MapDocument();

    // === Systems ===

    SystemCatalog& systems() { return systems_; }
    const SystemCatalog& systems() const { return systems_; }

    /// Remove a system and every route that references it
    /// Groups of deleted routes are pruned.
    /// @return IDs of deleted routes
    std::vector<RouteId> removeSystem(const SystemId& systemId);

    /// Move a system; dependent routes follow on their next evaluation
    /// @throws std::out_of_range if the ID is unknown
    void moveSystem(const SystemId& systemId, Point position);

    // === Routes ===

    /// Create a simple route (see RouteEditor::createRoute)
    RouteEditResult<RouteId> createRoute(const SystemId& start, const SystemId& end,
                                         const Polyline& shapePoints = {},
                                         int routeClass = RouteAttributes::DEFAULT_CLASS);

    /// Insert a loaded or prebuilt route as-is
    /// @throws std::invalid_argument if the ID is already taken
    void addRoute(const Route& route);

    /// Replace a route by an updated copy with the same ID
    /// @return RouteNotFound or UnknownSystem on failure
    RouteEditResult<RouteId> updateRoute(const Route& route);

    RouteEditResult<RouteId> renameRoute(const RouteId& routeId, const std::string& name);
    RouteEditResult<RouteId> setRouteAttributes(const RouteId& routeId, const RouteAttributes& attributes);

    /// Delete a route and prune it from every group
    /// @return IDs of groups deleted because they became empty
    RouteEditResult<std::vector<GroupId>> deleteRoute(const RouteId& routeId);

    /// Split a route; groups reference both parts in place of the original
    RouteEditResult<std::pair<RouteId, RouteId>> splitRoute(const RouteId& routeId, const SystemId& systemId);

    /// Merge two routes; groups reference the merged route in place of both
    RouteEditResult<RouteId> mergeRoutes(const RouteId& routeA, const RouteId& routeB);

    bool hasRoute(const RouteId& id) const { return routes_.count(id) > 0; }

    // Route access API:
    // - getRoute(): reference return, throws std::out_of_range for unknown IDs.
    //   Invalidated by any route mutation.
    // - tryGetRoute(): pointer return, nullptr for unknown IDs.
    const Route& getRoute(const RouteId& id) const;
    const Route* tryGetRoute(const RouteId& id) const;

    const RouteMap& routes() const { return routes_; }
    size_t routeCount() const { return routes_.size(); }

    /// Routes having the system as a member
    std::vector<RouteId> routesThrough(const SystemId& systemId) const;

    // === Groups ===

    RouteEditResult<GroupId> createGroup(const std::string& name, const std::vector<RouteId>& routeIds);
    RouteEditResult<GroupId> renameGroup(const GroupId& groupId, const std::string& name);
    RouteEditResult<GroupId> deleteGroup(const GroupId& groupId);

    /// Register a loaded group; unknown route IDs are dropped
    /// @return false if no known routes remain
    bool addGroup(const RouteGroup& group);

    const RouteGroups& groups() const { return groups_; }

    // === Document ===

    MapMetadata& metadata() { return metadata_; }
    const MapMetadata& metadata() const { return metadata_; }

    void clear();

    /// Incremented on every successful mutation
    uint64_t version() const { return version_; }
    bool isDirty() const { return dirty_; }
    void markClean() { dirty_ = false; }

private:
    void markDirty() { dirty_ = true; ++version_; }

    template <typename T>
    static RouteEditResult<T> routeNotFound(const RouteId& id) {
        return RouteEditResult<T>::fail(RouteEditError::RouteNotFound, "Route " + id + " does not exist");
    }

    /// DuplicateRoute failure if a route outside `replaced` already connects the pair
    template <typename T>
    std::optional<RouteEditResult<T>> rejectDuplicate(const SystemPair& ends,
                                                      const std::vector<RouteId>& replaced) const;

    SystemCatalog systems_;
    RouteMap routes_;
    RouteGroups groups_;
    MapMetadata metadata_;
    IdGenerator routeIds_;
    IdGenerator groupIds_;

    bool dirty_ = false;
    uint64_t version_ = 0;
};

}  // namespace starmap
