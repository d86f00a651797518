#pragma once

#include "../core/Types.h"
#include "../editing/RouteEditTypes.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace starmap {

/// Named collection of routes (e.g. a trade lane); membership only
struct RouteGroup {
    GroupId id;
    std::string name;
    std::vector<RouteId> routeIds;   ///< Insertion order, no duplicates

    bool contains(const RouteId& routeId) const;
    bool empty() const { return routeIds.empty(); }

    bool operator==(const RouteGroup& other) const = default;
};

/// Group registry
///
/// A group is never left empty: pruning the last member deletes the group.
class RouteGroups {
public:
    /// Build a group from a selection
    /// Duplicate IDs collapse; a blank name becomes "Group N".
    /// @return EmptySelection if routeIds is empty
    static RouteEditResult<RouteGroup> makeGroup(const GroupId& id, const std::string& name,
                                                 const std::vector<RouteId>& routeIds,
                                                 size_t ordinal = 1);

    /// Remove a deleted route from one group
    /// @return the pruned group, or std::nullopt if the group became empty and must be deleted
    static std::optional<RouteGroup> prune(const RouteGroup& group, const RouteId& deletedRouteId);

    /// Create and register a group
    RouteEditResult<RouteGroup> createGroup(const GroupId& id, const std::string& name,
                                            const std::vector<RouteId>& routeIds);

    /// Register an existing group (loading); empty groups are rejected
    /// @return false if the group is empty
    bool addGroup(const RouteGroup& group);

    bool removeGroup(const GroupId& id);

    /// @return false if the group does not exist
    bool rename(const GroupId& id, const std::string& name);

    /// Remove a route from every group, deleting groups that become empty
    /// @return IDs of deleted groups
    std::vector<GroupId> pruneRoute(const RouteId& routeId);

    /// Replace a route by its successors in every group containing it (split, merge)
    /// Successors take the position of the replaced route.
    void replaceRoute(const RouteId& oldId, const std::vector<RouteId>& newIds);

    std::vector<GroupId> groupsContaining(const RouteId& routeId) const;

    bool hasGroup(const GroupId& id) const { return groups_.count(id) > 0; }

    /// @throws std::out_of_range if the ID is unknown
    const RouteGroup& getGroup(const GroupId& id) const;
    std::optional<RouteGroup> tryGetGroup(const GroupId& id) const;

    const std::map<GroupId, RouteGroup>& groups() const { return groups_; }
    size_t groupCount() const { return groups_.size(); }
    void clear() { groups_.clear(); }

private:
    std::map<GroupId, RouteGroup> groups_;
};

}  // namespace starmap
