#include "starmap/model/RouteGroup.h"
#include "starmap/common/Logger.h"

#include <algorithm>
#include <stdexcept>

namespace starmap {

bool RouteGroup::contains(const RouteId& routeId) const {
    return std::find(routeIds.begin(), routeIds.end(), routeId) != routeIds.end();
}

RouteEditResult<RouteGroup> RouteGroups::makeGroup(const GroupId& id, const std::string& name,
                                                   const std::vector<RouteId>& routeIds,
                                                   size_t ordinal) {
    if (routeIds.empty()) {
        return RouteEditResult<RouteGroup>::fail(RouteEditError::EmptySelection,
                                                 "Select at least one route to create a group");
    }

    RouteGroup group;
    group.id = id;
    group.name = name.find_first_not_of(" \t") == std::string::npos
        ? "Group " + std::to_string(ordinal)
        : name;
    for (const auto& routeId : routeIds) {
        if (!group.contains(routeId)) {
            group.routeIds.push_back(routeId);
        }
    }
    return RouteEditResult<RouteGroup>::ok(std::move(group));
}

std::optional<RouteGroup> RouteGroups::prune(const RouteGroup& group, const RouteId& deletedRouteId) {
    RouteGroup pruned = group;
    std::erase(pruned.routeIds, deletedRouteId);
    if (pruned.empty()) {
        return std::nullopt;
    }
    return pruned;
}

RouteEditResult<RouteGroup> RouteGroups::createGroup(const GroupId& id, const std::string& name,
                                                     const std::vector<RouteId>& routeIds) {
    auto result = makeGroup(id, name, routeIds, groups_.size() + 1);
    if (result) {
        groups_[id] = *result.value;
        LOG_DEBUG("Created group {} '{}' with {} routes", id, result.value->name,
                  result.value->routeIds.size());
    }
    return result;
}

bool RouteGroups::addGroup(const RouteGroup& group) {
    if (group.empty()) {
        return false;
    }
    groups_[group.id] = group;
    return true;
}

bool RouteGroups::removeGroup(const GroupId& id) {
    return groups_.erase(id) > 0;
}

bool RouteGroups::rename(const GroupId& id, const std::string& name) {
    auto it = groups_.find(id);
    if (it == groups_.end()) {
        return false;
    }
    it->second.name = name;
    return true;
}

std::vector<GroupId> RouteGroups::pruneRoute(const RouteId& routeId) {
    std::vector<GroupId> deleted;
    for (auto it = groups_.begin(); it != groups_.end();) {
        if (!it->second.contains(routeId)) {
            ++it;
            continue;
        }
        auto pruned = prune(it->second, routeId);
        if (pruned) {
            it->second = std::move(*pruned);
            ++it;
        } else {
            LOG_DEBUG("Group {} became empty and was deleted", it->first);
            deleted.push_back(it->first);
            it = groups_.erase(it);
        }
    }
    return deleted;
}

void RouteGroups::replaceRoute(const RouteId& oldId, const std::vector<RouteId>& newIds) {
    for (auto& [groupId, group] : groups_) {
        auto pos = std::find(group.routeIds.begin(), group.routeIds.end(), oldId);
        if (pos == group.routeIds.end()) {
            continue;
        }
        pos = group.routeIds.erase(pos);
        for (const auto& newId : newIds) {
            if (!group.contains(newId)) {
                pos = group.routeIds.insert(pos, newId) + 1;
            }
        }
    }
}

std::vector<GroupId> RouteGroups::groupsContaining(const RouteId& routeId) const {
    std::vector<GroupId> result;
    for (const auto& [groupId, group] : groups_) {
        if (group.contains(routeId)) {
            result.push_back(groupId);
        }
    }
    return result;
}

const RouteGroup& RouteGroups::getGroup(const GroupId& id) const {
    auto it = groups_.find(id);
    if (it == groups_.end()) {
        throw std::out_of_range("Invalid group ID: " + id);
    }
    return it->second;
}

std::optional<RouteGroup> RouteGroups::tryGetGroup(const GroupId& id) const {
    auto it = groups_.find(id);
    if (it == groups_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace starmap
