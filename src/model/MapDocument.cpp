#include "starmap/model/MapDocument.h"
#include "starmap/common/Logger.h"

#include <stdexcept>

namespace starmap {

MapDocument::MapDocument()
    : routeIds_("route"), groupIds_("group") {}

template <typename T>
std::optional<RouteEditResult<T>> MapDocument::rejectDuplicate(const SystemPair& ends,
                                                               const std::vector<RouteId>& replaced) const {
    if (!RouteEditor::routeExistsBetween(ends.start, ends.end, routes_, replaced)) {
        return std::nullopt;
    }
    auto result = RouteEditResult<T>::fail(
        RouteEditError::DuplicateRoute,
        "A route between " + RouteEditor::defaultRouteName(ends.start, ends.end, systems_) + " already exists");
    LOG_WARN("Edit rejected ({}): {}", toString(result.error), result.reason);
    return result;
}

std::vector<RouteId> MapDocument::removeSystem(const SystemId& systemId) {
    std::vector<RouteId> deleted = routesThrough(systemId);
    for (const auto& routeId : deleted) {
        routes_.erase(routeId);
        groups_.pruneRoute(routeId);
    }
    if (systems_.removeSystem(systemId) || !deleted.empty()) {
        LOG_INFO("Removed system {} and {} dependent routes", systemId, deleted.size());
        markDirty();
    }
    return deleted;
}

void MapDocument::moveSystem(const SystemId& systemId, Point position) {
    systems_.moveSystem(systemId, position);
    markDirty();
}

RouteEditResult<RouteId> MapDocument::createRoute(const SystemId& start, const SystemId& end,
                                                  const Polyline& shapePoints, int routeClass) {
    IdGenerator ids = routeIds_;
    auto result = RouteEditor::createRoute(ids.next(), start, end, routes_, systems_, shapePoints, routeClass);
    if (!result) {
        LOG_WARN("Route creation rejected ({}): {}", toString(result.error), result.reason);
        return RouteEditResult<RouteId>::fail(result);
    }

    routeIds_ = ids;
    RouteId id = result.value->id();
    routes_.insert_or_assign(id, std::move(*result.value));
    markDirty();
    return RouteEditResult<RouteId>::ok(id);
}

void MapDocument::addRoute(const Route& route) {
    if (routes_.count(route.id())) {
        throw std::invalid_argument("Duplicate route ID: " + route.id());
    }
    routeIds_.observe(route.id());
    routes_.insert_or_assign(route.id(), route);
    markDirty();
}

RouteEditResult<RouteId> MapDocument::updateRoute(const Route& route) {
    auto it = routes_.find(route.id());
    if (it == routes_.end()) {
        return routeNotFound<RouteId>(route.id());
    }
    for (const auto& systemId : route.effectiveMemberSystems()) {
        if (!systems_.hasSystem(systemId)) {
            return RouteEditResult<RouteId>::fail(RouteEditError::UnknownSystem,
                                                  "System " + systemId + " does not exist");
        }
    }
    auto ends = route.effectiveEndpoints();
    if (!it->second.connects(ends.start, ends.end)) {
        auto duplicate = rejectDuplicate<RouteId>(ends, {route.id()});
        if (duplicate) {
            return *duplicate;
        }
    }
    it->second = route;
    markDirty();
    return RouteEditResult<RouteId>::ok(route.id());
}

RouteEditResult<RouteId> MapDocument::renameRoute(const RouteId& routeId, const std::string& name) {
    auto it = routes_.find(routeId);
    if (it == routes_.end()) {
        return routeNotFound<RouteId>(routeId);
    }
    it->second.setName(name);
    markDirty();
    return RouteEditResult<RouteId>::ok(routeId);
}

RouteEditResult<RouteId> MapDocument::setRouteAttributes(const RouteId& routeId,
                                                         const RouteAttributes& attributes) {
    auto it = routes_.find(routeId);
    if (it == routes_.end()) {
        return routeNotFound<RouteId>(routeId);
    }
    RouteAttributes sanitized = attributes;
    sanitized.setRouteClass(attributes.routeClass);
    it->second.setAttributes(sanitized);
    markDirty();
    return RouteEditResult<RouteId>::ok(routeId);
}

RouteEditResult<std::vector<GroupId>> MapDocument::deleteRoute(const RouteId& routeId) {
    if (!routes_.erase(routeId)) {
        return routeNotFound<std::vector<GroupId>>(routeId);
    }
    auto deletedGroups = groups_.pruneRoute(routeId);
    LOG_DEBUG("Deleted route {}, {} groups removed", routeId, deletedGroups.size());
    markDirty();
    return RouteEditResult<std::vector<GroupId>>::ok(std::move(deletedGroups));
}

RouteEditResult<std::pair<RouteId, RouteId>> MapDocument::splitRoute(const RouteId& routeId,
                                                                     const SystemId& systemId) {
    using Result = RouteEditResult<std::pair<RouteId, RouteId>>;

    const Route* route = tryGetRoute(routeId);
    if (!route) {
        return routeNotFound<std::pair<RouteId, RouteId>>(routeId);
    }

    IdGenerator ids = routeIds_;
    RouteId firstId = ids.next();
    RouteId secondId = ids.next();
    auto result = RouteEditor::splitRoute(*route, systemId, firstId, secondId, systems_);
    if (!result) {
        LOG_WARN("Split of route {} rejected ({}): {}", routeId, toString(result.error), result.reason);
        return Result::fail(result);
    }

    for (const Route* part : {&result.value->first, &result.value->second}) {
        auto duplicate = rejectDuplicate<std::pair<RouteId, RouteId>>(part->effectiveEndpoints(), {routeId});
        if (duplicate) {
            return *duplicate;
        }
    }

    routeIds_ = ids;
    routes_.erase(routeId);
    routes_.insert_or_assign(firstId, std::move(result.value->first));
    routes_.insert_or_assign(secondId, std::move(result.value->second));
    groups_.replaceRoute(routeId, {firstId, secondId});
    markDirty();
    return Result::ok(std::make_pair(firstId, secondId));
}

RouteEditResult<RouteId> MapDocument::mergeRoutes(const RouteId& routeA, const RouteId& routeB) {
    const Route* a = tryGetRoute(routeA);
    const Route* b = tryGetRoute(routeB);
    if (!a) return routeNotFound<RouteId>(routeA);
    if (!b) return routeNotFound<RouteId>(routeB);
    if (routeA == routeB) {
        return RouteEditResult<RouteId>::fail(RouteEditError::NoSharedEndpoint,
                                              "Cannot merge a route with itself");
    }

    IdGenerator ids = routeIds_;
    RouteId mergedId = ids.next();
    auto result = RouteEditor::mergeRoutes(*a, *b, mergedId, systems_);
    if (!result) {
        LOG_WARN("Merge of routes {} and {} rejected ({}): {}", routeA, routeB,
                 toString(result.error), result.reason);
        return RouteEditResult<RouteId>::fail(result);
    }

    auto duplicate = rejectDuplicate<RouteId>(result.value->effectiveEndpoints(), {routeA, routeB});
    if (duplicate) {
        return *duplicate;
    }

    routeIds_ = ids;
    routes_.erase(routeA);
    routes_.erase(routeB);
    routes_.insert_or_assign(mergedId, std::move(*result.value));
    groups_.replaceRoute(routeA, {mergedId});
    groups_.replaceRoute(routeB, {mergedId});
    markDirty();
    return RouteEditResult<RouteId>::ok(mergedId);
}

const Route& MapDocument::getRoute(const RouteId& id) const {
    auto it = routes_.find(id);
    if (it == routes_.end()) {
        throw std::out_of_range("Invalid route ID: " + id);
    }
    return it->second;
}

const Route* MapDocument::tryGetRoute(const RouteId& id) const {
    auto it = routes_.find(id);
    return it == routes_.end() ? nullptr : &it->second;
}

std::vector<RouteId> MapDocument::routesThrough(const SystemId& systemId) const {
    std::vector<RouteId> result;
    for (const auto& [id, route] : routes_) {
        if (route.containsSystem(systemId)) {
            result.push_back(id);
        }
    }
    return result;
}

RouteEditResult<GroupId> MapDocument::createGroup(const std::string& name,
                                                  const std::vector<RouteId>& routeIds) {
    for (const auto& routeId : routeIds) {
        if (!hasRoute(routeId)) {
            return routeNotFound<GroupId>(routeId);
        }
    }

    IdGenerator ids = groupIds_;
    auto result = groups_.createGroup(ids.next(), name, routeIds);
    if (!result) {
        LOG_WARN("Group creation rejected ({}): {}", toString(result.error), result.reason);
        return RouteEditResult<GroupId>::fail(result);
    }

    groupIds_ = ids;
    markDirty();
    return RouteEditResult<GroupId>::ok(result.value->id);
}

RouteEditResult<GroupId> MapDocument::renameGroup(const GroupId& groupId, const std::string& name) {
    if (!groups_.rename(groupId, name)) {
        return RouteEditResult<GroupId>::fail(RouteEditError::GroupNotFound,
                                              "Group " + groupId + " does not exist");
    }
    markDirty();
    return RouteEditResult<GroupId>::ok(groupId);
}

RouteEditResult<GroupId> MapDocument::deleteGroup(const GroupId& groupId) {
    if (!groups_.removeGroup(groupId)) {
        return RouteEditResult<GroupId>::fail(RouteEditError::GroupNotFound,
                                              "Group " + groupId + " does not exist");
    }
    markDirty();
    return RouteEditResult<GroupId>::ok(groupId);
}

bool MapDocument::addGroup(const RouteGroup& group) {
    RouteGroup filtered = group;
    std::erase_if(filtered.routeIds, [this](const RouteId& id) { return !hasRoute(id); });
    if (!groups_.addGroup(filtered)) {
        return false;
    }
    groupIds_.observe(group.id);
    markDirty();
    return true;
}

void MapDocument::clear() {
    systems_.clear();
    routes_.clear();
    groups_.clear();
    metadata_ = MapMetadata{};
    routeIds_.reset();
    groupIds_.reset();
    markDirty();
}

}  // namespace starmap
