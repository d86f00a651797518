#include "starmap/model/Route.h"
#include "starmap/model/SystemCatalog.h"
#include "starmap/common/Logger.h"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace starmap {

Route::Route(RouteId id, std::string name, const SystemId& start, const SystemId& end)
    : id_(std::move(id)), name_(std::move(name)) {
    setMembers({start, end});
}

Route::Route(RouteId id, std::string name, const std::vector<SystemId>& members)
    : id_(std::move(id)), name_(std::move(name)) {
    setMembers(members);
}

void Route::validateMembers(const std::vector<SystemId>& members) {
    if (members.size() < 2) {
        throw std::invalid_argument("Route needs at least 2 systems, got " +
                                    std::to_string(members.size()));
    }
    std::set<SystemId> unique(members.begin(), members.end());
    if (unique.size() != members.size()) {
        throw std::invalid_argument("Route member list contains a duplicate system");
    }
}

SystemPair Route::effectiveEndpoints() const {
    if (const auto* chain = std::get_if<SystemChain>(&endpoints_)) {
        return {chain->members.front(), chain->members.back()};
    }
    return std::get<SystemPair>(endpoints_);
}

std::vector<SystemId> Route::effectiveMemberSystems() const {
    if (const auto* chain = std::get_if<SystemChain>(&endpoints_)) {
        return chain->members;
    }
    const auto& pair = std::get<SystemPair>(endpoints_);
    return {pair.start, pair.end};
}

size_t Route::memberCount() const {
    if (const auto* chain = std::get_if<SystemChain>(&endpoints_)) {
        return chain->members.size();
    }
    return 2;
}

bool Route::containsSystem(const SystemId& id) const {
    return systemIndex(id) >= 0;
}

int Route::systemIndex(const SystemId& id) const {
    auto members = effectiveMemberSystems();
    auto it = std::find(members.begin(), members.end(), id);
    if (it == members.end()) {
        return -1;
    }
    return static_cast<int>(std::distance(members.begin(), it));
}

bool Route::connects(const SystemId& a, const SystemId& b) const {
    auto ends = effectiveEndpoints();
    return (ends.start == a && ends.end == b) || (ends.start == b && ends.end == a);
}

void Route::setMembers(const std::vector<SystemId>& members) {
    validateMembers(members);
    if (members.size() == 2) {
        endpoints_ = SystemPair{members[0], members[1]};
    } else {
        endpoints_ = SystemChain{members};
    }
    shapePoints_.clear();
}

void Route::setShapePoints(Polyline points) {
    if (isChain()) {
        throw std::logic_error("Chain route " + id_ + " cannot hold shape points");
    }
    shapePoints_ = std::move(points);
}

Polyline Route::renderPath(const ISystemLookup& lookup, int samplesPerSegment) const {
    Polyline anchors;
    for (const auto& systemId : effectiveMemberSystems()) {
        auto pos = lookup.getPosition(systemId);
        if (!pos) {
            return {};
        }
        anchors.push_back(*pos);
    }

    if (isChain()) {
        return anchors;
    }
    return geometry::evaluatePath(anchors.front(), shapePoints_, anchors.back(), samplesPerSegment);
}

float Route::calculateLength(const ISystemLookup& lookup) const {
    Polyline path = renderPath(lookup);
    if (path.empty()) {
        LOG_WARN("Route {} references a missing system, length unavailable", id_);
        return 0.0f;
    }
    return geometry::polylineLength(path);
}

}  // namespace starmap
