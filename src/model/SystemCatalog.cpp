#include "starmap/model/SystemCatalog.h"

#include <stdexcept>

namespace starmap {

void SystemCatalog::addSystem(const SystemData& data) {
    systems_[data.id] = data;
}

void SystemCatalog::addSystem(const SystemId& id, const std::string& name, Point position) {
    addSystem(SystemData(id, name, position));
}

bool SystemCatalog::removeSystem(const SystemId& id) {
    return systems_.erase(id) > 0;
}

void SystemCatalog::moveSystem(const SystemId& id, Point position) {
    auto it = systems_.find(id);
    if (it == systems_.end()) {
        throw std::out_of_range("Invalid system ID: " + id);
    }
    it->second.position = position;
}

void SystemCatalog::renameSystem(const SystemId& id, const std::string& name) {
    auto it = systems_.find(id);
    if (it == systems_.end()) {
        throw std::out_of_range("Invalid system ID: " + id);
    }
    it->second.name = name;
}

const SystemData& SystemCatalog::getSystem(const SystemId& id) const {
    auto it = systems_.find(id);
    if (it == systems_.end()) {
        throw std::out_of_range("Invalid system ID: " + id);
    }
    return it->second;
}

std::optional<SystemData> SystemCatalog::tryGetSystem(const SystemId& id) const {
    auto it = systems_.find(id);
    if (it == systems_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<SystemId> SystemCatalog::findSystemAt(const Point& point, float radius) const {
    std::optional<SystemId> best;
    float bestDist = radius;
    for (const auto& [id, system] : systems_) {
        float dist = system.position.distanceTo(point);
        if (dist < bestDist || (!best && dist <= radius)) {
            bestDist = dist;
            best = id;
        }
    }
    return best;
}

std::vector<SystemId> SystemCatalog::systemIds() const {
    std::vector<SystemId> ids;
    ids.reserve(systems_.size());
    for (const auto& [id, system] : systems_) {
        ids.push_back(id);
    }
    return ids;
}

std::optional<Point> SystemCatalog::getPosition(const SystemId& id) const {
    auto it = systems_.find(id);
    if (it == systems_.end()) {
        return std::nullopt;
    }
    return it->second.position;
}

std::optional<std::string> SystemCatalog::getName(const SystemId& id) const {
    auto it = systems_.find(id);
    if (it == systems_.end()) {
        return std::nullopt;
    }
    return it->second.name;
}

bool SystemCatalog::hasSystem(const SystemId& id) const {
    return systems_.count(id) > 0;
}

}  // namespace starmap
