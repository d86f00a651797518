#include "starmap/util/ProjectSerializer.h"
#include "starmap/model/MapDocument.h"
#include "starmap/common/Logger.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace starmap {

namespace {

json routeToJsonValue(const Route& route) {
    auto ends = route.effectiveEndpoints();

    json j;
    j["id"] = route.id();
    j["name"] = route.name();
    j["start_system_id"] = ends.start;
    j["end_system_id"] = ends.end;
    if (route.isChain()) {
        j["system_chain"] = route.effectiveMemberSystems();
    }

    json points = json::array();
    for (const auto& p : route.shapePoints()) {
        points.push_back({p.x, p.y});
    }
    j["control_points"] = points;

    const auto& attributes = route.attributes();
    j["route_class"] = attributes.routeClass;
    j["travel_type"] = toString(attributes.travelType);
    json hazards = json::array();
    for (Hazard hazard : attributes.hazards) {
        hazards.push_back(toString(hazard));
    }
    j["hazards"] = hazards;
    return j;
}

Point pointFromJson(const json& value) {
    if (value.is_array()) {
        return {value.at(0).get<float>(), value.at(1).get<float>()};
    }
    return {value.at("x").get<float>(), value.at("y").get<float>()};
}

std::optional<Route> routeFromJsonValue(const json& j) {
    std::string id = j.value("id", "");
    if (id.empty()) {
        LOG_WARN("Skipping route without an id");
        return std::nullopt;
    }

    std::vector<SystemId> members;
    if (j.contains("system_chain") && j["system_chain"].is_array() && j["system_chain"].size() >= 2) {
        members = j["system_chain"].get<std::vector<SystemId>>();
    } else {
        members = {j.value("start_system_id", ""), j.value("end_system_id", "")};
    }

    std::set<SystemId> unique(members.begin(), members.end());
    if (unique.size() != members.size() || unique.count("")) {
        LOG_WARN("Skipping route {}: needs at least 2 distinct systems", id);
        return std::nullopt;
    }

    Route route(id, j.value("name", ""), members);

    const char* pointsKey = j.contains("control_points") ? "control_points" : "shape_points";
    if (j.contains(pointsKey) && !route.isChain()) {
        Polyline points;
        for (const auto& p : j[pointsKey]) {
            points.push_back(pointFromJson(p));
        }
        route.setShapePoints(std::move(points));
    }

    auto& attributes = route.attributes();
    attributes.setRouteClass(j.value("route_class", RouteAttributes::DEFAULT_CLASS));

    std::string travelType = j.value("travel_type", "normal");
    if (auto parsed = travelTypeFromString(travelType)) {
        attributes.travelType = *parsed;
    } else {
        LOG_WARN("Route {}: unknown travel type '{}', using normal", id, travelType);
    }

    if (j.contains("hazards")) {
        for (const auto& tag : j["hazards"]) {
            std::string name = tag.get<std::string>();
            if (auto hazard = hazardFromString(name)) {
                attributes.hazards.insert(*hazard);
            } else {
                LOG_WARN("Route {}: skipping unknown hazard '{}'", id, name);
            }
        }
    }
    return route;
}

json groupToJsonValue(const RouteGroup& group) {
    return {
        {"id", group.id},
        {"name", group.name},
        {"route_ids", group.routeIds}
    };
}

RouteGroup groupFromJsonValue(const json& j) {
    RouteGroup group;
    group.id = j.at("id").get<std::string>();
    group.name = j.value("name", "");
    if (j.contains("route_ids")) {
        for (const auto& routeId : j["route_ids"]) {
            auto id = routeId.get<RouteId>();
            if (!group.contains(id)) {
                group.routeIds.push_back(id);
            }
        }
    }
    return group;
}

}  // namespace

std::string ProjectSerializer::toJson(const MapDocument& document) {
    json j;
    j["metadata"] = {
        {"name", document.metadata().name},
        {"version", document.metadata().version}
    };

    json systems = json::array();
    for (const auto& [id, system] : document.systems().systems()) {
        systems.push_back({
            {"id", id},
            {"name", system.name},
            {"x", system.position.x},
            {"y", system.position.y}
        });
    }
    j["systems"] = systems;

    json routes = json::array();
    for (const auto& [id, route] : document.routes()) {
        routes.push_back(routeToJsonValue(route));
    }
    j["routes"] = routes;

    json groups = json::array();
    for (const auto& [id, group] : document.groups().groups()) {
        groups.push_back(groupToJsonValue(group));
    }
    j["route_groups"] = groups;

    return j.dump(2);
}

bool ProjectSerializer::fromJson(MapDocument& document, const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);
        MapDocument loaded;

        if (j.contains("metadata")) {
            const auto& metadata = j["metadata"];
            loaded.metadata().name = metadata.value("name", loaded.metadata().name);
            loaded.metadata().version = metadata.value("version", loaded.metadata().version);
        }

        if (j.contains("systems")) {
            for (const auto& s : j["systems"]) {
                loaded.systems().addSystem(s.at("id").get<std::string>(), s.value("name", ""),
                                           {s.at("x").get<float>(), s.at("y").get<float>()});
            }
        }

        if (j.contains("routes")) {
            for (const auto& r : j["routes"]) {
                auto route = routeFromJsonValue(r);
                if (!route) continue;
                if (loaded.hasRoute(route->id())) {
                    LOG_WARN("Skipping route with duplicate id {}", route->id());
                    continue;
                }
                auto ends = route->effectiveEndpoints();
                if (RouteEditor::routeExistsBetween(ends.start, ends.end, loaded.routes())) {
                    LOG_WARN("Skipping route {}: {} and {} are already connected", route->id(),
                             ends.start, ends.end);
                    continue;
                }
                loaded.addRoute(*route);
            }
        }

        if (j.contains("route_groups")) {
            for (const auto& g : j["route_groups"]) {
                RouteGroup group = groupFromJsonValue(g);
                if (!loaded.addGroup(group)) {
                    LOG_WARN("Discarding group {}: no known member routes", group.id);
                }
            }
        }

        loaded.markClean();
        document = std::move(loaded);
        LOG_INFO("Loaded map '{}': {} systems, {} routes, {} groups", document.metadata().name,
                 document.systems().systemCount(), document.routeCount(),
                 document.groups().groupCount());
        return true;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse map document: {}", e.what());
        return false;
    }
}

bool ProjectSerializer::saveToFile(const MapDocument& document, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open {} for writing", path);
        return false;
    }
    file << toJson(document);
    LOG_INFO("Saved map '{}' to {}", document.metadata().name, path);
    return true;
}

bool ProjectSerializer::loadFromFile(MapDocument& document, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open {} for reading", path);
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(document, buffer.str());
}

std::string ProjectSerializer::routeToJson(const Route& route) {
    return routeToJsonValue(route).dump(2);
}

std::optional<Route> ProjectSerializer::routeFromJson(const std::string& jsonStr) {
    try {
        return routeFromJsonValue(json::parse(jsonStr));
    } catch (const json::exception& e) {
        LOG_WARN("Failed to parse route: {}", e.what());
        return std::nullopt;
    }
}

std::string ProjectSerializer::groupToJson(const RouteGroup& group) {
    return groupToJsonValue(group).dump(2);
}

std::optional<RouteGroup> ProjectSerializer::groupFromJson(const std::string& jsonStr) {
    try {
        return groupFromJsonValue(json::parse(jsonStr));
    } catch (const json::exception& e) {
        LOG_WARN("Failed to parse route group: {}", e.what());
        return std::nullopt;
    }
}

}  // namespace starmap
