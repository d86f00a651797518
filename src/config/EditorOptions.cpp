#include "starmap/config/EditorOptions.h"
#include "starmap/common/Logger.h"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace starmap {

void EditorOptions::sanitize() {
    systemSnapRadius = std::max(0.0f, systemSnapRadius);
    routeHitThreshold = std::max(0.0f, routeHitThreshold);
    shapePointHitRadius = std::max(0.0f, shapePointHitRadius);
    decimateTarget = std::max<size_t>(2, decimateTarget);
    smoothingWindow = std::max(1, smoothingWindow);
    splineSamples = std::clamp(splineSamples, 1, 64);
    defaultRouteClass = std::clamp(defaultRouteClass, RouteAttributes::MIN_CLASS,
                                   RouteAttributes::MAX_CLASS);
}

std::string EditorOptions::toJson() const {
    json j;
    j["hitTesting"] = {
        {"systemSnapRadius", systemSnapRadius},
        {"routeHitThreshold", routeHitThreshold},
        {"shapePointHitRadius", shapePointHitRadius}
    };
    j["reshape"] = {
        {"decimateTarget", decimateTarget},
        {"smoothingWindow", smoothingWindow}
    };
    j["splineSamples"] = splineSamples;
    j["defaultRouteClass"] = defaultRouteClass;
    return j.dump(2);
}

bool EditorOptions::fromJson(const std::string& jsonStr, EditorOptions& options) {
    try {
        json j = json::parse(jsonStr);
        EditorOptions parsed = options;

        if (j.contains("hitTesting")) {
            const auto& hit = j["hitTesting"];
            parsed.systemSnapRadius = hit.value("systemSnapRadius", parsed.systemSnapRadius);
            parsed.routeHitThreshold = hit.value("routeHitThreshold", parsed.routeHitThreshold);
            parsed.shapePointHitRadius = hit.value("shapePointHitRadius", parsed.shapePointHitRadius);
        }

        if (j.contains("reshape")) {
            const auto& reshape = j["reshape"];
            int target = reshape.value("decimateTarget", static_cast<int>(parsed.decimateTarget));
            parsed.decimateTarget = static_cast<size_t>(std::max(target, 2));
            parsed.smoothingWindow = reshape.value("smoothingWindow", parsed.smoothingWindow);
        }

        parsed.splineSamples = j.value("splineSamples", parsed.splineSamples);
        parsed.defaultRouteClass = j.value("defaultRouteClass", parsed.defaultRouteClass);

        parsed.sanitize();
        options = parsed;
        return true;
    } catch (const json::exception& e) {
        LOG_WARN("Failed to parse editor options: {}", e.what());
        return false;
    }
}

bool EditorOptions::loadFromFile(const std::string& path, EditorOptions& options) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open editor options file {}", path);
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str(), options);
}

bool EditorOptions::saveToFile(const EditorOptions& options, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) return false;
    file << options.toJson();
    return true;
}

}  // namespace starmap
