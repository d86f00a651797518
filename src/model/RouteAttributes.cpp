#include "starmap/model/RouteAttributes.h"

#include <algorithm>

namespace starmap {

void RouteAttributes::setRouteClass(int value) {
    routeClass = std::clamp(value, MIN_CLASS, MAX_CLASS);
}

void RouteAttributes::toggleHazard(Hazard hazard) {
    if (!hazards.erase(hazard)) {
        hazards.insert(hazard);
    }
}

std::string toString(TravelType type) {
    switch (type) {
        case TravelType::Normal: return "normal";
        case TravelType::ExpressLane: return "express_lane";
        case TravelType::AncientHyperlane: return "ancient_hyperlane";
        case TravelType::Backwater: return "backwater";
    }
    return "normal";
}

std::string toString(Hazard hazard) {
    switch (hazard) {
        case Hazard::Nebula: return "nebula";
        case Hazard::Hypershadow: return "hypershadow";
        case Hazard::Quasar: return "quasar";
        case Hazard::Minefield: return "minefield";
        case Hazard::PirateActivity: return "pirate_activity";
    }
    return "nebula";
}

std::string displayName(TravelType type) {
    switch (type) {
        case TravelType::Normal: return "Normal";
        case TravelType::ExpressLane: return "Express Lane";
        case TravelType::AncientHyperlane: return "Ancient Hyperlane";
        case TravelType::Backwater: return "Backwater";
    }
    return "Normal";
}

std::string displayName(Hazard hazard) {
    switch (hazard) {
        case Hazard::Nebula: return "Nebula";
        case Hazard::Hypershadow: return "Hypershadow";
        case Hazard::Quasar: return "Quasar";
        case Hazard::Minefield: return "Minefield";
        case Hazard::PirateActivity: return "Pirate Activity";
    }
    return "Nebula";
}

std::optional<TravelType> travelTypeFromString(std::string_view str) {
    for (TravelType type : allTravelTypes()) {
        if (toString(type) == str) {
            return type;
        }
    }
    return std::nullopt;
}

std::optional<Hazard> hazardFromString(std::string_view str) {
    for (Hazard hazard : allHazards()) {
        if (toString(hazard) == str) {
            return hazard;
        }
    }
    return std::nullopt;
}

const std::vector<TravelType>& allTravelTypes() {
    static const std::vector<TravelType> types = {
        TravelType::Normal, TravelType::ExpressLane,
        TravelType::AncientHyperlane, TravelType::Backwater
    };
    return types;
}

const std::vector<Hazard>& allHazards() {
    static const std::vector<Hazard> hazards = {
        Hazard::Nebula, Hazard::Hypershadow, Hazard::Quasar,
        Hazard::Minefield, Hazard::PirateActivity
    };
    return hazards;
}

}  // namespace starmap
