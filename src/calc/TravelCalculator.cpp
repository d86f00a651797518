#include "starmap/calc/TravelCalculator.h"
#include "starmap/model/Route.h"

namespace starmap {

float TravelCalculator::routeClassModifier(int routeClass) {
    switch (routeClass) {
        case 1: return 1.5f;
        case 2: return 1.2f;
        case 3: return 1.0f;
        case 4: return 0.8f;
        case 5: return 0.6f;
        default: return 1.0f;
    }
}

float TravelCalculator::travelTypeModifier(TravelType type) {
    switch (type) {
        case TravelType::Normal: return 1.0f;
        case TravelType::ExpressLane: return 1.3f;
        case TravelType::AncientHyperlane: return 0.9f;
        case TravelType::Backwater: return 0.7f;
    }
    return 1.0f;
}

float TravelCalculator::hazardModifier(Hazard hazard) {
    switch (hazard) {
        case Hazard::Nebula: return 0.9f;
        case Hazard::Hypershadow: return 0.85f;
        case Hazard::Quasar: return 0.8f;
        case Hazard::Minefield: return 0.95f;
        case Hazard::PirateActivity: return 0.95f;
    }
    return 1.0f;
}

float TravelCalculator::speedFactor(const RouteAttributes& attributes) {
    float factor = routeClassModifier(attributes.routeClass) * travelTypeModifier(attributes.travelType);
    for (Hazard hazard : attributes.hazards) {
        factor *= hazardModifier(hazard);
    }
    return factor;
}

float TravelCalculator::travelTimeHours(float lengthHsu, HyperdriveRating rating,
                                        const RouteAttributes& attributes) {
    return lengthHsu / hyperdriveMultiplier(rating) / speedFactor(attributes);
}

TravelCalculator::Estimate TravelCalculator::estimate(const Route& route, const ISystemLookup& lookup,
                                                      HyperdriveRating rating) {
    Estimate result;
    result.lengthHsu = route.calculateLength(lookup);
    result.speedFactor = speedFactor(route.attributes());
    result.hours = travelTimeHours(result.lengthHsu, rating, route.attributes());
    return result;
}

std::string TravelCalculator::toString(HyperdriveRating rating) {
    return "x" + std::to_string(static_cast<int>(rating));
}

}  // namespace starmap
