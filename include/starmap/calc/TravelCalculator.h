#pragma once

#include "../model/RouteAttributes.h"

#include <string>

namespace starmap {

class ISystemLookup;
class Route;

/// Ship hyperdrive rating; the value is the distance multiplier
enum class HyperdriveRating {
    X1 = 1,
    X2 = 2,
    X3 = 3,
    X4 = 4
};

/// Travel-time estimates for a route
///
/// Base rate: 1 HSU takes 1 hour at x1.
/// time = length / hyperdrive / speedFactor
class TravelCalculator {
public:
    struct Estimate {
        float lengthHsu = 0.0f;
        float speedFactor = 1.0f;
        float hours = 0.0f;
    };

    /// Class modifier: 1 -> 1.5 (fast) .. 5 -> 0.6 (slow); out-of-range classes give 1.0
    static float routeClassModifier(int routeClass);
    static float travelTypeModifier(TravelType type);
    static float hazardModifier(Hazard hazard);

    /// Product of class, travel-type and every hazard modifier
    static float speedFactor(const RouteAttributes& attributes);

    static float hyperdriveMultiplier(HyperdriveRating rating) {
        return static_cast<float>(static_cast<int>(rating));
    }

    static float travelTimeHours(float lengthHsu, HyperdriveRating rating,
                                 const RouteAttributes& attributes);

    /// Estimate from the route's live length
    static Estimate estimate(const Route& route, const ISystemLookup& lookup, HyperdriveRating rating);

    /// "x1" .. "x4"
    static std::string toString(HyperdriveRating rating);
};

}  // namespace starmap
