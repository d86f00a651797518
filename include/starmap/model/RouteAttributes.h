#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace starmap {

/// Coarse speed category of a hyperlane
enum class TravelType {
    Normal,
    ExpressLane,
    AncientHyperlane,
    Backwater
};

/// Hazard tags; these stack multiplicatively in travel-time formulas
enum class Hazard {
    Nebula,
    Hypershadow,
    Quasar,
    Minefield,
    PirateActivity
};

/// Non-geometric route attributes, inherited across split and merge
struct RouteAttributes {
    static constexpr int MIN_CLASS = 1;
    static constexpr int MAX_CLASS = 5;
    static constexpr int DEFAULT_CLASS = 3;

    int routeClass = DEFAULT_CLASS;
    TravelType travelType = TravelType::Normal;
    std::set<Hazard> hazards;

    /// Set route class, clamped to [MIN_CLASS, MAX_CLASS]
    void setRouteClass(int value);

    bool hasHazard(Hazard hazard) const { return hazards.count(hazard) > 0; }
    void toggleHazard(Hazard hazard);

    bool operator==(const RouteAttributes& other) const = default;
};

// =============================================================================
// String conversion (document format and UI labels)
// =============================================================================

/// Document form, e.g. "express_lane"
std::string toString(TravelType type);
std::string toString(Hazard hazard);

/// UI form, e.g. "Express Lane"
std::string displayName(TravelType type);
std::string displayName(Hazard hazard);

/// Parse document form; nullopt for unknown strings
std::optional<TravelType> travelTypeFromString(std::string_view str);
std::optional<Hazard> hazardFromString(std::string_view str);

/// All enumerators in declaration order (for menus and iteration)
const std::vector<TravelType>& allTravelTypes();
const std::vector<Hazard>& allHazards();

}  // namespace starmap
