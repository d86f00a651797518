#pragma once

#include "../core/GeometryUtils.h"
#include "../core/Types.h"
#include "RouteAttributes.h"

#include <string>
#include <variant>
#include <vector>

namespace starmap {

class ISystemLookup;

/// Simple-mode endpoints: exactly two distinct systems
struct SystemPair {
    SystemId start;
    SystemId end;

    bool operator==(const SystemPair& other) const = default;
};

/// Chain-mode endpoints: ordered list of 3+ distinct systems
struct SystemChain {
    std::vector<SystemId> members;

    bool operator==(const SystemChain& other) const = default;
};

/// Exactly one representation is active; chain supersedes pair by construction
using RouteEndpoints = std::variant<SystemPair, SystemChain>;

/// A hyperlane connecting two or more star systems
///
/// Pure data plus derived geometry. The rendered path and length are computed
/// from live system positions on every call.
///
/// Invariants (enforced by the mutators, violations throw):
/// - at least 2 distinct member systems
/// - shape points are empty in chain mode
class Route {
public:
    /// Simple-mode route
    /// @throws std::invalid_argument if start == end
    Route(RouteId id, std::string name, const SystemId& start, const SystemId& end);

    /// Route from a member list; 2 members give simple mode, 3+ give chain mode
    /// @throws std::invalid_argument on fewer than 2 or duplicate members
    Route(RouteId id, std::string name, const std::vector<SystemId>& members);

    const RouteId& id() const { return id_; }
    const std::string& name() const { return name_; }
    void setName(const std::string& name) { name_ = name; }

    // === Endpoints ===

    const RouteEndpoints& endpoints() const { return endpoints_; }
    bool isChain() const { return std::holds_alternative<SystemChain>(endpoints_); }

    /// Effective (first, last) systems regardless of mode
    SystemPair effectiveEndpoints() const;

    /// Full ordered member list (length >= 2)
    std::vector<SystemId> effectiveMemberSystems() const;

    size_t memberCount() const;
    bool containsSystem(const SystemId& id) const;

    /// Index in the member list, -1 if absent
    int systemIndex(const SystemId& id) const;

    /// True if the route connects the unordered pair {a, b} by its effective endpoints
    bool connects(const SystemId& a, const SystemId& b) const;

    /// Replace the member list, choosing simple or chain mode from its size
    /// Always clears shape points.
    /// @throws std::invalid_argument on fewer than 2 or duplicate members
    void setMembers(const std::vector<SystemId>& members);

    // === Shape ===

    const Polyline& shapePoints() const { return shapePoints_; }

    /// @throws std::logic_error in chain mode
    void setShapePoints(Polyline points);
    void clearShapePoints() { shapePoints_.clear(); }

    // === Attributes ===

    const RouteAttributes& attributes() const { return attributes_; }
    RouteAttributes& attributes() { return attributes_; }
    void setAttributes(const RouteAttributes& attributes) { attributes_ = attributes; }

    // === Derived geometry ===

    /// Renderable path from live system positions
    /// - simple mode: geometry::evaluatePath(start, shapePoints, end)
    /// - chain mode: straight polyline through member positions
    /// @return empty if any referenced system is missing
    Polyline renderPath(const ISystemLookup& lookup,
                        int samplesPerSegment = geometry::DEFAULT_SPLINE_SAMPLES) const;

    /// Length of the rendered path in HSU
    /// @return 0.0f if any referenced system is missing
    float calculateLength(const ISystemLookup& lookup) const;

private:
    static void validateMembers(const std::vector<SystemId>& members);

    RouteId id_;
    std::string name_;
    RouteEndpoints endpoints_;
    Polyline shapePoints_;
    RouteAttributes attributes_;
};

}  // namespace starmap
