#pragma once

#include "../core/Types.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace starmap {

/// Read-only view of star systems consumed by route geometry and editing
///
/// Routes reference systems by ID only. Implementations must always report
/// live coordinates: route paths and lengths are recomputed from these on
/// every call and never cached.
class ISystemLookup {
public:
    virtual ~ISystemLookup() = default;

    /// Current world position of a system
    /// @return std::nullopt if the system does not exist
    virtual std::optional<Point> getPosition(const SystemId& id) const = 0;

    /// Display name of a system (snapshot for default route names)
    /// @return std::nullopt if the system does not exist
    virtual std::optional<std::string> getName(const SystemId& id) const = 0;

    virtual bool hasSystem(const SystemId& id) const { return getPosition(id).has_value(); }
};

struct SystemData {
    SystemId id;
    std::string name;
    Point position{0, 0};

    SystemData() = default;
    SystemData(SystemId id_, std::string name_, Point pos)
        : id(std::move(id_)), name(std::move(name_)), position(pos) {}
};

/// In-memory system store, ordered by ID
class SystemCatalog : public ISystemLookup {
public:
    SystemCatalog() = default;

    /// Add or replace a system
    void addSystem(const SystemData& data);
    void addSystem(const SystemId& id, const std::string& name, Point position);

    /// @return true if the system existed
    bool removeSystem(const SystemId& id);

    /// Move a system. Routes follow automatically on their next evaluation.
    /// @throws std::out_of_range if the ID is unknown
    void moveSystem(const SystemId& id, Point position);

    /// @throws std::out_of_range if the ID is unknown
    void renameSystem(const SystemId& id, const std::string& name);

    // System access API:
    // - getSystem(): reference return, throws std::out_of_range for unknown IDs.
    //   Invalidated by removeSystem() or clear().
    // - tryGetSystem(): copy return, std::nullopt for unknown IDs.
    const SystemData& getSystem(const SystemId& id) const;
    std::optional<SystemData> tryGetSystem(const SystemId& id) const;

    /// Nearest system within radius of a world point
    /// @return std::nullopt if no system lies within radius
    std::optional<SystemId> findSystemAt(const Point& point, float radius) const;

    std::vector<SystemId> systemIds() const;
    const std::map<SystemId, SystemData>& systems() const { return systems_; }
    size_t systemCount() const { return systems_.size(); }
    void clear() { systems_.clear(); }

    // ISystemLookup
    std::optional<Point> getPosition(const SystemId& id) const override;
    std::optional<std::string> getName(const SystemId& id) const override;
    bool hasSystem(const SystemId& id) const override;

private:
    std::map<SystemId, SystemData> systems_;
};

}  // namespace starmap
