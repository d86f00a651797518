#pragma once

#include "../core/Types.h"

#include <algorithm>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace starmap {

// =============================================================================
// Input (toolkit-neutral)
// =============================================================================

enum class PointerButton {
    Primary,     ///< Left mouse button
    Secondary    ///< Right mouse button (context menu / cancel)
};

struct Modifiers {
    bool multiSelect = false;   ///< Toggle routes in the multi-selection (Ctrl)
    bool reshape = false;       ///< Freehand reshape of the selected route (Shift)
};

/// Pointer event in world coordinates
struct PointerEvent {
    Point position{0, 0};
    PointerButton button = PointerButton::Primary;
    Modifiers modifiers;
};

// =============================================================================
// Edit state machine
// =============================================================================

struct IdleState {};

/// Route drawing in progress: start system chosen, waypoints accumulated
struct DrawingState {
    SystemId startSystem;
    Polyline waypoints;      ///< Uncommitted preview points
};

/// Freehand stroke over the selected route
struct ReshapingState {
    RouteId routeId;
    Polyline stroke;         ///< Raw pointer samples
};

using EditState = std::variant<IdleState, DrawingState, ReshapingState>;

// =============================================================================
// Context menu
// =============================================================================

enum class RouteAction {
    InsertSystem,
    RemoveSystem,
    SplitRoute,
    MergeRoutes,
    ResetShape,
    Rename,
    Delete,
    InsertShapePoint,
    DeleteShapePoint,
    CreateGroup
};

/// Menu label, e.g. "Split Route Here"
std::string toString(RouteAction action);

enum class ContextTarget {
    None,
    System,
    Route
};

/// Legal actions for a secondary click, resolved against the current selection
struct ContextMenu {
    ContextTarget target = ContextTarget::None;
    Point position{0, 0};             ///< World position of the click
    SystemId systemId;                ///< Clicked system (System target)
    RouteId routeId;                  ///< Route the actions apply to
    std::optional<size_t> insertIndex;       ///< Member position for InsertSystem
    std::optional<size_t> shapePointIndex;   ///< Clicked shape point for DeleteShapePoint
    std::vector<RouteAction> actions;

    bool offers(RouteAction action) const {
        return std::find(actions.begin(), actions.end(), action) != actions.end();
    }
    bool empty() const { return actions.empty(); }
};

// =============================================================================
// Output
// =============================================================================

enum class MessageSeverity {
    Info,
    Warning,
    Error
};

/// Message for the user (shown as a dialog by the shell)
struct UserMessage {
    MessageSeverity severity = MessageSeverity::Info;
    std::string title;
    std::string text;
};

/// Per-route data for the rendering layer
struct RouteRenderable {
    RouteId routeId;
    Polyline path;
    bool selected = false;
    bool multiSelected = false;
};

/// Result of input processing
struct InputResult {
    bool stateChanged = false;        ///< Edit state or selection changed
    bool documentChanged = false;     ///< A document mutation was committed
    bool contextMenuRequested = false;  ///< Shell should call openContextMenu()
};

}  // namespace starmap
