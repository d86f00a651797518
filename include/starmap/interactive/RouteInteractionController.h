#pragma once

#include "../config/EditorOptions.h"
#include "../model/MapDocument.h"
#include "InteractionState.h"

#include <functional>
#include <optional>
#include <vector>

namespace starmap {

/// Translates pointer and keyboard input into route edits
///
/// Holds the edit state (idle / drawing / reshaping) and the selection.
/// Every edit goes through MapDocument; rejected edits are reported to the
/// message sink and leave the document unchanged.
///
/// Example usage:
/// @code
/// RouteInteractionController controller(document);
/// controller.setMessageSink([](const UserMessage& msg) { showDialog(msg); });
/// controller.onPointerPressed({worldPos, PointerButton::Primary, {}});
/// @endcode
class RouteInteractionController {
public:
    using MessageSink = std::function<void(const UserMessage&)>;

    explicit RouteInteractionController(MapDocument& document,
                                        EditorOptions options = EditorOptions::createDefault());

    void setMessageSink(MessageSink sink) { messageSink_ = std::move(sink); }

    const EditorOptions& options() const { return options_; }
    void setOptions(const EditorOptions& options);

    // === Input ===

    InputResult onPointerPressed(const PointerEvent& event);
    InputResult onPointerMoved(const PointerEvent& event);
    InputResult onPointerReleased(const PointerEvent& event);

    /// Reshape modifier released: commits a stroke in progress
    InputResult onReshapeModifierReleased();

    /// Escape: discard any drawing preview or stroke
    InputResult cancel();

    // === Context menu ===

    /// Legal actions at a world position (empty while a gesture is active)
    /// Clicking a route also selects it.
    ContextMenu openContextMenu(const Point& position);

    /// Run a menu action through the document
    /// @param text Name for Rename and CreateGroup
    /// @return true if the document changed
    bool execute(const ContextMenu& menu, RouteAction action, const std::string& text = "");

    // === State ===

    const EditState& state() const { return state_; }
    bool isIdle() const { return std::holds_alternative<IdleState>(state_); }
    bool isDrawing() const { return std::holds_alternative<DrawingState>(state_); }
    bool isReshaping() const { return std::holds_alternative<ReshapingState>(state_); }

    const std::optional<RouteId>& selectedRoute() const { return selectedRoute_; }
    void selectRoute(const RouteId& routeId);
    void clearSelection();

    const std::vector<RouteId>& multiSelection() const { return multiSelection_; }
    bool isMultiSelected(const RouteId& routeId) const;

    // === Hit testing ===

    std::optional<SystemId> hitSystem(const Point& position) const;

    /// Route whose rendered path passes nearest to the position, within routeHitThreshold
    std::optional<RouteId> hitRoute(const Point& position) const;

    /// Shape point of a route within shapePointHitRadius
    std::optional<size_t> hitShapePoint(const RouteId& routeId, const Point& position) const;

    // === Rendering boundary ===

    std::vector<RouteRenderable> renderables() const;

    /// Start system, waypoints and the last cursor position; empty when not drawing
    Polyline drawingPreview() const;

    /// Raw stroke samples; empty when not reshaping
    Polyline strokePreview() const;

private:
    InputResult handlePrimaryWhileDrawing(DrawingState& drawing, const PointerEvent& event);
    InputResult handlePrimaryWhileIdle(const PointerEvent& event);
    InputResult commitReshape();
    void toggleMultiSelection(const RouteId& routeId);
    void dropStaleSelection();
    void forgetRoute(const RouteId& routeId);

    ContextMenu systemMenu(const SystemId& systemId, const Point& position) const;
    ContextMenu routeMenu(const RouteId& routeId, const Point& position) const;

    bool applyRouteEdit(const RouteEditResult<Route>& result, const char* operation);

    /// Log and forward a rejection to the message sink
    template <typename T>
    bool report(const RouteEditResult<T>& result, const char* operation);
    void notify(MessageSeverity severity, const std::string& title, const std::string& text);

    MapDocument& document_;
    EditorOptions options_;
    MessageSink messageSink_;

    EditState state_;
    std::optional<RouteId> selectedRoute_;
    std::vector<RouteId> multiSelection_;
    std::optional<Point> cursor_;
};

}  // namespace starmap
