#include "starmap/interactive/RouteInteractionController.h"
#include "starmap/editing/RouteEditor.h"
#include "starmap/core/GeometryUtils.h"
#include "starmap/common/Logger.h"

#include <algorithm>

namespace starmap {

std::string toString(RouteAction action) {
    switch (action) {
        case RouteAction::InsertSystem: return "Insert System Into Route";
        case RouteAction::RemoveSystem: return "Remove System From Route";
        case RouteAction::SplitRoute: return "Split Route Here";
        case RouteAction::MergeRoutes: return "Merge Selected Routes";
        case RouteAction::ResetShape: return "Reset To Straight Line";
        case RouteAction::Rename: return "Rename Route";
        case RouteAction::Delete: return "Delete Route";
        case RouteAction::InsertShapePoint: return "Add Control Point";
        case RouteAction::DeleteShapePoint: return "Delete Control Point";
        case RouteAction::CreateGroup: return "Create Route Group";
    }
    return "Unknown";
}

template <typename T>
bool RouteInteractionController::report(const RouteEditResult<T>& result, const char* operation) {
    if (result) {
        return true;
    }
    LOG_WARN("Cannot {} ({}): {}", operation, toString(result.error), result.reason);
    notify(MessageSeverity::Warning, errorTitle(result.error), result.reason);
    return false;
}

RouteInteractionController::RouteInteractionController(MapDocument& document, EditorOptions options)
    : document_(document), options_(options) {
    options_.sanitize();
}

void RouteInteractionController::setOptions(const EditorOptions& options) {
    options_ = options;
    options_.sanitize();
}

// =============================================================================
// Input
// =============================================================================

InputResult RouteInteractionController::onPointerPressed(const PointerEvent& event) {
    dropStaleSelection();
    cursor_ = event.position;

    if (event.button == PointerButton::Secondary) {
        if (!isIdle()) {
            return cancel();
        }
        InputResult result;
        result.contextMenuRequested = true;
        return result;
    }

    if (auto* drawing = std::get_if<DrawingState>(&state_)) {
        return handlePrimaryWhileDrawing(*drawing, event);
    }
    if (isReshaping()) {
        // One gesture at a time
        return {};
    }
    return handlePrimaryWhileIdle(event);
}

InputResult RouteInteractionController::handlePrimaryWhileDrawing(DrawingState& drawing,
                                                                  const PointerEvent& event) {
    InputResult result;
    result.stateChanged = true;

    auto system = hitSystem(event.position);
    if (!system) {
        drawing.waypoints.push_back(event.position);
        return result;
    }
    if (*system == drawing.startSystem) {
        LOG_DEBUG("Route drawing cancelled on start system {}", *system);
        state_ = IdleState{};
        return result;
    }

    DrawingState finished = std::move(drawing);
    state_ = IdleState{};

    auto created = document_.createRoute(finished.startSystem, *system, finished.waypoints,
                                         options_.defaultRouteClass);
    if (report(created, "create route")) {
        selectedRoute_ = *created.value;
        result.documentChanged = true;
    }
    return result;
}

InputResult RouteInteractionController::handlePrimaryWhileIdle(const PointerEvent& event) {
    InputResult result;
    result.stateChanged = true;

    if (event.modifiers.reshape && selectedRoute_) {
        const Route* route = document_.tryGetRoute(*selectedRoute_);
        if (route && !route->isChain()) {
            state_ = ReshapingState{*selectedRoute_, {event.position}};
            return result;
        }
    }

    auto route = hitRoute(event.position);
    if (event.modifiers.multiSelect && route) {
        toggleMultiSelection(*route);
        return result;
    }

    if (auto system = hitSystem(event.position)) {
        state_ = DrawingState{*system, {}};
        LOG_DEBUG("Route drawing started at system {}", *system);
        return result;
    }

    if (route) {
        selectedRoute_ = *route;
        return result;
    }

    clearSelection();
    return result;
}

InputResult RouteInteractionController::onPointerMoved(const PointerEvent& event) {
    cursor_ = event.position;

    InputResult result;
    if (auto* reshaping = std::get_if<ReshapingState>(&state_)) {
        reshaping->stroke.push_back(event.position);
        result.stateChanged = true;
    } else if (isDrawing()) {
        result.stateChanged = true;
    }
    return result;
}

InputResult RouteInteractionController::onPointerReleased(const PointerEvent& event) {
    if (event.button == PointerButton::Primary && isReshaping()) {
        return commitReshape();
    }
    return {};
}

InputResult RouteInteractionController::onReshapeModifierReleased() {
    if (isReshaping()) {
        return commitReshape();
    }
    return {};
}

InputResult RouteInteractionController::cancel() {
    InputResult result;
    if (!isIdle()) {
        LOG_DEBUG("Gesture cancelled");
        state_ = IdleState{};
        result.stateChanged = true;
    }
    return result;
}

InputResult RouteInteractionController::commitReshape() {
    ReshapingState reshaping = std::get<ReshapingState>(std::move(state_));
    state_ = IdleState{};

    InputResult result;
    result.stateChanged = true;

    const Route* route = document_.tryGetRoute(reshaping.routeId);
    if (!route) {
        notify(MessageSeverity::Warning, errorTitle(RouteEditError::RouteNotFound),
               "The route being reshaped no longer exists");
        return result;
    }

    auto reshaped = RouteEditor::reshapeFromStroke(*route, reshaping.stroke, document_.systems(),
                                                   options_.decimateTarget, options_.smoothingWindow);
    result.documentChanged = applyRouteEdit(reshaped, "reshape route");
    return result;
}

// =============================================================================
// Context menu
// =============================================================================

ContextMenu RouteInteractionController::openContextMenu(const Point& position) {
    dropStaleSelection();

    ContextMenu menu;
    menu.position = position;
    if (!isIdle()) {
        return menu;
    }

    if (auto system = hitSystem(position)) {
        menu = systemMenu(*system, position);
    } else if (auto route = hitRoute(position)) {
        selectedRoute_ = *route;
        menu = routeMenu(*route, position);
    }

    if (multiSelection_.size() == 2) {
        const Route* a = document_.tryGetRoute(multiSelection_[0]);
        const Route* b = document_.tryGetRoute(multiSelection_[1]);
        if (a && b && RouteEditor::canMerge(*a, *b)) {
            menu.actions.push_back(RouteAction::MergeRoutes);
        }
    }
    if (!multiSelection_.empty()) {
        menu.actions.push_back(RouteAction::CreateGroup);
    }
    return menu;
}

ContextMenu RouteInteractionController::systemMenu(const SystemId& systemId, const Point& position) const {
    ContextMenu menu;
    menu.target = ContextTarget::System;
    menu.position = position;
    menu.systemId = systemId;
    if (!selectedRoute_) {
        return menu;
    }

    const Route& route = document_.getRoute(*selectedRoute_);
    menu.routeId = route.id();

    int index = route.systemIndex(systemId);
    if (index < 0) {
        auto systemPos = document_.systems().getPosition(systemId);
        menu.insertIndex = RouteEditor::insertionIndexFor(route, systemPos.value_or(position),
                                                          document_.systems());
        if (menu.insertIndex) {
            menu.actions.push_back(RouteAction::InsertSystem);
        }
        return menu;
    }

    if (route.memberCount() > 2) {
        menu.actions.push_back(RouteAction::RemoveSystem);
    }
    if (index > 0 && static_cast<size_t>(index) + 1 < route.memberCount()) {
        menu.actions.push_back(RouteAction::SplitRoute);
    }
    return menu;
}

ContextMenu RouteInteractionController::routeMenu(const RouteId& routeId, const Point& position) const {
    ContextMenu menu;
    menu.target = ContextTarget::Route;
    menu.position = position;
    menu.routeId = routeId;

    const Route& route = document_.getRoute(routeId);
    if (!route.isChain()) {
        menu.actions.push_back(RouteAction::InsertShapePoint);
        menu.shapePointIndex = hitShapePoint(routeId, position);
        if (menu.shapePointIndex) {
            menu.actions.push_back(RouteAction::DeleteShapePoint);
        }
        if (!route.shapePoints().empty()) {
            menu.actions.push_back(RouteAction::ResetShape);
        }
    }
    menu.actions.push_back(RouteAction::Rename);
    menu.actions.push_back(RouteAction::Delete);
    return menu;
}

bool RouteInteractionController::execute(const ContextMenu& menu, RouteAction action, const std::string& text) {
    if (!menu.offers(action)) {
        LOG_WARN("Action '{}' is not available for this target", toString(action));
        notify(MessageSeverity::Warning, "Action Unavailable",
               toString(action) + " is not available here");
        return false;
    }

    // Actions on the multi-selection do not need a target route
    if (action == RouteAction::MergeRoutes) {
        if (multiSelection_.size() != 2) {
            notify(MessageSeverity::Warning, "Invalid Selection",
                   "Please select exactly 2 routes to merge.");
            return false;
        }
        auto merged = document_.mergeRoutes(multiSelection_.at(0), multiSelection_.at(1));
        if (!report(merged, "merge routes")) return false;
        multiSelection_.clear();
        selectedRoute_ = *merged.value;
        return true;
    }
    if (action == RouteAction::CreateGroup) {
        auto group = document_.createGroup(text, multiSelection_);
        if (!report(group, "create group")) return false;
        multiSelection_.clear();
        return true;
    }

    const Route* route = document_.tryGetRoute(menu.routeId);
    if (!route) {
        notify(MessageSeverity::Warning, errorTitle(RouteEditError::RouteNotFound),
               "The selected route no longer exists");
        return false;
    }
    const auto& systems = document_.systems();

    switch (action) {
        case RouteAction::InsertSystem:
            return applyRouteEdit(RouteEditor::insertSystem(*route, menu.systemId,
                                                            menu.insertIndex.value_or(route->memberCount() - 1),
                                                            systems),
                                  "insert system");
        case RouteAction::RemoveSystem:
            return applyRouteEdit(RouteEditor::removeSystem(*route, menu.systemId), "remove system");
        case RouteAction::SplitRoute: {
            auto split = document_.splitRoute(menu.routeId, menu.systemId);
            if (!report(split, "split route")) return false;
            forgetRoute(menu.routeId);
            selectedRoute_ = split.value->first;
            return true;
        }
        case RouteAction::ResetShape:
            return applyRouteEdit(RouteEditResult<Route>::ok(RouteEditor::resetToStraight(*route)),
                                  "reset route shape");
        case RouteAction::Rename: {
            if (text.find_first_not_of(" \t") == std::string::npos) {
                notify(MessageSeverity::Warning, "Invalid Name", "Route name cannot be empty");
                return false;
            }
            return report(document_.renameRoute(menu.routeId, text), "rename route");
        }
        case RouteAction::Delete: {
            RouteId deleted = menu.routeId;
            if (!report(document_.deleteRoute(deleted), "delete route")) return false;
            forgetRoute(deleted);
            return true;
        }
        case RouteAction::InsertShapePoint:
            return applyRouteEdit(RouteEditor::insertPointOnSegment(*route, menu.position, systems),
                                  "insert control point");
        case RouteAction::DeleteShapePoint:
            return applyRouteEdit(RouteEditor::deleteShapePoint(*route, menu.shapePointIndex.value_or(0)),
                                  "delete control point");
        case RouteAction::MergeRoutes:
        case RouteAction::CreateGroup:
            break;
    }
    return false;
}

bool RouteInteractionController::applyRouteEdit(const RouteEditResult<Route>& result, const char* operation) {
    if (!report(result, operation)) {
        return false;
    }
    return report(document_.updateRoute(*result.value), operation);
}

void RouteInteractionController::notify(MessageSeverity severity, const std::string& title,
                                        const std::string& text) {
    if (messageSink_) {
        messageSink_(UserMessage{severity, title, text});
    }
}

// =============================================================================
// Selection
// =============================================================================

void RouteInteractionController::selectRoute(const RouteId& routeId) {
    if (document_.hasRoute(routeId)) {
        selectedRoute_ = routeId;
    }
}

void RouteInteractionController::clearSelection() {
    selectedRoute_.reset();
    multiSelection_.clear();
}

bool RouteInteractionController::isMultiSelected(const RouteId& routeId) const {
    return std::find(multiSelection_.begin(), multiSelection_.end(), routeId) != multiSelection_.end();
}

void RouteInteractionController::toggleMultiSelection(const RouteId& routeId) {
    auto it = std::find(multiSelection_.begin(), multiSelection_.end(), routeId);
    if (it != multiSelection_.end()) {
        multiSelection_.erase(it);
    } else {
        multiSelection_.push_back(routeId);
    }
}

void RouteInteractionController::forgetRoute(const RouteId& routeId) {
    if (selectedRoute_ == routeId) {
        selectedRoute_.reset();
    }
    std::erase(multiSelection_, routeId);
}

void RouteInteractionController::dropStaleSelection() {
    if (selectedRoute_ && !document_.hasRoute(*selectedRoute_)) {
        selectedRoute_.reset();
    }
    std::erase_if(multiSelection_, [this](const RouteId& id) { return !document_.hasRoute(id); });
    if (auto* reshaping = std::get_if<ReshapingState>(&state_);
        reshaping && !document_.hasRoute(reshaping->routeId)) {
        state_ = IdleState{};
    }
    if (auto* drawing = std::get_if<DrawingState>(&state_);
        drawing && !document_.systems().hasSystem(drawing->startSystem)) {
        state_ = IdleState{};
    }
}

// =============================================================================
// Hit testing
// =============================================================================

std::optional<SystemId> RouteInteractionController::hitSystem(const Point& position) const {
    return document_.systems().findSystemAt(position, options_.systemSnapRadius);
}

std::optional<RouteId> RouteInteractionController::hitRoute(const Point& position) const {
    std::optional<RouteId> best;
    float bestDist = options_.routeHitThreshold;
    for (const auto& [id, route] : document_.routes()) {
        auto hit = geometry::nearestSegment(position, route.renderPath(document_.systems(), options_.splineSamples));
        if (hit.segmentIndex < 0) continue;
        if (hit.distance < bestDist || (!best && hit.distance <= bestDist)) {
            bestDist = hit.distance;
            best = id;
        }
    }
    return best;
}

std::optional<size_t> RouteInteractionController::hitShapePoint(const RouteId& routeId,
                                                                const Point& position) const {
    const Route* route = document_.tryGetRoute(routeId);
    if (!route) {
        return std::nullopt;
    }

    std::optional<size_t> best;
    float bestDist = options_.shapePointHitRadius;
    const auto& points = route->shapePoints();
    for (size_t i = 0; i < points.size(); ++i) {
        float dist = points[i].distanceTo(position);
        if (dist < bestDist || (!best && dist <= bestDist)) {
            bestDist = dist;
            best = i;
        }
    }
    return best;
}

// =============================================================================
// Rendering boundary
// =============================================================================

std::vector<RouteRenderable> RouteInteractionController::renderables() const {
    std::vector<RouteRenderable> result;
    result.reserve(document_.routeCount());
    for (const auto& [id, route] : document_.routes()) {
        Polyline path = route.renderPath(document_.systems(), options_.splineSamples);
        if (path.empty()) continue;
        result.push_back({id, std::move(path), selectedRoute_ == id, isMultiSelected(id)});
    }
    return result;
}

Polyline RouteInteractionController::drawingPreview() const {
    const auto* drawing = std::get_if<DrawingState>(&state_);
    if (!drawing) {
        return {};
    }
    auto start = document_.systems().getPosition(drawing->startSystem);
    if (!start) {
        return {};
    }

    Polyline preview{*start};
    preview.insert(preview.end(), drawing->waypoints.begin(), drawing->waypoints.end());
    if (cursor_) {
        preview.push_back(*cursor_);
    }
    return preview;
}

Polyline RouteInteractionController::strokePreview() const {
    if (const auto* reshaping = std::get_if<ReshapingState>(&state_)) {
        return reshaping->stroke;
    }
    return {};
}

}  // namespace starmap
