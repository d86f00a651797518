#pragma once

#include <starmap/core/Types.h>
#include <starmap/calc/TravelCalculator.h>
#include <starmap/interactive/InteractionState.h>
#include <imgui.h>

#include <optional>
#include <string>

namespace starmap {

/// View transformation state (pan/zoom)
struct ViewTransform {
    Point panOffset = {0, 0};
    float zoom = 1.0f;

    ImVec2 worldToScreen(const Point& world) const {
        return {(world.x + panOffset.x) * zoom, (world.y + panOffset.y) * zoom};
    }

    Point screenToWorld(const ImVec2& screen) const {
        return {screen.x / zoom - panOffset.x, screen.y / zoom - panOffset.y};
    }
};

/// UI-side state of the route editor window
struct EditorState {
    ViewTransform view;
    std::string mapPath = "starmap.json";

    // Context menu captured when the popup opens
    ContextMenu contextMenu;
    bool openContextPopup = false;
    char nameBuffer[128] = {};

    // Latest rejected edit, shown as a modal
    std::optional<UserMessage> pendingMessage;

    HyperdriveRating hyperdrive = HyperdriveRating::X1;
};

}  // namespace starmap
