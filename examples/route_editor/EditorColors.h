#pragma once

#include <imgui.h>

namespace starmap {

/// Colour constants for the route editor canvas
namespace EditorColors {
    constexpr ImU32 BACKGROUND_GRID = IM_COL32(40, 44, 60, 120);

    // Systems
    constexpr ImU32 SYSTEM = IM_COL32(230, 220, 160, 255);
    constexpr ImU32 SYSTEM_BORDER = IM_COL32(120, 110, 60, 255);
    constexpr ImU32 SYSTEM_LABEL = IM_COL32(220, 220, 230, 255);

    // Routes
    constexpr ImU32 ROUTE = IM_COL32(110, 160, 220, 255);
    constexpr ImU32 ROUTE_SELECTED = IM_COL32(255, 200, 80, 255);
    constexpr ImU32 ROUTE_MULTI_SELECTED = IM_COL32(120, 230, 140, 255);
    constexpr ImU32 SHAPE_POINT = IM_COL32(255, 200, 80, 200);

    // Gestures
    constexpr ImU32 DRAWING_PREVIEW = IM_COL32(200, 200, 255, 160);
    constexpr ImU32 STROKE_PREVIEW = IM_COL32(255, 120, 120, 200);
}

namespace EditorVisuals {
    constexpr float SYSTEM_RADIUS = 6.0f;
    constexpr float SHAPE_POINT_RADIUS = 3.5f;
    /// Route line width for class 1 (widest) .. 5
    constexpr float ROUTE_WIDTH_BY_CLASS[] = {4.0f, 3.2f, 2.5f, 1.8f, 1.2f};
}

}  // namespace starmap
