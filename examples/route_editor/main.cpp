#include <SDL3/SDL.h>
#include <imgui.h>
#include <imgui_impl_sdl3.h>
#include <imgui_impl_sdlrenderer3.h>

#include "EditorColors.h"
#include "EditorState.h"

#include <starmap/starmap.h>
#include <starmap/common/Logger.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <string>

using namespace starmap;

/// Star-map route editor: SDL3 window, ImGui canvas and side panel
class RouteEditorDemo {
public:
    RouteEditorDemo()
        : controller_(document_, options_) {
        controller_.setMessageSink([this](const UserMessage& msg) { state_.pendingMessage = msg; });
    }

    bool loadMap(const std::string& path) {
        state_.mapPath = path;
        if (!ProjectSerializer::loadFromFile(document_, path)) {
            return false;
        }
        controller_.clearSelection();
        return true;
    }

    bool loadOptions(const std::string& path) {
        if (!EditorOptions::loadFromFile(path, options_)) {
            return false;
        }
        controller_.setOptions(options_);
        return true;
    }

    void createSampleMap() {
        document_.clear();
        document_.metadata().name = "Sample Sector";
        auto& systems = document_.systems();
        systems.addSystem("coruscant", "Coruscant", {120, 160});
        systems.addSystem("corellia", "Corellia", {300, 120});
        systems.addSystem("kuat", "Kuat", {460, 220});
        systems.addSystem("alderaan", "Alderaan", {260, 320});
        systems.addSystem("bespin", "Bespin", {540, 420});
        systems.addSystem("hoth", "Hoth", {700, 300});

        RouteAttributes express;
        express.setRouteClass(1);
        express.travelType = TravelType::ExpressLane;
        addSampleRoute("coruscant", "corellia", {{210, 110}}, express);
        addSampleRoute("corellia", "kuat", {}, RouteAttributes{});
        addSampleRoute("alderaan", "bespin", {{360, 420}, {460, 460}}, RouteAttributes{});
        document_.markClean();
    }

    // =========================================================================
    // Input
    // =========================================================================

    void processInput() {
        ImGuiIO& io = ImGui::GetIO();
        if (io.WantCaptureMouse) {
            return;
        }

        handleZoom(io);
        if (ImGui::IsMouseDragging(ImGuiMouseButton_Middle)) {
            state_.view.panOffset.x += io.MouseDelta.x / state_.view.zoom;
            state_.view.panOffset.y += io.MouseDelta.y / state_.view.zoom;
        }

        Modifiers mods;
        mods.multiSelect = io.KeyCtrl;
        mods.reshape = io.KeyShift;
        Point mouse = state_.view.screenToWorld(io.MousePos);

        if (ImGui::IsMouseClicked(ImGuiMouseButton_Left)) {
            controller_.onPointerPressed({mouse, PointerButton::Primary, mods});
        }
        if (ImGui::IsMouseClicked(ImGuiMouseButton_Right)) {
            auto result = controller_.onPointerPressed({mouse, PointerButton::Secondary, mods});
            if (result.contextMenuRequested) {
                state_.contextMenu = controller_.openContextMenu(mouse);
                state_.openContextPopup = !state_.contextMenu.empty();
            }
        }
        if (io.MouseDelta.x != 0.0f || io.MouseDelta.y != 0.0f) {
            if (controller_.isDrawing() || ImGui::IsMouseDown(ImGuiMouseButton_Left)) {
                controller_.onPointerMoved({mouse, PointerButton::Primary, mods});
            }
        }
        if (ImGui::IsMouseReleased(ImGuiMouseButton_Left)) {
            controller_.onPointerReleased({mouse, PointerButton::Primary, mods});
        }
        if (controller_.isReshaping() && !io.KeyShift) {
            controller_.onReshapeModifierReleased();
        }
        if (ImGui::IsKeyPressed(ImGuiKey_Escape)) {
            controller_.cancel();
        }
    }

    // =========================================================================
    // Canvas
    // =========================================================================

    void render(ImDrawList* drawList) const {
        renderRoutes(drawList);
        renderPreviews(drawList);
        renderSystems(drawList);
    }

    // =========================================================================
    // UI
    // =========================================================================

    void renderUI() {
        renderContextMenu();
        renderMessage();
        renderSidePanel();
    }

    bool shouldQuit() const { return quit_; }

private:
    void addSampleRoute(const SystemId& start, const SystemId& end, const Polyline& shape,
                        const RouteAttributes& attributes) {
        auto created = document_.createRoute(start, end, shape);
        if (!created) {
            LOG_WARN("Sample route {} - {} rejected: {}", start, end, created.reason);
            return;
        }
        auto updated = document_.setRouteAttributes(*created.value, attributes);
        if (!updated) {
            LOG_WARN("Sample route attributes rejected: {}", updated.reason);
        }
    }

    void handleZoom(const ImGuiIO& io) {
        if (io.MouseWheel == 0.0f) return;
        Point before = state_.view.screenToWorld(io.MousePos);
        state_.view.zoom = std::clamp(state_.view.zoom + io.MouseWheel * 0.1f, 0.2f, 5.0f);
        Point after = state_.view.screenToWorld(io.MousePos);
        state_.view.panOffset.x += after.x - before.x;
        state_.view.panOffset.y += after.y - before.y;
    }

    float routeWidth(const RouteId& routeId) const {
        const Route* route = document_.tryGetRoute(routeId);
        int cls = route ? route->attributes().routeClass : RouteAttributes::DEFAULT_CLASS;
        return EditorVisuals::ROUTE_WIDTH_BY_CLASS[cls - RouteAttributes::MIN_CLASS] * state_.view.zoom;
    }

    void drawPolyline(ImDrawList* drawList, const Polyline& points, ImU32 color, float width) const {
        for (size_t i = 1; i < points.size(); ++i) {
            drawList->AddLine(state_.view.worldToScreen(points[i - 1]),
                              state_.view.worldToScreen(points[i]), color, width);
        }
    }

    void renderRoutes(ImDrawList* drawList) const {
        for (const auto& item : controller_.renderables()) {
            ImU32 color = EditorColors::ROUTE;
            if (item.selected) color = EditorColors::ROUTE_SELECTED;
            else if (item.multiSelected) color = EditorColors::ROUTE_MULTI_SELECTED;
            drawPolyline(drawList, item.path, color, routeWidth(item.routeId));

            if (!item.selected) continue;
            for (const auto& p : document_.getRoute(item.routeId).shapePoints()) {
                drawList->AddCircleFilled(state_.view.worldToScreen(p),
                                          EditorVisuals::SHAPE_POINT_RADIUS, EditorColors::SHAPE_POINT);
            }
        }
    }

    void renderPreviews(ImDrawList* drawList) const {
        drawPolyline(drawList, controller_.drawingPreview(), EditorColors::DRAWING_PREVIEW, 1.5f);
        drawPolyline(drawList, controller_.strokePreview(), EditorColors::STROKE_PREVIEW, 1.5f);
    }

    void renderSystems(ImDrawList* drawList) const {
        float radius = EditorVisuals::SYSTEM_RADIUS * std::max(state_.view.zoom, 0.5f);
        for (const auto& [id, system] : document_.systems().systems()) {
            ImVec2 center = state_.view.worldToScreen(system.position);
            drawList->AddCircleFilled(center, radius, EditorColors::SYSTEM);
            drawList->AddCircle(center, radius, EditorColors::SYSTEM_BORDER);
            drawList->AddText(ImVec2(center.x + radius + 3.0f, center.y - 7.0f),
                              EditorColors::SYSTEM_LABEL, system.name.c_str());
        }
    }

    void renderContextMenu() {
        if (state_.openContextPopup) {
            ImGui::OpenPopup("RouteContextMenu");
            state_.openContextPopup = false;
            std::memset(state_.nameBuffer, 0, sizeof(state_.nameBuffer));
        }
        if (!ImGui::BeginPopup("RouteContextMenu")) {
            return;
        }

        const ContextMenu& menu = state_.contextMenu;
        for (RouteAction action : menu.actions) {
            std::string label = toString(action);
            if (action == RouteAction::Rename || action == RouteAction::CreateGroup) {
                if (ImGui::BeginMenu(label.c_str())) {
                    ImGui::InputText("##name", state_.nameBuffer, sizeof(state_.nameBuffer));
                    if (ImGui::Button("OK")) {
                        controller_.execute(menu, action, state_.nameBuffer);
                        ImGui::CloseCurrentPopup();
                    }
                    ImGui::EndMenu();
                }
                continue;
            }
            if (ImGui::MenuItem(label.c_str())) {
                controller_.execute(menu, action);
            }
        }
        ImGui::EndPopup();
    }

    void renderMessage() {
        if (!state_.pendingMessage) {
            return;
        }
        ImGui::OpenPopup(state_.pendingMessage->title.c_str());
        if (ImGui::BeginPopupModal(state_.pendingMessage->title.c_str(), nullptr,
                                   ImGuiWindowFlags_AlwaysAutoResize)) {
            ImGui::TextUnformatted(state_.pendingMessage->text.c_str());
            if (ImGui::Button("OK")) {
                ImGui::CloseCurrentPopup();
                state_.pendingMessage.reset();
            }
            ImGui::EndPopup();
        }
    }

    void renderSidePanel() {
        ImGui::SetNextWindowPos(ImVec2(10, 10), ImGuiCond_FirstUseEver);
        ImGui::SetNextWindowSize(ImVec2(300, 460), ImGuiCond_FirstUseEver);
        ImGui::Begin("Star Map");

        ImGui::Text("%s%s", document_.metadata().name.c_str(), document_.isDirty() ? " *" : "");
        ImGui::Text("Systems: %zu  Routes: %zu  Groups: %zu", document_.systems().systemCount(),
                    document_.routeCount(), document_.groups().groupCount());
        if (ImGui::Button("Save")) {
            if (ProjectSerializer::saveToFile(document_, state_.mapPath)) {
                document_.markClean();
            }
        }
        ImGui::SameLine();
        if (ImGui::Button("Quit")) {
            quit_ = true;
        }

        ImGui::Separator();
        renderSelectedRoute();

        ImGui::Separator();
        if (ImGui::TreeNode("Route Groups")) {
            for (const auto& [id, group] : document_.groups().groups()) {
                ImGui::BulletText("%s (%zu routes)", group.name.c_str(), group.routeIds.size());
            }
            ImGui::TreePop();
        }

        ImGui::Separator();
        ImGui::TextDisabled("Click system to system: draw route");
        ImGui::TextDisabled("Shift+drag: reshape selected route");
        ImGui::TextDisabled("Ctrl+click: multi-select");
        ImGui::End();
    }

    void renderSelectedRoute() {
        const auto& selected = controller_.selectedRoute();
        const Route* route = selected ? document_.tryGetRoute(*selected) : nullptr;
        if (!route) {
            ImGui::TextDisabled("No route selected");
            return;
        }

        ImGui::Text("%s", route->name().c_str());
        ImGui::Text("%zu systems, %zu shape points", route->memberCount(), route->shapePoints().size());

        RouteAttributes attributes = route->attributes();
        bool changed = ImGui::SliderInt("Class", &attributes.routeClass,
                                        RouteAttributes::MIN_CLASS, RouteAttributes::MAX_CLASS);

        std::string current = displayName(attributes.travelType);
        if (ImGui::BeginCombo("Travel type", current.c_str())) {
            for (TravelType type : allTravelTypes()) {
                if (ImGui::Selectable(displayName(type).c_str(), type == attributes.travelType)) {
                    attributes.travelType = type;
                    changed = true;
                }
            }
            ImGui::EndCombo();
        }

        for (Hazard hazard : allHazards()) {
            bool on = attributes.hasHazard(hazard);
            if (ImGui::Checkbox(displayName(hazard).c_str(), &on)) {
                attributes.toggleHazard(hazard);
                changed = true;
            }
        }

        if (changed) {
            auto updated = document_.setRouteAttributes(route->id(), attributes);
            if (!updated) {
                state_.pendingMessage = UserMessage{MessageSeverity::Warning, errorTitle(updated.error),
                                                    updated.reason};
            }
            route = document_.tryGetRoute(*selected);
        }

        int rating = static_cast<int>(state_.hyperdrive) - 1;
        const char* ratings[] = {"x1", "x2", "x3", "x4"};
        if (ImGui::Combo("Hyperdrive", &rating, ratings, 4)) {
            state_.hyperdrive = static_cast<HyperdriveRating>(rating + 1);
        }
        auto estimate = TravelCalculator::estimate(*route, document_.systems(), state_.hyperdrive);
        ImGui::Text("Length: %.1f HSU", estimate.lengthHsu);
        ImGui::Text("Travel time: %.1f h (speed x%.2f)", estimate.hours, estimate.speedFactor);
    }

    MapDocument document_;
    EditorOptions options_ = EditorOptions::createDefault();
    RouteInteractionController controller_;
    EditorState state_;
    bool quit_ = false;
};

int main(int argc, char* argv[]) {
    Logger::initialize();

    std::string mapPath;
    std::string optionsPath;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.find("--options=") == 0) {
            optionsPath = arg.substr(10);
        } else {
            mapPath = arg;
        }
    }

    RouteEditorDemo demo;
    if (!optionsPath.empty() && !demo.loadOptions(optionsPath)) {
        LOG_WARN("Using default editor options");
    }
    if (mapPath.empty() || !demo.loadMap(mapPath)) {
        demo.createSampleMap();
    }

    if (!SDL_Init(SDL_INIT_VIDEO)) {
        SDL_Log("SDL_Init failed: %s", SDL_GetError());
        return 1;
    }

    SDL_Window* window = SDL_CreateWindow("Starmap Route Editor", 1024, 768, SDL_WINDOW_RESIZABLE);
    if (!window) {
        SDL_Log("SDL_CreateWindow failed: %s", SDL_GetError());
        return 1;
    }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, nullptr);
    if (!renderer) {
        SDL_Log("SDL_CreateRenderer failed: %s", SDL_GetError());
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    ImGui::StyleColorsDark();

    ImGui_ImplSDL3_InitForSDLRenderer(window, renderer);
    ImGui_ImplSDLRenderer3_Init(renderer);

    bool running = true;
    while (running && !demo.shouldQuit()) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL3_ProcessEvent(&event);
            if (event.type == SDL_EVENT_QUIT) {
                running = false;
            }
        }

        ImGui_ImplSDLRenderer3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        demo.processInput();
        demo.render(ImGui::GetBackgroundDrawList());
        demo.renderUI();

        ImGui::Render();

        SDL_SetRenderDrawColor(renderer, 14, 16, 28, 255);
        SDL_RenderClear(renderer);

        ImGui_ImplSDLRenderer3_RenderDrawData(ImGui::GetDrawData(), renderer);
        SDL_RenderPresent(renderer);
    }

    ImGui_ImplSDLRenderer3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();

    Logger::flush();
    return 0;
}
