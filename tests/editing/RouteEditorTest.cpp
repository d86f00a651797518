#include <gtest/gtest.h>
#include <starmap/editing/RouteEditor.h>
#include <starmap/model/SystemCatalog.h>

#include <algorithm>
#include <cmath>
#include <set>

using namespace starmap;

class RouteEditorTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog_.addSystem("S1", "Sol", {0, 0});
        catalog_.addSystem("S2", "Vega", {100, 0});
        catalog_.addSystem("S3", "Rigel", {200, 0});
        catalog_.addSystem("S4", "Deneb", {300, 0});
        catalog_.addSystem("S5", "Altair", {150, 80});
    }

    Route simple(const SystemId& a, const SystemId& b, const RouteId& id = "R1") {
        return Route(id, "", a, b);
    }

    Route chain(const std::vector<SystemId>& members, const RouteId& id = "R1") {
        return Route(id, "", members);
    }

    SystemCatalog catalog_;
};

// ============== createRoute Tests ==============

TEST_F(RouteEditorTest, CreateRouteSucceeds) {
    auto result = RouteEditor::createRoute("R1", "S1", "S2", {}, catalog_);

    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.value->name(), "Sol - Vega");
    EXPECT_FALSE(result.value->isChain());
    EXPECT_TRUE(result.value->shapePoints().empty());
}

TEST_F(RouteEditorTest, CreateRouteRejectsReversedDuplicate) {
    auto first = RouteEditor::createRoute("R1", "S1", "S2", {}, catalog_);
    ASSERT_TRUE(first.success());
    RouteMap existing;
    existing.emplace("R1", *first.value);

    auto second = RouteEditor::createRoute("R2", "S2", "S1", existing, catalog_);

    EXPECT_FALSE(second.success());
    EXPECT_EQ(second.error, RouteEditError::DuplicateRoute);
}

TEST_F(RouteEditorTest, CreateRouteRejectsDuplicateOfChainEndpoints) {
    RouteMap existing;
    existing.emplace("R1", chain({"S1", "S2", "S3"}));

    EXPECT_EQ(RouteEditor::createRoute("R2", "S3", "S1", existing, catalog_).error,
              RouteEditError::DuplicateRoute);
    EXPECT_TRUE(RouteEditor::createRoute("R2", "S1", "S2", existing, catalog_).success());
}

TEST_F(RouteEditorTest, CreateRouteRejectsSameSystem) {
    EXPECT_EQ(RouteEditor::createRoute("R1", "S1", "S1", {}, catalog_).error, RouteEditError::SameSystem);
}

TEST_F(RouteEditorTest, CreateRouteRejectsUnknownSystem) {
    EXPECT_EQ(RouteEditor::createRoute("R1", "S1", "S9", {}, catalog_).error, RouteEditError::UnknownSystem);
}

TEST_F(RouteEditorTest, CreateRouteKeepsWaypointsAsShapePoints) {
    auto result = RouteEditor::createRoute("R1", "S1", "S2", {}, catalog_, {{30, 20}, {70, 20}}, 2);

    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.value->shapePoints(), (Polyline{{30, 20}, {70, 20}}));
    EXPECT_EQ(result.value->attributes().routeClass, 2);
}

// ============== insertSystem / removeSystem Tests ==============

TEST_F(RouteEditorTest, InsertSystemPromotesToChain) {
    Route route = simple("S1", "S3");
    route.setShapePoints({{50, 40}});

    auto result = RouteEditor::insertSystem(route, "S2", 1, catalog_);

    ASSERT_TRUE(result.success());
    EXPECT_TRUE(result.value->isChain());
    EXPECT_EQ(result.value->effectiveMemberSystems(), (std::vector<SystemId>{"S1", "S2", "S3"}));
    EXPECT_TRUE(result.value->shapePoints().empty());

    // Original untouched
    EXPECT_FALSE(route.isChain());
    EXPECT_EQ(route.shapePoints().size(), 1u);
}

TEST_F(RouteEditorTest, InsertSystemRejectsMember) {
    Route route = chain({"S1", "S2", "S3"});
    EXPECT_EQ(RouteEditor::insertSystem(route, "S2", 1, catalog_).error,
              RouteEditError::SystemAlreadyInRoute);
}

TEST_F(RouteEditorTest, InsertSystemRejectsBadIndexAndUnknownSystem) {
    Route route = simple("S1", "S2");
    EXPECT_EQ(RouteEditor::insertSystem(route, "S3", 5, catalog_).error, RouteEditError::InvalidIndex);
    EXPECT_EQ(RouteEditor::insertSystem(route, "S9", 1, catalog_).error, RouteEditError::UnknownSystem);
}

TEST_F(RouteEditorTest, InsertionIndexFollowsNearestSegment) {
    Route route = chain({"S1", "S2", "S3", "S4"});

    EXPECT_EQ(RouteEditor::insertionIndexFor(route, {150, 80}, catalog_), 2u);
    EXPECT_EQ(RouteEditor::insertionIndexFor(route, {20, -30}, catalog_), 1u);
    EXPECT_EQ(RouteEditor::insertionIndexFor(route, {400, 0}, catalog_), 3u);
}

TEST_F(RouteEditorTest, RemoveSystemFromChain) {
    Route route = chain({"S1", "S2", "S3", "S4"});

    auto result = RouteEditor::removeSystem(route, "S3");

    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.value->effectiveMemberSystems(), (std::vector<SystemId>{"S1", "S2", "S4"}));
}

TEST_F(RouteEditorTest, RemoveSystemDemotesToSimple) {
    auto result = RouteEditor::removeSystem(chain({"S1", "S2", "S3"}), "S2");

    ASSERT_TRUE(result.success());
    EXPECT_FALSE(result.value->isChain());
    EXPECT_EQ(result.value->effectiveEndpoints(), (SystemPair{"S1", "S3"}));
}

TEST_F(RouteEditorTest, RemoveSystemRespectsMinimum) {
    EXPECT_EQ(RouteEditor::removeSystem(simple("S1", "S2"), "S1").error, RouteEditError::BelowMinimumSystems);
    EXPECT_EQ(RouteEditor::removeSystem(simple("S1", "S2"), "S3").error, RouteEditError::SystemNotInRoute);
}

// ============== Shape Point Tests ==============

TEST_F(RouteEditorTest, InsertPointOnSegmentUsesProximity) {
    Route route = simple("S1", "S2");
    route.setShapePoints({{25, 30}, {75, 30}});

    // Near the start->first segment: goes before the existing points
    auto first = RouteEditor::insertPointOnSegment(route, {10, 12}, catalog_);
    ASSERT_TRUE(first.success());
    EXPECT_EQ(first.value->shapePoints().front(), Point(10, 12));

    // Near the middle segment: goes between them, not appended
    auto middle = RouteEditor::insertPointOnSegment(route, {50, 33}, catalog_);
    ASSERT_TRUE(middle.success());
    EXPECT_EQ(middle.value->shapePoints(), (Polyline{{25, 30}, {50, 33}, {75, 30}}));

    // Near the last->end segment: appended
    auto last = RouteEditor::insertPointOnSegment(route, {90, 10}, catalog_);
    ASSERT_TRUE(last.success());
    EXPECT_EQ(last.value->shapePoints().back(), Point(90, 10));
}

TEST_F(RouteEditorTest, InsertPointOnStraightRoute) {
    auto result = RouteEditor::insertPointOnSegment(simple("S1", "S2"), {50, 10}, catalog_);

    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.value->shapePoints(), (Polyline{{50, 10}}));
}

TEST_F(RouteEditorTest, ShapeEditingRejectedOnChain) {
    Route route = chain({"S1", "S2", "S3"});

    EXPECT_EQ(RouteEditor::insertPointOnSegment(route, {50, 10}, catalog_).error,
              RouteEditError::ChainModeUnsupported);
    EXPECT_EQ(RouteEditor::reshapeFromStroke(route, {{0, 0}, {50, 5}, {100, 0}}, catalog_).error,
              RouteEditError::ChainModeUnsupported);
}

TEST_F(RouteEditorTest, DeleteShapePointDownToStraight) {
    Route route = simple("S1", "S2");
    route.setShapePoints({{50, 10}});

    auto result = RouteEditor::deleteShapePoint(route, 0);

    ASSERT_TRUE(result.success());
    EXPECT_TRUE(result.value->shapePoints().empty());
    EXPECT_EQ(RouteEditor::deleteShapePoint(*result.value, 0).error, RouteEditError::InvalidIndex);
}

TEST_F(RouteEditorTest, MoveShapePoint) {
    Route route = simple("S1", "S2");
    route.setShapePoints({{50, 10}, {70, 10}});

    auto result = RouteEditor::moveShapePoint(route, 1, {70, -20});

    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.value->shapePoints()[1], Point(70, -20));
    EXPECT_EQ(RouteEditor::moveShapePoint(route, 2, {0, 0}).error, RouteEditError::InvalidIndex);
}

TEST_F(RouteEditorTest, ResetToStraightIsIdempotent) {
    Route route = simple("S1", "S2");
    route.setShapePoints({{50, 10}, {70, 10}});

    Route once = RouteEditor::resetToStraight(route);
    Route twice = RouteEditor::resetToStraight(once);

    EXPECT_TRUE(once.shapePoints().empty());
    EXPECT_EQ(once.shapePoints(), twice.shapePoints());
    EXPECT_EQ(once.effectiveMemberSystems(), twice.effectiveMemberSystems());
}

// ============== reshapeFromStroke Tests ==============

TEST_F(RouteEditorTest, ReshapeFromNoisyStroke) {
    Route route = simple("S1", "S2");
    Polyline stroke;
    for (int i = 0; i < 200; ++i) {
        float t = static_cast<float>(i) / 199.0f;
        float noise = (i % 2 == 0) ? 1.5f : -1.5f;
        // Drawn roughly from near S1 to near S2, not exactly on the anchors
        stroke.push_back({3.0f + t * 94.0f, 40.0f * std::sin(t * 3.14159f) + noise + 2.0f});
    }

    auto result = RouteEditor::reshapeFromStroke(route, stroke, catalog_);

    ASSERT_TRUE(result.success());
    EXPECT_LE(result.value->shapePoints().size(), 20u);
    EXPECT_FALSE(result.value->shapePoints().empty());

    Polyline path = result.value->renderPath(catalog_);
    EXPECT_EQ(path.front(), Point(0, 0));
    EXPECT_EQ(path.back(), Point(100, 0));
}

TEST_F(RouteEditorTest, ReshapeSnapsToCurrentAnchors) {
    catalog_.moveSystem("S1", {-7.5f, 12.25f});
    Polyline stroke = {{0, 0}, {20, 30}, {50, 40}, {80, 30}, {100, 0}};

    auto result = RouteEditor::reshapeFromStroke(simple("S1", "S2"), stroke, catalog_);

    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.value->renderPath(catalog_).front(), Point(-7.5f, 12.25f));
    EXPECT_EQ(result.value->shapePoints().size(), 3u);
}

TEST_F(RouteEditorTest, ReshapeWithTinyStrokeResets) {
    Route route = simple("S1", "S2");
    route.setShapePoints({{50, 10}});

    auto result = RouteEditor::reshapeFromStroke(route, {{4, 4}}, catalog_);

    ASSERT_TRUE(result.success());
    EXPECT_TRUE(result.value->shapePoints().empty());
}

TEST_F(RouteEditorTest, ReshapeWithMissingAnchor) {
    auto result = RouteEditor::reshapeFromStroke(simple("S1", "S9"), {{0, 0}, {5, 5}, {9, 9}}, catalog_);
    EXPECT_EQ(result.error, RouteEditError::MissingSystemReference);
}

// ============== splitRoute Tests ==============

TEST_F(RouteEditorTest, SplitChainAtInteriorSystem) {
    Route route = chain({"S1", "S2", "S3", "S4"});
    route.attributes().routeClass = 2;
    route.attributes().travelType = TravelType::Backwater;
    route.attributes().hazards = {Hazard::Minefield};

    auto result = RouteEditor::splitRoute(route, "S3", "A", "B", catalog_);

    ASSERT_TRUE(result.success());
    const auto& [first, second] = *result.value;
    EXPECT_EQ(first.effectiveMemberSystems(), (std::vector<SystemId>{"S1", "S2", "S3"}));
    EXPECT_EQ(second.effectiveMemberSystems(), (std::vector<SystemId>{"S3", "S4"}));
    EXPECT_TRUE(first.isChain());
    EXPECT_FALSE(second.isChain());
    EXPECT_EQ(first.name(), "Sol - Rigel");
    EXPECT_EQ(second.name(), "Rigel - Deneb");
    EXPECT_EQ(first.attributes(), route.attributes());
    EXPECT_EQ(second.attributes(), route.attributes());
}

TEST_F(RouteEditorTest, SplitAtEndpointRejected) {
    Route route = chain({"S1", "S2", "S3", "S4"});

    EXPECT_EQ(RouteEditor::splitRoute(route, "S1", "A", "B", catalog_).error, RouteEditError::SplitAtEndpoint);
    EXPECT_EQ(RouteEditor::splitRoute(route, "S4", "A", "B", catalog_).error, RouteEditError::SplitAtEndpoint);
    EXPECT_EQ(RouteEditor::splitRoute(route, "S5", "A", "B", catalog_).error, RouteEditError::SystemNotInRoute);
}

// ============== mergeRoutes Tests ==============

TEST_F(RouteEditorTest, MergeAllFourOrientations) {
    struct Case {
        std::vector<SystemId> a;
        std::vector<SystemId> b;
        MergeOrientation orientation;
        std::vector<SystemId> expected;
    };
    std::vector<Case> cases = {
        {{"S1", "S2"}, {"S2", "S3"}, MergeOrientation::EndToStart, {"S1", "S2", "S3"}},
        {{"S1", "S2"}, {"S3", "S2"}, MergeOrientation::EndToEnd, {"S1", "S2", "S3"}},
        {{"S2", "S3"}, {"S1", "S2"}, MergeOrientation::StartToEnd, {"S1", "S2", "S3"}},
        {{"S2", "S3"}, {"S2", "S1"}, MergeOrientation::StartToStart, {"S1", "S2", "S3"}},
    };

    for (const auto& c : cases) {
        Route a = chain(c.a, "A");
        Route b = chain(c.b, "B");
        EXPECT_EQ(RouteEditor::findMergeOrientation(a, b), c.orientation);

        auto merged = RouteEditor::mergeRoutes(a, b, "M", catalog_);
        ASSERT_TRUE(merged.success()) << merged.reason;
        EXPECT_EQ(merged.value->effectiveMemberSystems(), c.expected);
        EXPECT_TRUE(merged.value->isChain());
    }
}

TEST_F(RouteEditorTest, MergeInheritsFromFirstRoute) {
    Route a = simple("S1", "S2", "A");
    a.attributes().travelType = TravelType::ExpressLane;
    Route b = simple("S2", "S3", "B");
    b.attributes().travelType = TravelType::Backwater;

    auto merged = RouteEditor::mergeRoutes(a, b, "M", catalog_);

    ASSERT_TRUE(merged.success());
    EXPECT_EQ(merged.value->attributes().travelType, TravelType::ExpressLane);
    EXPECT_EQ(merged.value->name(), "Sol - Rigel");
}

TEST_F(RouteEditorTest, MergeWithoutSharedEndpointRejected) {
    auto merged = RouteEditor::mergeRoutes(simple("S1", "S2", "A"), simple("S3", "S4", "B"), "M", catalog_);

    EXPECT_EQ(merged.error, RouteEditError::NoSharedEndpoint);
    EXPECT_FALSE(RouteEditor::canMerge(simple("S1", "S2", "A"), simple("S3", "S4", "B")));
}

TEST_F(RouteEditorTest, MergeThatWouldLoopRejected) {
    // Shares both endpoints: any join repeats a system
    auto merged = RouteEditor::mergeRoutes(chain({"S1", "S2", "S3"}, "A"), chain({"S3", "S4", "S1"}, "B"),
                                           "M", catalog_);

    EXPECT_EQ(merged.error, RouteEditError::SystemAlreadyInRoute);
}

TEST_F(RouteEditorTest, MergeRejectsInteriorOverlap) {
    // Shared endpoint S3, but S2 appears in both
    auto merged = RouteEditor::mergeRoutes(chain({"S1", "S2", "S3"}, "A"), chain({"S3", "S2", "S4"}, "B"),
                                           "M", catalog_);

    EXPECT_EQ(merged.error, RouteEditError::SystemAlreadyInRoute);
}

TEST_F(RouteEditorTest, SplitThenMergeRoundTrip) {
    Route original = chain({"S1", "S2", "S3", "S4", "S5"});

    for (const SystemId& at : {"S2", "S3", "S4"}) {
        auto split = RouteEditor::splitRoute(original, at, "A", "B", catalog_);
        ASSERT_TRUE(split.success());

        // Either argument order reconstructs the same adjacency
        for (bool swapped : {false, true}) {
            const Route& a = swapped ? split.value->second : split.value->first;
            const Route& b = swapped ? split.value->first : split.value->second;
            auto merged = RouteEditor::mergeRoutes(a, b, "M", catalog_);
            ASSERT_TRUE(merged.success());

            auto members = merged.value->effectiveMemberSystems();
            auto expected = original.effectiveMemberSystems();
            if (members.front() != expected.front()) {
                std::reverse(members.begin(), members.end());
            }
            EXPECT_EQ(members, expected);
        }
    }
}
