#include <gtest/gtest.h>
#include <starmap/model/MapDocument.h>

#include <stdexcept>

using namespace starmap;

class MapDocumentTest : public ::testing::Test {
protected:
    void SetUp() override {
        doc_.systems().addSystem("S1", "Sol", {0, 0});
        doc_.systems().addSystem("S2", "Vega", {100, 0});
        doc_.systems().addSystem("S3", "Rigel", {200, 0});
        doc_.systems().addSystem("S4", "Deneb", {300, 0});
    }

    RouteId create(const SystemId& a, const SystemId& b) {
        auto result = doc_.createRoute(a, b);
        EXPECT_TRUE(result.success()) << result.reason;
        return result.value.value_or("");
    }

    MapDocument doc_;
};

// ============== Route Lifecycle Tests ==============

TEST_F(MapDocumentTest, CreateRouteAssignsIdAndName) {
    RouteId id = create("S1", "S2");

    EXPECT_EQ(id, "route-000001");
    EXPECT_EQ(doc_.getRoute(id).name(), "Sol - Vega");
    EXPECT_EQ(doc_.routeCount(), 1u);
}

TEST_F(MapDocumentTest, DuplicateRouteRejectedWithoutMutation) {
    create("S1", "S2");
    uint64_t version = doc_.version();

    auto result = doc_.createRoute("S2", "S1");

    EXPECT_EQ(result.error, RouteEditError::DuplicateRoute);
    EXPECT_EQ(doc_.routeCount(), 1u);
    EXPECT_EQ(doc_.version(), version);

    // Rejected attempts do not consume IDs
    EXPECT_EQ(create("S2", "S3"), "route-000002");
}

TEST_F(MapDocumentTest, VersionBumpsOnMutation) {
    uint64_t before = doc_.version();
    RouteId id = create("S1", "S2");
    EXPECT_GT(doc_.version(), before);

    before = doc_.version();
    ASSERT_TRUE(doc_.renameRoute(id, "Core Run").success());
    EXPECT_GT(doc_.version(), before);
    EXPECT_EQ(doc_.getRoute(id).name(), "Core Run");
}

TEST_F(MapDocumentTest, UnknownRouteOperations) {
    EXPECT_EQ(doc_.renameRoute("nope", "x").error, RouteEditError::RouteNotFound);
    EXPECT_EQ(doc_.deleteRoute("nope").error, RouteEditError::RouteNotFound);
    EXPECT_EQ(doc_.splitRoute("nope", "S1").error, RouteEditError::RouteNotFound);
    EXPECT_EQ(doc_.tryGetRoute("nope"), nullptr);
    EXPECT_THROW(doc_.getRoute("nope"), std::out_of_range);
}

TEST_F(MapDocumentTest, SetAttributesClampsClass) {
    RouteId id = create("S1", "S2");
    RouteAttributes attributes;
    attributes.routeClass = 8;
    attributes.travelType = TravelType::ExpressLane;
    attributes.hazards = {Hazard::Nebula};

    ASSERT_TRUE(doc_.setRouteAttributes(id, attributes).success());

    const auto& stored = doc_.getRoute(id).attributes();
    EXPECT_EQ(stored.routeClass, 5);
    EXPECT_EQ(stored.travelType, TravelType::ExpressLane);
    EXPECT_TRUE(stored.hasHazard(Hazard::Nebula));
}

TEST_F(MapDocumentTest, UpdateRouteRejectsUnknownSystem) {
    RouteId id = create("S1", "S2");
    Route changed = doc_.getRoute(id);
    changed.setMembers({"S1", "S9", "S2"});

    auto result = doc_.updateRoute(changed);

    EXPECT_EQ(result.error, RouteEditError::UnknownSystem);
    EXPECT_FALSE(doc_.getRoute(id).isChain());
}

// ============== Group Pruning Tests ==============

TEST_F(MapDocumentTest, DeletingRoutesPrunesAndDeletesGroup) {
    RouteId r1 = create("S1", "S2");
    RouteId r2 = create("S2", "S3");
    auto group = doc_.createGroup("Trade Lane", {r1, r2});
    ASSERT_TRUE(group.success());
    GroupId groupId = *group.value;

    ASSERT_TRUE(doc_.deleteRoute(r1).success());
    ASSERT_TRUE(doc_.groups().hasGroup(groupId));
    EXPECT_EQ(doc_.groups().getGroup(groupId).routeIds, (std::vector<RouteId>{r2}));

    auto deleted = doc_.deleteRoute(r2);
    ASSERT_TRUE(deleted.success());
    EXPECT_EQ(*deleted.value, (std::vector<GroupId>{groupId}));
    EXPECT_FALSE(doc_.groups().tryGetGroup(groupId).has_value());
}

TEST_F(MapDocumentTest, CreateGroupRejectsUnknownRoute) {
    EXPECT_EQ(doc_.createGroup("Ghost", {"route-999999"}).error, RouteEditError::RouteNotFound);
    EXPECT_EQ(doc_.createGroup("Empty", {}).error, RouteEditError::EmptySelection);
    EXPECT_EQ(doc_.groups().groupCount(), 0u);
}

// ============== Split / Merge Tests ==============

TEST_F(MapDocumentTest, SplitReplacesRouteInGroups) {
    Route chain("route-000010", "Long Haul", std::vector<SystemId>{"S1", "S2", "S3", "S4"});
    doc_.addRoute(chain);
    auto group = doc_.createGroup("Lane", {"route-000010"});
    ASSERT_TRUE(group.success());

    auto split = doc_.splitRoute("route-000010", "S3");

    ASSERT_TRUE(split.success()) << split.reason;
    auto [first, second] = *split.value;
    EXPECT_FALSE(doc_.hasRoute("route-000010"));
    EXPECT_EQ(doc_.getRoute(first).effectiveMemberSystems(), (std::vector<SystemId>{"S1", "S2", "S3"}));
    EXPECT_EQ(doc_.getRoute(second).effectiveMemberSystems(), (std::vector<SystemId>{"S3", "S4"}));
    EXPECT_EQ(doc_.groups().getGroup(*group.value).routeIds, (std::vector<RouteId>{first, second}));

    // Loaded IDs advance the generator
    EXPECT_EQ(first, "route-000011");
}

TEST_F(MapDocumentTest, MergeReplacesBothRoutes) {
    RouteId r1 = create("S1", "S2");
    RouteId r2 = create("S2", "S3");
    auto group = doc_.createGroup("Lane", {r1, r2});
    ASSERT_TRUE(group.success());

    auto merged = doc_.mergeRoutes(r1, r2);

    ASSERT_TRUE(merged.success()) << merged.reason;
    EXPECT_EQ(doc_.routeCount(), 1u);
    EXPECT_EQ(doc_.getRoute(*merged.value).effectiveMemberSystems(),
              (std::vector<SystemId>{"S1", "S2", "S3"}));
    EXPECT_EQ(doc_.groups().getGroup(*group.value).routeIds, (std::vector<RouteId>{*merged.value}));
}

TEST_F(MapDocumentTest, FailedMergeLeavesDocumentUntouched) {
    RouteId r1 = create("S1", "S2");
    RouteId r2 = create("S3", "S4");
    uint64_t version = doc_.version();

    auto merged = doc_.mergeRoutes(r1, r2);

    EXPECT_EQ(merged.error, RouteEditError::NoSharedEndpoint);
    EXPECT_TRUE(doc_.hasRoute(r1));
    EXPECT_TRUE(doc_.hasRoute(r2));
    EXPECT_EQ(doc_.version(), version);
}

// ============== Duplicate Endpoint Tests ==============

TEST_F(MapDocumentTest, MergeRejectedWhenResultDuplicatesRoute) {
    RouteId r12 = create("S1", "S2");
    RouteId r23 = create("S2", "S3");
    create("S1", "S3");
    uint64_t version = doc_.version();

    auto merged = doc_.mergeRoutes(r12, r23);

    EXPECT_EQ(merged.error, RouteEditError::DuplicateRoute);
    EXPECT_TRUE(doc_.hasRoute(r12));
    EXPECT_TRUE(doc_.hasRoute(r23));
    EXPECT_EQ(doc_.routeCount(), 3u);
    EXPECT_EQ(doc_.version(), version);
}

TEST_F(MapDocumentTest, SplitRejectedWhenPartDuplicatesRoute) {
    doc_.addRoute(Route("route-000050", "Long Haul", std::vector<SystemId>{"S1", "S2", "S3", "S4"}));
    create("S3", "S4");
    uint64_t version = doc_.version();

    auto split = doc_.splitRoute("route-000050", "S3");

    EXPECT_EQ(split.error, RouteEditError::DuplicateRoute);
    EXPECT_TRUE(doc_.hasRoute("route-000050"));
    EXPECT_EQ(doc_.routeCount(), 2u);
    EXPECT_EQ(doc_.version(), version);

    // Splitting where neither part collides still works
    EXPECT_TRUE(doc_.splitRoute("route-000050", "S2").success());
}

TEST_F(MapDocumentTest, UpdateRejectedWhenNewEndpointsDuplicateRoute) {
    RouteId r12 = create("S1", "S2");
    create("S1", "S3");

    auto extended = RouteEditor::insertSystem(doc_.getRoute(r12), "S3", 2, doc_.systems());
    ASSERT_TRUE(extended.success());
    auto result = doc_.updateRoute(*extended.value);

    EXPECT_EQ(result.error, RouteEditError::DuplicateRoute);
    EXPECT_EQ(doc_.getRoute(r12).effectiveMemberSystems(), (std::vector<SystemId>{"S1", "S2"}));

    // Interior insertion keeps the endpoints, so it is accepted
    auto interior = RouteEditor::insertSystem(doc_.getRoute(r12), "S3", 1, doc_.systems());
    ASSERT_TRUE(interior.success());
    EXPECT_TRUE(doc_.updateRoute(*interior.value).success());
    EXPECT_EQ(doc_.getRoute(r12).effectiveMemberSystems(), (std::vector<SystemId>{"S1", "S3", "S2"}));
}

// ============== System Removal Tests ==============

TEST_F(MapDocumentTest, RemoveSystemDeletesDependentRoutes) {
    RouteId r1 = create("S1", "S2");
    RouteId r2 = create("S2", "S3");
    RouteId r3 = create("S3", "S4");
    ASSERT_TRUE(doc_.createGroup("Lane", {r1, r2}).success());

    auto deleted = doc_.removeSystem("S2");

    EXPECT_EQ(deleted, (std::vector<RouteId>{r1, r2}));
    EXPECT_TRUE(doc_.hasRoute(r3));
    EXPECT_FALSE(doc_.systems().hasSystem("S2"));
    EXPECT_EQ(doc_.groups().groupCount(), 0u);
}

TEST_F(MapDocumentTest, ClearResetsEverything) {
    create("S1", "S2");
    doc_.metadata().name = "Outer Rim";

    doc_.clear();

    EXPECT_EQ(doc_.routeCount(), 0u);
    EXPECT_EQ(doc_.systems().systemCount(), 0u);
    EXPECT_EQ(doc_.metadata().name, "Unnamed Map");
}
