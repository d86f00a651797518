#include <gtest/gtest.h>
#include <starmap/calc/TravelCalculator.h>
#include <starmap/model/Route.h>
#include <starmap/model/SystemCatalog.h>

using namespace starmap;

// ============== Modifier Tests ==============

TEST(TravelCalculatorTest, RouteClassModifiers) {
    EXPECT_FLOAT_EQ(TravelCalculator::routeClassModifier(1), 1.5f);
    EXPECT_FLOAT_EQ(TravelCalculator::routeClassModifier(3), 1.0f);
    EXPECT_FLOAT_EQ(TravelCalculator::routeClassModifier(5), 0.6f);
    EXPECT_FLOAT_EQ(TravelCalculator::routeClassModifier(9), 1.0f);
}

TEST(TravelCalculatorTest, SpeedFactorMultipliesModifiers) {
    RouteAttributes attributes;
    attributes.setRouteClass(2);
    attributes.travelType = TravelType::ExpressLane;
    attributes.hazards = {Hazard::Nebula, Hazard::Quasar};

    EXPECT_FLOAT_EQ(TravelCalculator::speedFactor(attributes), 1.2f * 1.3f * 0.9f * 0.8f);
    EXPECT_FLOAT_EQ(TravelCalculator::speedFactor(RouteAttributes{}), 1.0f);
}

TEST(TravelCalculatorTest, TravelTimeScalesWithHyperdrive) {
    RouteAttributes attributes;

    EXPECT_FLOAT_EQ(TravelCalculator::travelTimeHours(120.0f, HyperdriveRating::X1, attributes), 120.0f);
    EXPECT_FLOAT_EQ(TravelCalculator::travelTimeHours(120.0f, HyperdriveRating::X4, attributes), 30.0f);

    attributes.travelType = TravelType::Backwater;
    EXPECT_NEAR(TravelCalculator::travelTimeHours(70.0f, HyperdriveRating::X2, attributes), 50.0f, 1e-3f);
}

TEST(TravelCalculatorTest, EstimateUsesLiveLength) {
    SystemCatalog catalog;
    catalog.addSystem("S1", "Sol", {0, 0});
    catalog.addSystem("S2", "Vega", {30, 40});
    Route route("R1", "", "S1", "S2");
    route.attributes().setRouteClass(1);

    auto estimate = TravelCalculator::estimate(route, catalog, HyperdriveRating::X2);

    EXPECT_FLOAT_EQ(estimate.lengthHsu, 50.0f);
    EXPECT_FLOAT_EQ(estimate.speedFactor, 1.5f);
    EXPECT_NEAR(estimate.hours, 50.0f / 2.0f / 1.5f, 1e-4f);

    catalog.moveSystem("S2", {60, 80});
    EXPECT_FLOAT_EQ(TravelCalculator::estimate(route, catalog, HyperdriveRating::X2).lengthHsu, 100.0f);
}

TEST(TravelCalculatorTest, RatingNames) {
    EXPECT_EQ(TravelCalculator::toString(HyperdriveRating::X1), "x1");
    EXPECT_EQ(TravelCalculator::toString(HyperdriveRating::X3), "x3");
}
