#include <gtest/gtest.h>
#include <starmap/model/SystemCatalog.h>

#include <stdexcept>

using namespace starmap;

TEST(SystemCatalogTest, AddAndLookup) {
    SystemCatalog catalog;
    catalog.addSystem("S1", "Sol", {10, 20});

    EXPECT_TRUE(catalog.hasSystem("S1"));
    EXPECT_EQ(catalog.getPosition("S1"), Point(10, 20));
    EXPECT_EQ(catalog.getName("S1"), "Sol");
    EXPECT_EQ(catalog.systemCount(), 1u);
}

TEST(SystemCatalogTest, UnknownSystem) {
    SystemCatalog catalog;

    EXPECT_FALSE(catalog.hasSystem("S9"));
    EXPECT_FALSE(catalog.getPosition("S9").has_value());
    EXPECT_FALSE(catalog.tryGetSystem("S9").has_value());
    EXPECT_THROW(catalog.getSystem("S9"), std::out_of_range);
    EXPECT_THROW(catalog.moveSystem("S9", {0, 0}), std::out_of_range);
}

TEST(SystemCatalogTest, MoveIsLive) {
    SystemCatalog catalog;
    catalog.addSystem("S1", "Sol", {0, 0});
    const ISystemLookup& lookup = catalog;

    catalog.moveSystem("S1", {5, 5});

    EXPECT_EQ(lookup.getPosition("S1"), Point(5, 5));
}

TEST(SystemCatalogTest, FindSystemAtWithinRadius) {
    SystemCatalog catalog;
    catalog.addSystem("S1", "Sol", {0, 0});
    catalog.addSystem("S2", "Vega", {30, 0});

    EXPECT_EQ(catalog.findSystemAt({12, 0}, 20.0f), "S1");
    EXPECT_EQ(catalog.findSystemAt({19, 0}, 20.0f), "S2");
    EXPECT_FALSE(catalog.findSystemAt({15, 40}, 20.0f).has_value());
}

TEST(SystemCatalogTest, RemoveSystem) {
    SystemCatalog catalog;
    catalog.addSystem("S1", "Sol", {0, 0});

    EXPECT_TRUE(catalog.removeSystem("S1"));
    EXPECT_FALSE(catalog.removeSystem("S1"));
    EXPECT_EQ(catalog.systemCount(), 0u);
}
