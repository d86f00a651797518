#include <gtest/gtest.h>
#include <starmap/config/EditorOptions.h>

#include <cstdio>
#include <filesystem>

using namespace starmap;

TEST(EditorOptionsTest, Defaults) {
    EditorOptions options = EditorOptions::createDefault();

    EXPECT_FLOAT_EQ(options.systemSnapRadius, 20.0f);
    EXPECT_FLOAT_EQ(options.routeHitThreshold, 6.0f);
    EXPECT_FLOAT_EQ(options.shapePointHitRadius, 8.0f);
    EXPECT_EQ(options.decimateTarget, 20u);
    EXPECT_EQ(options.smoothingWindow, 3);
    EXPECT_EQ(options.splineSamples, geometry::DEFAULT_SPLINE_SAMPLES);
    EXPECT_EQ(options.defaultRouteClass, RouteAttributes::DEFAULT_CLASS);
}

TEST(EditorOptionsTest, SanitizeClampsRanges) {
    EditorOptions options;
    options.systemSnapRadius = -5.0f;
    options.decimateTarget = 0;
    options.smoothingWindow = -1;
    options.splineSamples = 1000;
    options.defaultRouteClass = 0;

    options.sanitize();

    EXPECT_FLOAT_EQ(options.systemSnapRadius, 0.0f);
    EXPECT_EQ(options.decimateTarget, 2u);
    EXPECT_EQ(options.smoothingWindow, 1);
    EXPECT_EQ(options.splineSamples, 64);
    EXPECT_EQ(options.defaultRouteClass, RouteAttributes::MIN_CLASS);
}

TEST(EditorOptionsTest, JsonRoundTrip) {
    EditorOptions options;
    options.systemSnapRadius = 12.5f;
    options.decimateTarget = 40;
    options.splineSamples = 24;
    options.defaultRouteClass = 2;

    EditorOptions parsed;
    ASSERT_TRUE(EditorOptions::fromJson(options.toJson(), parsed));

    EXPECT_FLOAT_EQ(parsed.systemSnapRadius, 12.5f);
    EXPECT_EQ(parsed.decimateTarget, 40u);
    EXPECT_EQ(parsed.splineSamples, 24);
    EXPECT_EQ(parsed.defaultRouteClass, 2);
}

TEST(EditorOptionsTest, PartialJsonKeepsDefaults) {
    EditorOptions parsed;
    ASSERT_TRUE(EditorOptions::fromJson(R"({"reshape": {"smoothingWindow": 5}, "colour": "red"})", parsed));

    EXPECT_EQ(parsed.smoothingWindow, 5);
    EXPECT_EQ(parsed.decimateTarget, 20u);
    EXPECT_FLOAT_EQ(parsed.routeHitThreshold, 6.0f);
}

TEST(EditorOptionsTest, InvalidValuesClamped) {
    EditorOptions parsed;
    ASSERT_TRUE(EditorOptions::fromJson(R"({"reshape": {"decimateTarget": -3}, "defaultRouteClass": 11})", parsed));

    EXPECT_EQ(parsed.decimateTarget, 2u);
    EXPECT_EQ(parsed.defaultRouteClass, RouteAttributes::MAX_CLASS);
}

TEST(EditorOptionsTest, MalformedJsonLeavesOptionsUntouched) {
    EditorOptions parsed;
    parsed.systemSnapRadius = 33.0f;

    EXPECT_FALSE(EditorOptions::fromJson("{ broken", parsed));
    EXPECT_FALSE(EditorOptions::fromJson(R"({"splineSamples": "many"})", parsed));

    EXPECT_FLOAT_EQ(parsed.systemSnapRadius, 33.0f);
    EXPECT_EQ(parsed.splineSamples, geometry::DEFAULT_SPLINE_SAMPLES);
}

TEST(EditorOptionsTest, FileRoundTrip) {
    auto path = (std::filesystem::temp_directory_path() / "starmap_options_test.json").string();
    EditorOptions options;
    options.shapePointHitRadius = 4.0f;

    ASSERT_TRUE(EditorOptions::saveToFile(options, path));
    EditorOptions loaded;
    ASSERT_TRUE(EditorOptions::loadFromFile(path, loaded));
    std::remove(path.c_str());

    EXPECT_FLOAT_EQ(loaded.shapePointHitRadius, 4.0f);
    EXPECT_FALSE(EditorOptions::loadFromFile(path, loaded));
}
