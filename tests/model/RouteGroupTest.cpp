#include <gtest/gtest.h>
#include <starmap/model/RouteGroup.h>

#include <stdexcept>

using namespace starmap;

class RouteGroupTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto result = groups_.createGroup("G1", "Spice Lane", {"R1", "R2"});
        ASSERT_TRUE(result.success());
    }

    RouteGroups groups_;
};

TEST_F(RouteGroupTest, CreateRejectsEmptySelection) {
    auto result = groups_.createGroup("G2", "Empty", {});

    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.error, RouteEditError::EmptySelection);
    EXPECT_FALSE(groups_.hasGroup("G2"));
}

TEST_F(RouteGroupTest, CreateCollapsesDuplicates) {
    auto result = groups_.createGroup("G2", "Dupes", {"R3", "R4", "R3"});

    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.value->routeIds, (std::vector<RouteId>{"R3", "R4"}));
}

TEST_F(RouteGroupTest, BlankNameGetsDefault) {
    auto result = groups_.createGroup("G2", "  ", {"R3"});

    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.value->name, "Group 2");
}

TEST_F(RouteGroupTest, PruneKeepsNonEmptyGroup) {
    auto pruned = RouteGroups::prune(groups_.getGroup("G1"), "R1");

    ASSERT_TRUE(pruned.has_value());
    EXPECT_EQ(pruned->routeIds, (std::vector<RouteId>{"R2"}));
}

TEST_F(RouteGroupTest, PruneSignalsDeletionWhenEmpty) {
    RouteGroup single{"G9", "Single", {"R5"}};
    EXPECT_FALSE(RouteGroups::prune(single, "R5").has_value());
}

TEST_F(RouteGroupTest, PruneRouteDeletesEmptiedGroups) {
    EXPECT_TRUE(groups_.pruneRoute("R1").empty());
    EXPECT_EQ(groups_.getGroup("G1").routeIds, (std::vector<RouteId>{"R2"}));

    auto deleted = groups_.pruneRoute("R2");

    EXPECT_EQ(deleted, (std::vector<GroupId>{"G1"}));
    EXPECT_FALSE(groups_.hasGroup("G1"));
    EXPECT_FALSE(groups_.tryGetGroup("G1").has_value());
    EXPECT_THROW(groups_.getGroup("G1"), std::out_of_range);
}

TEST_F(RouteGroupTest, ReplaceRouteKeepsPosition) {
    groups_.replaceRoute("R1", {"R1a", "R1b"});

    EXPECT_EQ(groups_.getGroup("G1").routeIds, (std::vector<RouteId>{"R1a", "R1b", "R2"}));
}

TEST_F(RouteGroupTest, ReplaceRouteDoesNotDuplicate) {
    // Merge of R1 and R2 into M: both are replaced by a single entry
    groups_.replaceRoute("R1", {"M"});
    groups_.replaceRoute("R2", {"M"});

    EXPECT_EQ(groups_.getGroup("G1").routeIds, (std::vector<RouteId>{"M"}));
}

TEST_F(RouteGroupTest, GroupsContaining) {
    ASSERT_TRUE(groups_.createGroup("G2", "Other", {"R2", "R3"}).success());

    EXPECT_EQ(groups_.groupsContaining("R2"), (std::vector<GroupId>{"G1", "G2"}));
    EXPECT_EQ(groups_.groupsContaining("R3"), (std::vector<GroupId>{"G2"}));
    EXPECT_TRUE(groups_.groupsContaining("R7").empty());
}

TEST_F(RouteGroupTest, Rename) {
    EXPECT_TRUE(groups_.rename("G1", "Hydian Way"));
    EXPECT_EQ(groups_.getGroup("G1").name, "Hydian Way");
    EXPECT_FALSE(groups_.rename("G9", "Nothing"));
}
