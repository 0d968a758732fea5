#include <gtest/gtest.h>
#include <trellis/layout/geometry_changed.h>

using namespace trellis::layout;

TEST(GeometryChangedTest, DefaultIsAllClear) {
    GeometryChanged g;
    EXPECT_TRUE(g.none());
    EXPECT_FALSE(g.any());
    EXPECT_EQ(g.bits(), GeometryFlag::None);
    EXPECT_EQ(g.to_string(), "none");
}

TEST(GeometryChangedTest, SetAndClearSingleFlag) {
    GeometryChanged g;
    g.set(GeometryFlag::Width, true);
    EXPECT_TRUE(g.test(GeometryFlag::Width));
    EXPECT_FALSE(g.test(GeometryFlag::Height));
    EXPECT_FALSE(g.test(GeometryFlag::PosX));
    EXPECT_FALSE(g.test(GeometryFlag::PosY));

    g.set(GeometryFlag::Width, false);
    EXPECT_TRUE(g.none());
}

TEST(GeometryChangedTest, ClearingOneLeavesOthersSet) {
    GeometryChanged g;
    g.set(GeometryFlag::PosX, true);
    g.set(GeometryFlag::PosY, true);
    g.set(GeometryFlag::Height, true);

    g.set(GeometryFlag::PosY, false);

    EXPECT_TRUE(g.test(GeometryFlag::PosX));
    EXPECT_FALSE(g.test(GeometryFlag::PosY));
    EXPECT_TRUE(g.test(GeometryFlag::Height));
    EXPECT_EQ(g.to_string(), "posx|height");
}

TEST(GeometryChangedTest, CombinedMaskSetsEveryBit) {
    GeometryChanged g;
    g.set(GeometryFlag::PosX | GeometryFlag::Width, true);
    EXPECT_TRUE(g.contains(GeometryFlag::PosX | GeometryFlag::Width));
    EXPECT_FALSE(g.contains(GeometryFlag::All));
    EXPECT_TRUE(g.test(GeometryFlag::All));

    g.set(GeometryFlag::All, true);
    EXPECT_TRUE(g.contains(GeometryFlag::All));
    EXPECT_EQ(g.to_string(), "posx|posy|width|height");

    g.clear();
    EXPECT_EQ(g, GeometryChanged{});
}

TEST(GeometryChangedTest, SettingTwiceIsIdempotent) {
    GeometryChanged g;
    g.set(GeometryFlag::Height, true);
    g.set(GeometryFlag::Height, true);
    EXPECT_EQ(g, GeometryChanged(GeometryFlag::Height));
}
