#include <gtest/gtest.h>
#include "DensityField.h"

TEST(DensityFieldTest, DefaultBand) {
    DensityField f;
    EXPECT_DOUBLE_EQ(f.startX(), 400.0);
    EXPECT_DOUBLE_EQ(f.width(), 100.0);
    EXPECT_DOUBLE_EQ(f.endX(), 500.0);
}

TEST(DensityFieldTest, BoundsAreExclusive) {
    DensityField f;
    EXPECT_FALSE(f.isDense(Vector2D(400.0, 300.0)));
    EXPECT_FALSE(f.isDense(Vector2D(500.0, 300.0)));
    EXPECT_TRUE(f.isDense(Vector2D(400.0001, 300.0)));
    EXPECT_TRUE(f.isDense(Vector2D(499.9999, 300.0)));
    EXPECT_FALSE(f.isDense(Vector2D(10.0, 300.0)));
    EXPECT_FALSE(f.isDense(Vector2D(849.0, 300.0)));
}

TEST(DensityFieldTest, YIsUnconstrained) {
    DensityField f(100.0, 50.0);
    EXPECT_TRUE(f.isDense(Vector2D(120.0, -1e6)));
    EXPECT_TRUE(f.isDense(Vector2D(120.0, 1e6)));
    EXPECT_FALSE(f.isDense(Vector2D(160.0, 0.0)));
}
