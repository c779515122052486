#include <gtest/gtest.h>
#include "Vector2D.h"

TEST(Vector2DTest, Arithmetic) {
    Vector2D a(1.0, 2.0);
    Vector2D b(3.0, -4.0);
    EXPECT_EQ(a + b, Vector2D(4.0, -2.0));
    EXPECT_EQ(a - b, Vector2D(-2.0, 6.0));
    EXPECT_EQ(a * 2.0, Vector2D(2.0, 4.0));
    EXPECT_EQ(0.5 * b, Vector2D(1.5, -2.0));
    // operands are unchanged
    EXPECT_EQ(a, Vector2D(1.0, 2.0));
}

TEST(Vector2DTest, Magnitude) {
    EXPECT_DOUBLE_EQ(Vector2D(3.0, 4.0).magnitude(), 5.0);
    EXPECT_DOUBLE_EQ(Vector2D().magnitude(), 0.0);
}

TEST(Vector2DTest, NormalizeGivesUnitVector) {
    Vector2D n = Vector2D(0.0, -7.5).normalize();
    EXPECT_DOUBLE_EQ(n.x, 0.0);
    EXPECT_DOUBLE_EQ(n.y, -1.0);
    EXPECT_NEAR(Vector2D(2.0, 3.0).normalize().magnitude(), 1.0, 1e-12);
}

TEST(Vector2DTest, NormalizeZeroIsZero) {
    Vector2D n = Vector2D().normalize();
    EXPECT_TRUE(n.isZero());
}

TEST(Vector2DTest, DivideByZeroIsZero) {
    Vector2D v = Vector2D(5.0, 1.0) / 0.0;
    EXPECT_TRUE(v.isZero());
    EXPECT_EQ(Vector2D(5.0, 1.0) / 2.0, Vector2D(2.5, 0.5));
}
