#include <gtest/gtest.h>
#include <routegrid/core/Types.h>

using namespace routegrid;

TEST(TypesTest, RectEdges) {
    Rect r{10.0f, 20.0f, 30.0f, 40.0f};

    EXPECT_FLOAT_EQ(r.left(), 10.0f);
    EXPECT_FLOAT_EQ(r.top(), 20.0f);
    EXPECT_FLOAT_EQ(r.right(), 40.0f);
    EXPECT_FLOAT_EQ(r.bottom(), 60.0f);
}

TEST(TypesTest, RectFromPointHasNoSize) {
    Rect r = Rect::fromPoint({-3.5f, 7.0f});

    EXPECT_FLOAT_EQ(r.x, -3.5f);
    EXPECT_FLOAT_EQ(r.y, 7.0f);
    EXPECT_FLOAT_EQ(r.width, 0.0f);
    EXPECT_FLOAT_EQ(r.height, 0.0f);
}

TEST(TypesTest, GridPointFromPixelFloorRoundsTowardNegativeInfinity) {
    EXPECT_EQ(GridPoint::fromPixelFloor({12.0f, 4.9f}, 5.0f), GridPoint(2, 0));
    EXPECT_EQ(GridPoint::fromPixelFloor({-1.0f, -5.0f}, 5.0f), GridPoint(-1, -1));
    EXPECT_EQ(GridPoint::fromPixelFloor({-5.1f, 0.0f}, 5.0f), GridPoint(-2, 0));
}

TEST(TypesTest, GridPointToPixel) {
    Point p = GridPoint(3, -2).toPixel(5.0f);

    EXPECT_FLOAT_EQ(p.x, 15.0f);
    EXPECT_FLOAT_EQ(p.y, -10.0f);
}
