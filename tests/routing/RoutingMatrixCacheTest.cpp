#include <gtest/gtest.h>
#include <routegrid/routing/RoutingMatrixCache.h>

#include <stdexcept>

using namespace routegrid;

class RoutingMatrixCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        snapshot_.viewport = {800.0f, 600.0f};
        snapshot_.nodes.push_back({1, {100.0f, 100.0f, 50.0f, 50.0f}});
    }

    GeometrySnapshot snapshot_;
    RoutingMatrixCache cache_{5};
};

TEST_F(RoutingMatrixCacheTest, StartsEmpty) {
    EXPECT_FALSE(cache_.hasCanvasMatrix());
    EXPECT_FALSE(cache_.hasRoutingMatrix());
    EXPECT_EQ(cache_.canvasComputations(), 0);
    EXPECT_EQ(cache_.routingComputations(), 0);
}

TEST_F(RoutingMatrixCacheTest, ConsecutiveReadsReturnSameInstance) {
    const GridMatrix& first = cache_.routingMatrix(snapshot_);
    const GridMatrix& second = cache_.routingMatrix(snapshot_);

    EXPECT_EQ(&first, &second);
    EXPECT_EQ(cache_.routingComputations(), 1);

    const GridMatrix& canvasA = cache_.canvasMatrix(snapshot_);
    const GridMatrix& canvasB = cache_.canvasMatrix(snapshot_);
    EXPECT_EQ(&canvasA, &canvasB);
    EXPECT_EQ(cache_.canvasComputations(), 1);
}

TEST_F(RoutingMatrixCacheTest, RoutingMatrixBuildsCanvasFirst) {
    cache_.routingMatrix(snapshot_);

    EXPECT_TRUE(cache_.hasCanvasMatrix());
    EXPECT_EQ(cache_.canvasComputations(), 1);
    EXPECT_EQ(cache_.translator().hAdjustment(), 1);
    EXPECT_FLOAT_EQ(cache_.dimensions().width, 800.0f);
}

TEST_F(RoutingMatrixCacheTest, RoutingMatrixMatchesCanvasSize) {
    const GridMatrix& routing = cache_.routingMatrix(snapshot_);
    const GridMatrix& canvas = cache_.canvasMatrix(snapshot_);

    EXPECT_EQ(routing.rows(), canvas.rows());
    EXPECT_EQ(routing.columns(), canvas.columns());
    EXPECT_EQ(canvas.blockedCount(), 0u);
    EXPECT_GT(routing.blockedCount(), 0u);
}

TEST_F(RoutingMatrixCacheTest, InvalidateClearsBothMatrices) {
    cache_.routingMatrix(snapshot_);

    cache_.invalidate();

    EXPECT_FALSE(cache_.hasCanvasMatrix());
    EXPECT_FALSE(cache_.hasRoutingMatrix());
}

TEST_F(RoutingMatrixCacheTest, OneInvalidationTriggersOneRecomputation) {
    cache_.routingMatrix(snapshot_);
    cache_.invalidate();

    cache_.routingMatrix(snapshot_);
    cache_.routingMatrix(snapshot_);
    cache_.canvasMatrix(snapshot_);

    EXPECT_EQ(cache_.routingComputations(), 2);
    EXPECT_EQ(cache_.canvasComputations(), 2);
}

TEST_F(RoutingMatrixCacheTest, WithoutInvalidateGeometryChangesAreNotSeen) {
    GridMatrix before = cache_.routingMatrix(snapshot_);

    snapshot_.nodes[0].bounds.x = 400.0f;
    GridMatrix stale = cache_.routingMatrix(snapshot_);
    EXPECT_EQ(before, stale);

    cache_.invalidate();
    GridMatrix fresh = cache_.routingMatrix(snapshot_);
    EXPECT_NE(before, fresh);
    EXPECT_TRUE(fresh.isBlocked(81, 25));
}

TEST_F(RoutingMatrixCacheTest, InvalidateRecomputesAdjustments) {
    cache_.canvasMatrix(snapshot_);
    EXPECT_EQ(cache_.translator().vAdjustment(), 1);

    snapshot_.nodes.push_back({2, {0.0f, -100.0f, 10.0f, 10.0f}});
    cache_.invalidate();
    cache_.canvasMatrix(snapshot_);

    EXPECT_EQ(cache_.translator().vAdjustment(), 21);
    EXPECT_EQ(cache_.canvasMatrix(snapshot_).rows(), 140);
}

TEST(RoutingMatrixCacheConstructionTest, NonPositiveScalingFactorThrows) {
    EXPECT_THROW(RoutingMatrixCache(0), std::invalid_argument);
}
