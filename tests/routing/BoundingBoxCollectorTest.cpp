#include <gtest/gtest.h>
#include <routegrid/routing/BoundingBoxCollector.h>

using namespace routegrid;

namespace {

GeometrySnapshot makeSnapshot() {
    GeometrySnapshot snapshot;
    snapshot.viewport = {800.0f, 600.0f};
    snapshot.nodes.push_back({1, {100.0f, 100.0f, 50.0f, 50.0f}});
    snapshot.nodes.push_back({2, {300.0f, 80.0f, 60.0f, 40.0f}});

    LinkGeometry connected;
    connected.id = 10;
    connected.sourcePort = Rect{150.0f, 120.0f, 8.0f, 8.0f};
    connected.targetPort = Rect{292.0f, 96.0f, 8.0f, 8.0f};
    connected.points = {{154.0f, 124.0f}, {296.0f, 100.0f}};
    snapshot.links.push_back(connected);

    LinkGeometry dangling;
    dangling.id = 11;
    dangling.sourcePort = Rect{150.0f, 140.0f, 8.0f, 8.0f};
    dangling.points = {{154.0f, 144.0f}, {400.0f, 400.0f}};
    snapshot.links.push_back(dangling);

    return snapshot;
}

}  // namespace

TEST(BoundingBoxCollectorTest, CollectsEveryNode) {
    auto nodes = BoundingBoxCollector::collectNodes(makeSnapshot());

    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(nodes[0], Rect(100.0f, 100.0f, 50.0f, 50.0f));
    EXPECT_EQ(nodes[1], Rect(300.0f, 80.0f, 60.0f, 40.0f));
}

TEST(BoundingBoxCollectorTest, SkipsAbsentPorts) {
    auto ports = BoundingBoxCollector::collectPorts(makeSnapshot());

    ASSERT_EQ(ports.size(), 3u);
    EXPECT_EQ(ports[2], Rect(150.0f, 140.0f, 8.0f, 8.0f));
}

TEST(BoundingBoxCollectorTest, WaypointsHaveZeroSize) {
    auto points = BoundingBoxCollector::collectWaypoints(makeSnapshot());

    ASSERT_EQ(points.size(), 4u);
    for (const auto& box : points) {
        EXPECT_FLOAT_EQ(box.width, 0.0f);
        EXPECT_FLOAT_EQ(box.height, 0.0f);
    }
    EXPECT_EQ(points[3], Rect(400.0f, 400.0f, 0.0f, 0.0f));
}

TEST(BoundingBoxCollectorTest, AllKeepsNodesThenPortsThenWaypoints) {
    CollectedBoxes boxes = BoundingBoxCollector::collect(makeSnapshot());
    auto all = boxes.all();

    ASSERT_EQ(all.size(), 9u);
    EXPECT_EQ(all[0], boxes.nodes[0]);
    EXPECT_EQ(all[2], boxes.ports[0]);
    EXPECT_EQ(all[5], boxes.waypoints[0]);
}

TEST(BoundingBoxCollectorTest, EmptySnapshotGivesNoBoxes) {
    GeometrySnapshot snapshot;
    snapshot.viewport = {800.0f, 600.0f};

    EXPECT_TRUE(BoundingBoxCollector::collect(snapshot).empty());
}
