#include <routegrid/routegrid.h>
#include <routegrid/common/Logger.h>
#include <exception>
#include <iostream>
#include <string>

// Prints the routing matrix for a geometry snapshot.
//
// Usage: matrix_dump [snapshot.json] [scalingFactor]
// Without arguments a small built-in diagram is used.
int main(int argc, char** argv) {
    using namespace routegrid;

    Logger::initialize();

    GeometrySnapshot snapshot;
    if (argc > 1) {
        if (!GeometrySerializer::loadFromFile(snapshot, argv[1])) {
            std::cerr << "Failed to load " << argv[1] << "\n";
            return 1;
        }
    } else {
        snapshot.viewport = {120.0f, 60.0f};
        snapshot.nodes.push_back({1, {10.0f, 10.0f, 20.0f, 15.0f}});
        snapshot.nodes.push_back({2, {-20.0f, 35.0f, 15.0f, 10.0f}});

        LinkGeometry link;
        link.id = 1;
        link.sourcePort = Rect{30.0f, 15.0f, 5.0f, 5.0f};
        link.targetPort = Rect{-10.0f, 30.0f, 5.0f, 5.0f};
        link.points = {{32.0f, 17.0f}, {-8.0f, 32.0f}};
        snapshot.links.push_back(link);
    }

    RoutingOptions options;
    try {
        if (argc > 2) {
            options.scalingFactor = std::stoi(argv[2]);
        }
        SmartRoutingEngine engine(options);

        const GridMatrix& matrix = engine.routingMatrix(snapshot);
        const Dimensions& dims = engine.cache().dimensions();

        std::cout << "routegrid " << versionString() << "\n"
                  << "size " << dims.width << "x" << dims.height
                  << ", adjustment " << dims.hAdjustment << "," << dims.vAdjustment
                  << ", matrix " << matrix.rows() << "x" << matrix.columns()
                  << ", blocked " << matrix.blockedCount() << "\n"
                  << matrix.toString();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
