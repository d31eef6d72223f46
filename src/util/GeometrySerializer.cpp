#include "routegrid/util/GeometrySerializer.h"
#include "routegrid/common/Logger.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace routegrid {

namespace {

json rectToJson(const Rect& r) {
    return {{"x", r.x}, {"y", r.y}, {"width", r.width}, {"height", r.height}};
}

Rect rectFromJson(const json& j) {
    return {j.at("x").get<float>(), j.at("y").get<float>(),
            j.value("width", 0.0f), j.value("height", 0.0f)};
}

}  // namespace

std::string GeometrySerializer::toJson(const GeometrySnapshot& snapshot) {
    json j;
    j["version"] = 1;
    j["viewport"] = {{"width", snapshot.viewport.width}, {"height", snapshot.viewport.height}};

    json nodes = json::array();
    for (const auto& node : snapshot.nodes) {
        json nodeJson = rectToJson(node.bounds);
        nodeJson["id"] = node.id;
        nodes.push_back(nodeJson);
    }
    j["nodes"] = nodes;

    json links = json::array();
    for (const auto& link : snapshot.links) {
        json linkJson;
        linkJson["id"] = link.id;
        linkJson["sourcePort"] = link.sourcePort ? rectToJson(*link.sourcePort) : json(nullptr);
        linkJson["targetPort"] = link.targetPort ? rectToJson(*link.targetPort) : json(nullptr);

        json points = json::array();
        for (const auto& p : link.points) {
            points.push_back({{"x", p.x}, {"y", p.y}});
        }
        linkJson["points"] = points;
        links.push_back(linkJson);
    }
    j["links"] = links;

    return j.dump(2);
}

GeometrySnapshot GeometrySerializer::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);
        GeometrySnapshot snapshot;

        if (j.contains("viewport")) {
            snapshot.viewport.width = j["viewport"].value("width", 0.0f);
            snapshot.viewport.height = j["viewport"].value("height", 0.0f);
        }

        if (j.contains("nodes")) {
            for (const auto& nodeJson : j["nodes"]) {
                NodeGeometry node;
                node.id = nodeJson.value("id", INVALID_NODE);
                node.bounds = rectFromJson(nodeJson);
                snapshot.nodes.push_back(node);
            }
        }

        if (j.contains("links")) {
            for (const auto& linkJson : j["links"]) {
                LinkGeometry link;
                link.id = linkJson.value("id", INVALID_LINK);
                if (linkJson.contains("sourcePort") && !linkJson["sourcePort"].is_null()) {
                    link.sourcePort = rectFromJson(linkJson["sourcePort"]);
                }
                if (linkJson.contains("targetPort") && !linkJson["targetPort"].is_null()) {
                    link.targetPort = rectFromJson(linkJson["targetPort"]);
                }
                if (linkJson.contains("points")) {
                    for (const auto& p : linkJson["points"]) {
                        link.points.push_back({p.at("x").get<float>(), p.at("y").get<float>()});
                    }
                }
                snapshot.links.push_back(std::move(link));
            }
        }

        return snapshot;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse GeometrySnapshot JSON: ") + e.what());
    }
}

bool GeometrySerializer::saveToFile(const GeometrySnapshot& snapshot, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open {} for writing", path);
        return false;
    }
    file << toJson(snapshot);
    return static_cast<bool>(file);
}

bool GeometrySerializer::loadFromFile(GeometrySnapshot& snapshot, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open {} for reading", path);
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        snapshot = fromJson(buffer.str());
    } catch (const std::runtime_error& e) {
        LOG_ERROR("{}: {}", path, e.what());
        return false;
    }
    return true;
}

}  // namespace routegrid
