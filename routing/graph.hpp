#pragma once
#include <memory>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "nlohmann/json.hpp"

struct Waypoint {
    std::string id;
    double lat, lng;
};

// One entry of an adjacency list: the far end of a connection and its length (km).
struct Neighbor {
    std::string id;
    double distance;
};

// Immutable version of the road network. Every connection is stored in the
// adjacency lists of both endpoints, in insertion order.
struct GraphData {
    std::map<std::string, Waypoint> nodes;
    std::unordered_map<std::string, std::vector<Neighbor>> adj;
    size_t connections = 0;

    const Waypoint *find(const std::string &id) const;
    const std::vector<Neighbor> &neighborsOf(const std::string &id) const;
};

class Graph {
public:
    Graph();

    bool addPoint(const std::string &id, double lat, double lng);
    bool addConnection(const std::string &id1, const std::string &id2, double distance);

    std::optional<Waypoint> getPoint(const std::string &id) const;
    std::vector<Waypoint> listPoints() const;
    std::vector<Neighbor> neighbors(const std::string &id) const;
    bool contains(const std::string &id) const;
    size_t size() const;
    size_t connectionCount() const;

    // Replaces the whole network; throws std::invalid_argument on a point
    // with an empty or repeated id, or an edge with a missing endpoint, a
    // self-loop or a non-positive length. The old network is kept on failure.
    void loadFromJson(const nlohmann::json &j);

    // Writers publish a fresh copy, so a snapshot never changes under a reader.
    std::shared_ptr<const GraphData> snapshot() const;

private:
    mutable std::mutex mtx;
    std::shared_ptr<const GraphData> data;
};
