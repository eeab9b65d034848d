#include "graph.hpp"
#include <cmath>
#include <stdexcept>
using json = nlohmann::json;

static bool valid_connection(const GraphData &d, const std::string &u, const std::string &v,
                             double distance) {
    if (u == v) return false;
    if (!d.nodes.count(u) || !d.nodes.count(v)) return false;
    return std::isfinite(distance) && distance > 0;
}

static void link(GraphData &d, const std::string &u, const std::string &v, double distance) {
    d.adj[u].push_back({v, distance});
    d.adj[v].push_back({u, distance});
    d.connections++;
}

const Waypoint *GraphData::find(const std::string &id) const {
    auto it = nodes.find(id);
    return it == nodes.end() ? nullptr : &it->second;
}

const std::vector<Neighbor> &GraphData::neighborsOf(const std::string &id) const {
    static const std::vector<Neighbor> none;
    auto it = adj.find(id);
    return it == adj.end() ? none : it->second;
}

Graph::Graph() : data(std::make_shared<GraphData>()) {}

std::shared_ptr<const GraphData> Graph::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx);
    return data;
}

bool Graph::addPoint(const std::string &id, double lat, double lng) {
    std::lock_guard<std::mutex> lock(mtx);
    if (id.empty() || data->nodes.count(id)) return false;

    auto next = std::make_shared<GraphData>(*data);
    next->nodes[id] = Waypoint{id, lat, lng};
    next->adj[id];
    data = std::move(next);
    return true;
}

bool Graph::addConnection(const std::string &id1, const std::string &id2, double distance) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!valid_connection(*data, id1, id2, distance)) return false;

    auto next = std::make_shared<GraphData>(*data);
    link(*next, id1, id2, distance);
    data = std::move(next);
    return true;
}

std::optional<Waypoint> Graph::getPoint(const std::string &id) const {
    auto d = snapshot();
    const Waypoint *w = d->find(id);
    if (!w) return std::nullopt;
    return *w;
}

std::vector<Waypoint> Graph::listPoints() const {
    auto d = snapshot();
    std::vector<Waypoint> out;
    out.reserve(d->nodes.size());
    for (const auto &[id, w] : d->nodes) out.push_back(w);
    return out;
}

std::vector<Neighbor> Graph::neighbors(const std::string &id) const {
    return snapshot()->neighborsOf(id);
}

bool Graph::contains(const std::string &id) const {
    return snapshot()->find(id) != nullptr;
}

size_t Graph::size() const {
    return snapshot()->nodes.size();
}

size_t Graph::connectionCount() const {
    return snapshot()->connections;
}

void Graph::loadFromJson(const json &j) {
    auto next = std::make_shared<GraphData>();

    for (const auto &jn : j.at("nodes")) {
        Waypoint w;
        w.id = jn.at("id").get<std::string>();
        w.lat = jn.value("lat", 0.0);
        w.lng = jn.value("lng", 0.0);
        if (w.id.empty())
            throw std::invalid_argument("point with empty id");
        if (next->nodes.count(w.id))
            throw std::invalid_argument("duplicate point " + w.id);
        next->nodes[w.id] = w;
        next->adj[w.id];
    }

    if (j.contains("edges")) {
        for (const auto &je : j["edges"]) {
            std::string u = je.at("u");
            std::string v = je.at("v");
            double length = je.at("length");
            if (!valid_connection(*next, u, v, length))
                throw std::invalid_argument("invalid connection " + u + " - " + v);
            link(*next, u, v, length);
        }
    }

    std::lock_guard<std::mutex> lock(mtx);
    data = std::move(next);
}
