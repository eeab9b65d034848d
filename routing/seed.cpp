#include "seed.hpp"
#include <stdexcept>

namespace {
struct SeedPoint { const char *id; double lat, lng; const char *label; };
struct SeedRoad { const char *u, *v; double km; };

const SeedPoint POINTS[] = {
    {"A", 37.7749, -122.4194, "Downtown"},
    {"B", 37.7849, -122.4094, "North Area"},
    {"C", 37.7649, -122.4294, "South Area"},
    {"D", 37.7749, -122.3994, "East Area"},
    {"E", 37.7949, -122.4194, "West Area"},
};

const SeedRoad ROADS[] = {
    {"A", "B", 2.5}, {"A", "C", 3.2}, {"A", "D", 4.1}, {"B", "D", 2.8},
    {"B", "E", 3.5}, {"C", "D", 2.1}, {"D", "E", 3.8},
};
}

void loadSeedGraph(Graph &g) {
    for (const auto &p : POINTS) g.addPoint(p.id, p.lat, p.lng);
    for (const auto &r : ROADS)
        if (!g.addConnection(r.u, r.v, r.km))
            throw std::logic_error(std::string("seed road rejected: ") + r.u + " - " + r.v);
}

std::string seedLabel(const std::string &id) {
    for (const auto &p : POINTS)
        if (id == p.id) return p.label;
    return "";
}
