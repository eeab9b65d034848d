#pragma once
#include "graph.hpp"
#include <string>
#include <vector>

// Average speed used for travel time estimates.
constexpr double AVERAGE_SPEED_KMH = 40.0;

enum class RouteStatus {
    Ok,
    UnknownPoint,  // start or end id is not in the graph
    NotFound       // both exist but nothing connects them
};

struct RouteResult {
    RouteStatus status;
    std::vector<Waypoint> path;
    double total_distance;  // km
    long estimated_time;    // minutes
    Waypoint start_point;
    Waypoint end_point;

    bool possible() const { return status == RouteStatus::Ok; }
};

RouteResult findShortestPath(const Graph &g, const std::string &start_id, const std::string &end_id);
RouteResult findShortestPath(const GraphData &g, const std::string &start_id, const std::string &end_id);

long estimateTravelMinutes(double distance_km);

// Two decimals, e.g. 6 -> "6.00".
std::string formatDistance(double distance_km);

const char *statusName(RouteStatus s);
