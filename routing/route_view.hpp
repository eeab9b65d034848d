#pragma once
#include "algorithms.hpp"
#include "nlohmann/json.hpp"

// Marker and line colors used on the map.
constexpr const char *ROUTE_COLOR = "#007bff";
constexpr const char *START_COLOR = "#28a745";
constexpr const char *END_COLOR = "#dc3545";
constexpr int ROUTE_WIDTH = 3;

nlohmann::json waypointToJson(const Waypoint &w);

// {path, totalDistance, estimatedTime, startPoint, endPoint}
nlohmann::json routeToJson(const RouteResult &r);

// {from, to, distance: "<d> km", time: "<t> minutes"}
nlohmann::json routeSummary(const RouteResult &r);

// GeoJSON FeatureCollection: the route as a LineString plus start and end
// Point features. Coordinates are [lng, lat].
nlohmann::json visualRepresentation(const RouteResult &r);
