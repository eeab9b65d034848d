#include "route_view.hpp"
#include <stdexcept>
using json = nlohmann::json;

static void require_route(const RouteResult &r) {
    if (!r.possible())
        throw std::logic_error(std::string("no route to describe: ") + statusName(r.status));
}

static json point_feature(const Waypoint &w, const char *title, const char *color, const char *marker) {
    return {
        {"type", "Feature"},
        {"geometry", {
            {"type", "Point"},
            {"coordinates", {w.lng, w.lat}}
        }},
        {"properties", {
            {"title", title},
            {"color", color},
            {"marker", marker}
        }}
    };
}

json waypointToJson(const Waypoint &w) {
    return {{"id", w.id}, {"lat", w.lat}, {"lng", w.lng}};
}

json routeToJson(const RouteResult &r) {
    require_route(r);
    json path = json::array();
    for (const auto &w : r.path) path.push_back(waypointToJson(w));

    json out;
    out["path"] = path;
    out["totalDistance"] = formatDistance(r.total_distance);
    out["estimatedTime"] = r.estimated_time;
    out["startPoint"] = waypointToJson(r.start_point);
    out["endPoint"] = waypointToJson(r.end_point);
    return out;
}

json routeSummary(const RouteResult &r) {
    require_route(r);
    return {
        {"from", r.start_point.id},
        {"to", r.end_point.id},
        {"distance", formatDistance(r.total_distance) + " km"},
        {"time", std::to_string(r.estimated_time) + " minutes"}
    };
}

json visualRepresentation(const RouteResult &r) {
    require_route(r);
    json coords = json::array();
    for (const auto &w : r.path) coords.push_back({w.lng, w.lat});

    json line = {
        {"type", "Feature"},
        {"geometry", {
            {"type", "LineString"},
            {"coordinates", coords}
        }},
        {"properties", {
            {"distance", formatDistance(r.total_distance)},
            {"time", r.estimated_time},
            {"color", ROUTE_COLOR},
            {"width", ROUTE_WIDTH}
        }}
    };

    return {
        {"type", "FeatureCollection"},
        {"features", {
            line,
            point_feature(r.start_point, "Start", START_COLOR, "start"),
            point_feature(r.end_point, "End", END_COLOR, "end")
        }}
    };
}
