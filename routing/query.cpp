#include "query.hpp"
#include "algorithms.hpp"
#include "route_view.hpp"
#include "seed.hpp"
#include <iostream>
#include <string>
using json = nlohmann::json;

static const char *NO_ROUTE = "No route found between the specified points";

static json failure(int status, const std::string &msg) {
    return {{"success", false}, {"status", status}, {"error", msg}};
}

// Missing, empty and non-string ids all count as absent.
static std::string id_field(const json &query, const char *key) {
    if (!query.contains(key) || !query[key].is_string()) return "";
    return query[key].get<std::string>();
}

static std::string query_id(const json &query) {
    if (query.is_object() && query.contains("id")) return query["id"].dump();
    return "?";
}

static json service_info() {
    return {
        {"service", "Map Routing API"},
        {"description", "Shortest routes between map waypoints"},
        {"query_types", {"service", "points", "route", "test_route", "add_point", "add_connection"}}
    };
}

static json list_points(const Graph &g) {
    json points = json::array();
    for (const auto &w : g.listPoints()) points.push_back(waypointToJson(w));
    json result;
    result["success"] = true;
    result["count"] = points.size();
    result["points"] = points;
    return result;
}

static json compute_route(const Graph &g, const json &query) {
    std::string start = id_field(query, "startId");
    std::string end = id_field(query, "endId");
    if (start.empty() || end.empty())
        return failure(400, "Both startId and endId are required");

    RouteResult r = findShortestPath(g, start, end);
    if (!r.possible()) {
        json result = failure(404, NO_ROUTE);
        result["reason"] = statusName(r.status);
        return result;
    }

    json route = routeToJson(r);
    route["visualRepresentation"] = visualRepresentation(r);
    route["summary"] = routeSummary(r);
    return {{"success", true}, {"route", route}};
}

static json test_route(const Graph &g) {
    RouteResult r = findShortestPath(g, "A", "E");
    if (!r.possible())
        return {{"error", "Test route not found"}};

    json ids = json::array();
    json waypoints = json::array();
    for (const auto &w : r.path) {
        ids.push_back(w.id);
        waypoints.push_back({{"id", w.id}, {"coordinates", {{"lat", w.lat}, {"lng", w.lng}}}});
    }

    return {{"testRoute", {
        {"from", "A (" + seedLabel("A") + ")"},
        {"to", "E (" + seedLabel("E") + ")"},
        {"path", ids},
        {"distance", formatDistance(r.total_distance) + " km"},
        {"estimatedTime", std::to_string(r.estimated_time) + " minutes"},
        {"waypoints", waypoints}
    }}};
}

json processQuery(Graph &g, const json &query) {
    json result;
    try {
        std::string type = query.value("type", "");

        if (type == "service") {
            result = service_info();
        } else if (type == "points") {
            result = list_points(g);
        } else if (type == "route") {
            result = compute_route(g, query);
        } else if (type == "test_route") {
            result = test_route(g);
        } else if (type == "add_point") {
            bool ok = g.addPoint(query.at("pointId").get<std::string>(),
                                 query.at("lat").get<double>(), query.at("lng").get<double>());
            result["done"] = ok;
        } else if (type == "add_connection") {
            bool ok = g.addConnection(query.at("u").get<std::string>(), query.at("v").get<std::string>(),
                                      query.at("length").get<double>());
            result["done"] = ok;
        } else {
            result = failure(400, "Unknown query type: " + type);
        }

    } catch (const std::exception &e) {
        std::cerr << "Error processing query " << query_id(query) << ": " << e.what() << "\n";
        result = failure(500, "Internal server error");
        result["detail"] = e.what();
    }

    if (query.is_object() && query.contains("id")) result["id"] = query["id"];
    return result;
}
