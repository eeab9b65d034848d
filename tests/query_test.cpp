#include "query.hpp"

#include <gtest/gtest.h>

#include "seed.hpp"

using json = nlohmann::json;

class QueryTest : public ::testing::Test {
protected:
    void SetUp() override { loadSeedGraph(g); }
    Graph g;
};

TEST_F(QueryTest, Points) {
    json r = processQuery(g, {{"id", 1}, {"type", "points"}});
    EXPECT_EQ(r["id"], 1);
    EXPECT_EQ(r["success"], true);
    EXPECT_EQ(r["count"], 5);
    ASSERT_EQ(r["points"].size(), 5u);
    EXPECT_EQ(r["points"][3], (json{{"id", "D"}, {"lat", 37.7749}, {"lng", -122.3994}}));
}

TEST_F(QueryTest, Route) {
    json r = processQuery(g, {{"id", "q"}, {"type", "route"}, {"startId", "A"}, {"endId", "E"}});
    EXPECT_EQ(r["id"], "q");
    ASSERT_EQ(r["success"], true);
    const json &route = r["route"];
    EXPECT_EQ(route["totalDistance"], "6.00");
    EXPECT_EQ(route["estimatedTime"], 9);
    EXPECT_EQ(route["path"].size(), 3u);
    EXPECT_EQ(route["summary"]["distance"], "6.00 km");
    EXPECT_EQ(route["summary"]["time"], "9 minutes");
    EXPECT_EQ(route["visualRepresentation"]["type"], "FeatureCollection");
    EXPECT_EQ(route["startPoint"]["id"], "A");
    EXPECT_EQ(route["endPoint"]["id"], "E");
}

TEST_F(QueryTest, RouteNeedsBothIds) {
    json missing = processQuery(g, {{"type", "route"}, {"startId", "A"}});
    EXPECT_EQ(missing["success"], false);
    EXPECT_EQ(missing["status"], 400);
    EXPECT_EQ(missing["error"], "Both startId and endId are required");

    json empty = processQuery(g, {{"type", "route"}, {"startId", ""}, {"endId", "B"}});
    EXPECT_EQ(empty["status"], 400);
}

TEST_F(QueryTest, NonStringIdsCountAsMissing) {
    json zero = processQuery(g, {{"type", "route"}, {"startId", 0}, {"endId", "B"}});
    EXPECT_EQ(zero["status"], 400);
    EXPECT_EQ(zero["error"], "Both startId and endId are required");

    json no = processQuery(g, {{"type", "route"}, {"startId", "A"}, {"endId", false}});
    EXPECT_EQ(no["status"], 400);

    json null_id = processQuery(g, {{"type", "route"}, {"startId", nullptr}, {"endId", "B"}});
    EXPECT_EQ(null_id["status"], 400);

    g.addPoint("7", 0.0, 0.0);
    json number = processQuery(g, {{"type", "route"}, {"startId", 7}, {"endId", "7"}});
    EXPECT_EQ(number["status"], 400);
}

TEST_F(QueryTest, UnknownPointAndNoPathAreNotFound) {
    json unknown = processQuery(g, {{"type", "route"}, {"startId", "A"}, {"endId", "Z"}});
    EXPECT_EQ(unknown["success"], false);
    EXPECT_EQ(unknown["status"], 404);
    EXPECT_EQ(unknown["error"], "No route found between the specified points");
    EXPECT_EQ(unknown["reason"], "unknown_point");

    g.addPoint("F", 37.8, -122.5);
    json nopath = processQuery(g, {{"type", "route"}, {"startId", "F"}, {"endId", "A"}});
    EXPECT_EQ(nopath["status"], 404);
    EXPECT_EQ(nopath["reason"], "no_path");
}

TEST_F(QueryTest, TestRoute) {
    json r = processQuery(g, {{"type", "test_route"}});
    const json &t = r["testRoute"];
    EXPECT_EQ(t["from"], "A (Downtown)");
    EXPECT_EQ(t["to"], "E (West Area)");
    EXPECT_EQ(t["path"], (json{"A", "B", "E"}));
    EXPECT_EQ(t["distance"], "6.00 km");
    EXPECT_EQ(t["estimatedTime"], "9 minutes");
    ASSERT_EQ(t["waypoints"].size(), 3u);
    EXPECT_EQ(t["waypoints"][1]["id"], "B");
    EXPECT_DOUBLE_EQ(t["waypoints"][1]["coordinates"]["lat"].get<double>(), 37.7849);
}

TEST_F(QueryTest, TestRouteOnEmptyGraph) {
    Graph empty;
    json r = processQuery(empty, {{"type", "test_route"}});
    EXPECT_EQ(r["error"], "Test route not found");
}

TEST_F(QueryTest, MutationsThenRoute) {
    json add = processQuery(g, {{"type", "add_point"}, {"pointId", "F"}, {"lat", 37.8}, {"lng", -122.43}});
    EXPECT_EQ(add["done"], true);
    json again = processQuery(g, {{"type", "add_point"}, {"pointId", "F"}, {"lat", 0.0}, {"lng", 0.0}});
    EXPECT_EQ(again["done"], false);

    json bad = processQuery(g, {{"type", "add_connection"}, {"u", "F"}, {"v", "Q"}, {"length", 1.0}});
    EXPECT_EQ(bad["done"], false);
    json road = processQuery(g, {{"type", "add_connection"}, {"u", "E"}, {"v", "F"}, {"length", 1.7}});
    EXPECT_EQ(road["done"], true);

    json r = processQuery(g, {{"type", "route"}, {"startId", "A"}, {"endId", "F"}});
    ASSERT_EQ(r["success"], true);
    EXPECT_EQ(r["route"]["totalDistance"], "7.70");
    EXPECT_EQ(r["route"]["estimatedTime"], 12);
}

TEST_F(QueryTest, MalformedQueryIsInternalError) {
    json r = processQuery(g, {{"id", 7}, {"type", "add_point"}, {"pointId", "G"}});
    EXPECT_EQ(r["id"], 7);
    EXPECT_EQ(r["success"], false);
    EXPECT_EQ(r["status"], 500);
    EXPECT_EQ(r["error"], "Internal server error");
    EXPECT_FALSE(g.contains("G"));
}

TEST_F(QueryTest, UnknownType) {
    json r = processQuery(g, {{"type", "teleport"}});
    EXPECT_EQ(r["status"], 400);
    EXPECT_EQ(r["error"], "Unknown query type: teleport");
}

TEST_F(QueryTest, Service) {
    json r = processQuery(g, {{"type", "service"}});
    EXPECT_EQ(r["service"], "Map Routing API");
    EXPECT_TRUE(r["query_types"].is_array());
}
