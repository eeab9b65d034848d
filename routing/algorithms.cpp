#include "algorithms.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <queue>
#include <string>
#include <tuple>
#include <unordered_map>
#include <unordered_set>

RouteResult findShortestPath(const Graph &g, const std::string &start_id, const std::string &end_id) {
    auto snap = g.snapshot();
    return findShortestPath(*snap, start_id, end_id);
}

// --------------------------------------------------
// Dijkstra with lazy deletion: stale frontier entries are skipped, never
// decreased. Equal priorities pop in insertion order.
// --------------------------------------------------
RouteResult findShortestPath(const GraphData &g, const std::string &start_id, const std::string &end_id) {
    RouteResult res{RouteStatus::UnknownPoint, {}, 0.0, 0, {}, {}};

    const Waypoint *start = g.find(start_id);
    const Waypoint *end = g.find(end_id);
    if (!start || !end)
        return res;
    res.start_point = *start;
    res.end_point = *end;

    const double INF = std::numeric_limits<double>::infinity();
    std::unordered_map<std::string, double> dist;
    std::unordered_map<std::string, std::string> parent;
    std::unordered_set<std::string> settled;
    for (auto &[id, _] : g.nodes) dist[id] = INF;
    dist[start_id] = 0.0;

    // (priority, insertion sequence, waypoint)
    using P = std::tuple<double, size_t, std::string>;
    std::priority_queue<P, std::vector<P>, std::greater<P>> pq;
    size_t seq = 0;
    pq.push({0.0, seq++, start_id});

    while (!pq.empty()) {
        std::string u = std::get<2>(pq.top());
        pq.pop();
        if (settled.count(u)) continue;
        if (u == end_id) break;
        settled.insert(u);

        for (const auto &n : g.neighborsOf(u)) {
            if (settled.count(n.id)) continue;
            double cand = dist[u] + n.distance;
            if (cand < dist[n.id]) {
                dist[n.id] = cand;
                parent[n.id] = u;
                pq.push({cand, seq++, n.id});
            }
        }
    }

    if (start_id != end_id && !parent.count(end_id)) {
        res.status = RouteStatus::NotFound;
        return res;
    }

    // reconstruct path
    for (std::string cur = end_id;;) {
        res.path.push_back(*g.find(cur));
        if (cur == start_id) break;
        cur = parent.at(cur);
    }
    std::reverse(res.path.begin(), res.path.end());

    res.status = RouteStatus::Ok;
    res.total_distance = dist[end_id];
    res.estimated_time = estimateTravelMinutes(res.total_distance);
    return res;
}

long estimateTravelMinutes(double distance_km) {
    return std::lround((distance_km / AVERAGE_SPEED_KMH) * 60.0);
}

// printf rounds an exact tie (e.g. 0.125) to even; distances round half up,
// so ties are detected on the exact decimal expansion and bumped by hand.
std::string formatDistance(double distance_km) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", distance_km);
    if (!std::isfinite(distance_km)) return buf;

    // 1100 digits hold the full expansion of any double
    std::string exact(1500, '\0');
    int n = std::snprintf(&exact[0], exact.size(), "%.1100f", distance_km);
    if (n < 0 || n >= (int)exact.size()) return buf;
    exact.resize(n);

    size_t dot = exact.find('.');
    if (dot == std::string::npos || exact[dot + 3] != '5' ||
        exact.find_first_not_of('0', dot + 4) != std::string::npos)
        return buf;

    std::string out = exact.substr(0, dot + 3);
    int i = (int)out.size() - 1;
    for (; i >= 0; --i) {
        if (out[i] == '.') continue;
        if (out[i] == '-') break;
        if (out[i] != '9') { out[i]++; return out; }
        out[i] = '0';
    }
    out.insert(out.begin() + (i + 1), '1');
    return out;
}

const char *statusName(RouteStatus s) {
    switch (s) {
    case RouteStatus::Ok: return "ok";
    case RouteStatus::UnknownPoint: return "unknown_point";
    case RouteStatus::NotFound: return "no_path";
    }
    return "unknown";
}
