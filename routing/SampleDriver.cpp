#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include "nlohmann/json.hpp"
#include "graph.hpp"
#include "query.hpp"
#include "seed.hpp"

using json = nlohmann::json;

static bool read_json(const char *path, json &out) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "Failed to open " << path << std::endl;
        return false;
    }
    try {
        f >> out;
    } catch (const std::exception &e) {
        std::cerr << "Error parsing " << path << ": " << e.what() << std::endl;
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    if (argc != 3 && argc != 4) {
        std::cerr << "Usage: " << argv[0] << " [graph.json] <queries.json> <output.json>" << std::endl;
        return 1;
    }
    const char *queries_path = argv[argc - 2];
    const char *output_path = argv[argc - 1];

    Graph G;
    if (argc == 4) {
        json graph_json;
        if (!read_json(argv[1], graph_json)) return 1;
        try {
            G.loadFromJson(graph_json);
        } catch (const std::exception &e) {
            std::cerr << "Failed to load graph from " << argv[1] << ": " << e.what() << std::endl;
            return 1;
        }
    } else {
        loadSeedGraph(G);
    }
    std::cout << "Loaded graph with " << G.size() << " points and "
              << G.connectionCount() << " roads" << std::endl;

    json queries_json;
    if (!read_json(queries_path, queries_json)) return 1;
    if (!queries_json.is_object() || !queries_json.contains("events")) {
        std::cerr << "No events found in " << queries_path << std::endl;
        return 1;
    }

    json meta = queries_json.value("meta", json::object());
    std::vector<json> results;

    for (const auto& query : queries_json["events"]) {
        auto start_time = std::chrono::steady_clock::now();

        json result = processQuery(G, query);

        auto end_time = std::chrono::steady_clock::now();
        result["processing_time"] = std::chrono::duration<double, std::milli>(end_time - start_time).count();
        results.push_back(result);
    }
    std::cout << "Processed " << results.size() << " events" << std::endl;

    std::ofstream output_file(output_path);
    if (!output_file.is_open()) {
        std::cerr << "Failed to open " << output_path << " for writing" << std::endl;
        return 1;
    }

    json output;
    output["meta"] = meta;
    output["results"] = results;
    output_file << output.dump(4) << std::endl;

    output_file.close();
    std::cout << "Output written to " << output_path << std::endl;
    return 0;
}
