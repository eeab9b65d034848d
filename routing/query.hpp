#pragma once
#include "graph.hpp"
#include "nlohmann/json.hpp"

// Answers one query event against g. Never throws: failures come back as
// {"success": false, "status": <code>, "error": ...}.
nlohmann::json processQuery(Graph &g, const nlohmann::json &query);
